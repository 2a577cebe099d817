#pragma once

#include <cstddef>
#include <micrograd/autograd/autograd.hpp>
#include <micrograd/core/error/error.hpp>
#include <micrograd/core/macros.hpp>
#include <micrograd/nn/mlp.hpp>
#include <vector>

namespace micrograd::nn {

/**
 * @brief Differentiable loss together with the batch accuracy
 */
template <autograd::AccessPolicy Policy>
struct LossResult {
    autograd::BasicValue<Policy> loss;
    float accuracy;
};

/**
 * @brief SVM max-margin loss with L2 regularization
 *
 * @details loss = mean_i relu(1 - y_i * pred_i) + alpha * sum_p p^2 over the
 * model's parameters. A prediction counts as correct when its sign matches
 * the label's.
 *
 * @param model Network whose parameters are regularized
 * @param preds One prediction per example
 * @param labels One label in {-1, 1} per example
 * @param alpha Regularization strength
 * @throws InvalidArgument on an empty batch or mismatched sizes
 */
template <autograd::AccessPolicy Policy>
MICROGRAD_NODISCARD LossResult<Policy> max_margin_loss(
    const BasicMLP<Policy>& model,
    const std::vector<autograd::BasicValue<Policy>>& preds,
    const std::vector<float>& labels, float alpha = 1e-4f) {
    using Value = autograd::BasicValue<Policy>;

    MICROGRAD_THROW_IF(preds.empty(), InvalidArgument,
                       "Loss needs at least one prediction");
    MICROGRAD_THROW_IF(preds.size() != labels.size(), InvalidArgument,
                       "Got {} predictions but {} labels", preds.size(),
                       labels.size());

    const auto n = preds.size();

    Value data_loss = (1.0f - labels[0] * preds[0]).relu();
    for (std::size_t i = 1; i < n; ++i)
        data_loss = data_loss + (1.0f - labels[i] * preds[i]).relu();
    data_loss = data_loss * (1.0f / static_cast<float>(n));

    const auto params = model.parameters();
    Value reg_loss = params.front() * params.front();
    for (std::size_t i = 1; i < params.size(); ++i)
        reg_loss = reg_loss + params[i] * params[i];

    std::size_t correct = 0;
    for (std::size_t i = 0; i < n; ++i) {
        if ((labels[i] > 0.0f) == (preds[i].value() > 0.0f))
            ++correct;
    }

    return LossResult<Policy>{data_loss + alpha * reg_loss,
                              static_cast<float>(correct) /
                                  static_cast<float>(n)};
}

}  // namespace micrograd::nn
