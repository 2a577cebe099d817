#pragma once

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstddef>
#include <micrograd/autograd/autograd.hpp>
#include <micrograd/core/error/error.hpp>
#include <micrograd/core/macros.hpp>
#include <micrograd/parallel/parallel_for.hpp>
#include <random>
#include <vector>

namespace micrograd::nn {

/**
 * @brief Single unit computing bias + sum(w_i * x_i), optionally rectified
 *
 * @tparam Policy Access policy of the parameters
 */
template <autograd::AccessPolicy Policy>
class BasicNeuron {
public:
    using value_type = autograd::BasicValue<Policy>;

    /**
     * @brief Creates a neuron with weights drawn uniformly from [-1, 1] and
     * a zero bias
     *
     * @param in_dim Number of inputs
     * @param nonlinear Whether the output goes through ReLU
     * @param rng Random source for the weights
     */
    BasicNeuron(std::size_t in_dim, bool nonlinear, std::mt19937& rng)
        : m_bias(0.0f), m_nonlinear(nonlinear) {
        MICROGRAD_THROW_IF(in_dim == 0, InvalidArgument,
                           "Neuron needs at least one input");

        std::uniform_real_distribution<float> uniform(-1.0f, 1.0f);
        m_weights.reserve(in_dim);
        for (std::size_t i = 0; i < in_dim; ++i)
            m_weights.emplace_back(uniform(rng));
    }

    MICROGRAD_NODISCARD value_type
    forward(const std::vector<value_type>& x) const {
        MICROGRAD_THROW_IF(x.size() != m_weights.size(), InvalidArgument,
                           "Neuron expects {} inputs, got {}",
                           m_weights.size(), x.size());

        value_type act = m_bias;
        for (std::size_t i = 0; i < x.size(); ++i)
            act = act + m_weights[i] * x[i];

        return m_nonlinear ? act.relu() : act;
    }

    /// @brief Weights followed by the bias
    MICROGRAD_NODISCARD std::vector<value_type> parameters() const {
        std::vector<value_type> params(m_weights);
        params.push_back(m_bias);
        return params;
    }

    MICROGRAD_NODISCARD std::size_t in_dim() const noexcept {
        return m_weights.size();
    }
    MICROGRAD_NODISCARD bool nonlinear() const noexcept { return m_nonlinear; }

private:
    std::vector<value_type> m_weights;
    value_type m_bias;
    bool m_nonlinear;
};

/**
 * @brief Fully connected layer of independent neurons
 */
template <autograd::AccessPolicy Policy>
class BasicLayer {
public:
    using value_type = autograd::BasicValue<Policy>;
    using neuron_type = BasicNeuron<Policy>;

    BasicLayer(std::size_t in_dim, std::size_t out_dim, bool nonlinear,
               std::mt19937& rng) {
        MICROGRAD_THROW_IF(out_dim == 0, InvalidArgument,
                           "Layer needs at least one neuron");

        m_neurons.reserve(out_dim);
        for (std::size_t i = 0; i < out_dim; ++i)
            m_neurons.emplace_back(in_dim, nonlinear, rng);
    }

    MICROGRAD_NODISCARD std::vector<value_type> forward(
        const std::vector<value_type>& x) const {
        std::vector<value_type> out;
        out.reserve(m_neurons.size());

        for (const auto& neuron : m_neurons)
            out.push_back(neuron.forward(x));

        return out;
    }

    MICROGRAD_NODISCARD std::vector<value_type> parameters() const {
        std::vector<value_type> params;
        for (const auto& neuron : m_neurons) {
            auto neuron_params = neuron.parameters();
            params.insert(params.end(), neuron_params.begin(),
                          neuron_params.end());
        }

        return params;
    }

    MICROGRAD_NODISCARD const std::vector<neuron_type>& neurons()
        const noexcept {
        return m_neurons;
    }

private:
    std::vector<neuron_type> m_neurons;
};

/**
 * @brief Multilayer perceptron
 *
 * @details Layer i maps dims[i] inputs to dims[i + 1] outputs. Every layer
 * but the last is rectified.
 *
 * @tparam Policy Access policy of the parameters
 */
template <autograd::AccessPolicy Policy>
class BasicMLP {
public:
    using value_type = autograd::BasicValue<Policy>;
    using layer_type = BasicLayer<Policy>;

    /**
     * @brief Creates the network
     *
     * @param dims Input size followed by the size of every layer
     * @param rng Random source for the weights
     * @throws InvalidArgument if fewer than two sizes are given or one is 0
     */
    BasicMLP(const std::vector<std::size_t>& dims, std::mt19937& rng) {
        MICROGRAD_THROW_IF(dims.size() < 2, InvalidArgument,
                           "MLP needs an input size and at least one layer, "
                           "got {} sizes",
                           dims.size());

        const std::size_t n_layers = dims.size() - 1;
        m_layers.reserve(n_layers);
        for (std::size_t i = 0; i < n_layers; ++i) {
            MICROGRAD_THROW_IF(dims[i] == 0 || dims[i + 1] == 0,
                               InvalidArgument,
                               "MLP layer {} has a zero dimension ({} -> {})",
                               i, dims[i], dims[i + 1]);
            m_layers.emplace_back(dims[i], dims[i + 1], i + 1 != n_layers,
                                  rng);
        }
    }

    MICROGRAD_NODISCARD std::vector<value_type> forward(
        std::vector<value_type> x) const {
        for (const auto& layer : m_layers)
            x = layer.forward(x);

        return x;
    }

    /// @brief Wraps @p x in fresh leaves and runs forward()
    MICROGRAD_NODISCARD std::vector<value_type> forward(
        const std::vector<float>& x) const {
        std::vector<value_type> inputs;
        inputs.reserve(x.size());
        for (float xi : x)
            inputs.emplace_back(xi);

        return forward(std::move(inputs));
    }

    MICROGRAD_NODISCARD std::vector<value_type> parameters() const {
        std::vector<value_type> params;
        for (const auto& layer : m_layers) {
            auto layer_params = layer.parameters();
            params.insert(params.end(), layer_params.begin(),
                          layer_params.end());
        }

        return params;
    }

    void zero_grad() const {
        for (auto& param : parameters())
            param.zero_grad();
    }

    /**
     * @brief Gradient-descent step on every parameter
     *
     * @param learning_rate Step size
     */
    void step(float learning_rate) const {
        for (auto& param : parameters())
            param.apply_gradient_step(learning_rate);
    }

    MICROGRAD_NODISCARD const std::vector<layer_type>& layers()
        const noexcept {
        return m_layers;
    }

private:
    std::vector<layer_type> m_layers;
};

/**
 * @brief One forward pass per example
 *
 * @details Passes run in parallel when the policy is thread safe and
 * serially otherwise. Each pass builds its own subgraph; the model's
 * parameters are shared leaves and are only read.
 *
 * @param model Network to evaluate
 * @param inputs One input vector per example
 * @param config Parallelization options
 * @return Outputs in the order of @p inputs
 */
template <autograd::AccessPolicy Policy>
MICROGRAD_NODISCARD std::vector<std::vector<autograd::BasicValue<Policy>>>
forward_batch(const BasicMLP<Policy>& model,
              const std::vector<std::vector<float>>& inputs,
              const parallel::ParallelConfig& config =
                  parallel::default_parallel_config()) {
    std::vector<std::vector<autograd::BasicValue<Policy>>> outputs(
        inputs.size());

    if constexpr (Policy::thread_safe) {
        parallel::parallel_for(
            std::size_t{0}, inputs.size(),
            [&](std::size_t i) { outputs[i] = model.forward(inputs[i]); },
            config);
    } else {
        for (std::size_t i = 0; i < inputs.size(); ++i)
            outputs[i] = model.forward(inputs[i]);
    }

    return outputs;
}

using Neuron = BasicNeuron<autograd::DefaultPolicy>;
using Layer = BasicLayer<autograd::DefaultPolicy>;
using MLP = BasicMLP<autograd::DefaultPolicy>;

}  // namespace micrograd::nn

template <micrograd::autograd::AccessPolicy Policy>
struct fmt::formatter<micrograd::nn::BasicNeuron<Policy>> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const micrograd::nn::BasicNeuron<Policy>& neuron,
                FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}Neuron({})",
                              neuron.nonlinear() ? "ReLU" : "Linear",
                              neuron.in_dim());
    }
};

template <micrograd::autograd::AccessPolicy Policy>
struct fmt::formatter<micrograd::nn::BasicLayer<Policy>> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const micrograd::nn::BasicLayer<Policy>& layer,
                FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "Layer of [{}]",
                              fmt::join(layer.neurons(), ", "));
    }
};

template <micrograd::autograd::AccessPolicy Policy>
struct fmt::formatter<micrograd::nn::BasicMLP<Policy>> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const micrograd::nn::BasicMLP<Policy>& mlp,
                FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "MLP of [{}]",
                              fmt::join(mlp.layers(), ", "));
    }
};
