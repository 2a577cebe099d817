#pragma once

#include <cstddef>
#include <micrograd/core/error/error.hpp>
#include <micrograd/core/macros.hpp>
#include <random>
#include <utility>
#include <vector>

namespace micrograd::data {

/**
 * @brief Two-feature binary classification set, one column per feature
 */
struct MICROGRAD_API Moons {
    std::vector<float> x1;
    std::vector<float> x2;
    std::vector<float> labels;

    MICROGRAD_NODISCARD std::size_t size() const noexcept {
        return labels.size();
    }

    /// @brief One {x1, x2} row per sample
    MICROGRAD_NODISCARD std::vector<std::vector<float>> rows() const;
};

/**
 * @brief @p n evenly spaced points from @p lo to @p hi, both included
 *
 * @details n = 0 gives an empty vector and n = 1 gives {lo}.
 */
MICROGRAD_NODISCARD MICROGRAD_API std::vector<float> linspace(float lo,
                                                              float hi,
                                                              std::size_t n);

/**
 * @brief Two interleaving half circles
 *
 * @details @p n_samples points per moon, parameterized over
 * linspace(0, pi, n_samples). The outer moon (cos t, sin t) is labelled 0,
 * the inner moon (1 - cos t, 0.5 - sin t) is labelled 1. Noise, when
 * positive, is Gaussian with that standard deviation on both coordinates.
 *
 * @param n_samples Points per moon
 * @param shuffle Whether to shuffle the samples
 * @param noise Noise standard deviation, 0 for none
 * @param rng Random source for shuffling and noise
 * @throws InvalidArgument if @p noise is negative
 */
MICROGRAD_NODISCARD MICROGRAD_API Moons make_moons(std::size_t n_samples,
                                                   bool shuffle, float noise,
                                                   std::mt19937& rng);

/**
 * @brief Maps {0, 1} labels to {-1, 1}
 */
MICROGRAD_NODISCARD MICROGRAD_API std::vector<float> to_signed_labels(
    const std::vector<float>& labels);

/**
 * @brief Applies one random permutation to every column
 *
 * @param rng Random source
 * @param first First column
 * @param rest Other columns, same length as @p first
 * @throws InvalidArgument if the columns differ in length
 */
template <typename T, typename... Columns>
void shuffle_together(std::mt19937& rng, std::vector<T>& first,
                      Columns&... rest) {
    const std::size_t len = first.size();
    MICROGRAD_THROW_IF(((rest.size() != len) || ...), InvalidArgument,
                       "Cannot shuffle columns of different lengths");

    for (std::size_t i = 0; i + 1 < len; ++i) {
        std::uniform_int_distribution<std::size_t> pick(i, len - 1);
        const std::size_t next = pick(rng);

        std::swap(first[i], first[next]);
        (std::swap(rest[i], rest[next]), ...);
    }
}

}  // namespace micrograd::data
