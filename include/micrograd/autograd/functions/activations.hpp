#pragma once

#include <micrograd/autograd/policy.hpp>
#include <micrograd/autograd/value.hpp>
#include <micrograd/core/macros.hpp>

namespace micrograd::autograd::functions {
/**
 * @brief Rectified linear unit
 *
 * @details Forward is max(0, x) with NaN passed through. The gradient is
 * forwarded only where the output is strictly positive, so relu'(0) = 0.
 *
 * @param input Value to rectify
 * @return relu(input)
 */
template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> relu(const BasicValue<Policy>& input) {
    return input.relu();
}
}  // namespace micrograd::autograd::functions
