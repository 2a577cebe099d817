#pragma once

#include <micrograd/autograd/functions/activations.hpp>
#include <micrograd/autograd/functions/basic_ops.hpp>
#include <micrograd/autograd/graph.hpp>
#include <micrograd/autograd/node.hpp>
#include <micrograd/autograd/op_type.hpp>
#include <micrograd/autograd/policy.hpp>
#include <micrograd/autograd/value.hpp>

namespace micrograd::autograd {

/**
 * @brief Scalar value under the build's default access policy
 *
 * MultiThreaded when configured with MICROGRAD_THREAD_SAFE, SingleThreaded
 * otherwise.
 */
using Value = BasicValue<DefaultPolicy>;

}  // namespace micrograd::autograd
