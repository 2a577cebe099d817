#pragma once

#include <micrograd/autograd/autograd.hpp>
#include <micrograd/core/error/error.hpp>
#include <micrograd/core/macros.hpp>
#include <micrograd/data/moons.hpp>
#include <micrograd/nn/loss.hpp>
#include <micrograd/nn/mlp.hpp>
#include <micrograd/parallel/parallel_for.hpp>
#include <micrograd/utils/logger/logger.hpp>

namespace micrograd {
using autograd::Value;
}  // namespace micrograd
