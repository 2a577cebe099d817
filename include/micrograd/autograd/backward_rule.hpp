#pragma once

#include <boost/container/static_vector.hpp>
#include <cmath>
#include <cstdint>
#include <micrograd/core/macros.hpp>
#include <variant>

namespace micrograd::autograd {

namespace rules {
/// @brief Index of an operand in its node's parent set
using Slot = std::uint8_t;

/// @brief d(a+b)/da = d(a+b)/db = 1
struct Add {
    Slot lhs;
    Slot rhs;
};

/// @brief d(a*b)/da = b, d(a*b)/db = a, using forward-pass values
struct Multiply {
    Slot lhs;
    Slot rhs;
    float lhs_value;
    float rhs_value;
};

/// @brief d(x^p)/dx = p * x^(p-1); the exponent is a constant
struct Pow {
    Slot base;
    float base_value;
    float exponent;
};

/// @brief Passes the gradient through only where the output is positive
struct ReLU {
    Slot input;
};
}  // namespace rules

/**
 * @brief How a node pushes its gradient onto its parents
 *
 * @details Every non-leaf node holds exactly one rule, consumed by the
 * backward executor the single time it runs.
 */
using BackwardRule =
    std::variant<rules::Add, rules::Multiply, rules::Pow, rules::ReLU>;

/// @brief Gradient to add to one parent
struct GradientContribution {
    rules::Slot slot;
    float delta;
};

using Contributions = boost::container::static_vector<GradientContribution, 2>;

/**
 * @brief Computes the chain-rule contributions of a rule
 *
 * @details A parent that appears as both operands (x*x) receives two
 * contributions with the same slot.
 *
 * @param rule Rule of the node being processed
 * @param out_value Forward value of that node
 * @param out_grad Accumulated gradient of that node
 * @return One contribution per operand
 */
MICROGRAD_NODISCARD inline Contributions local_gradients(
    const BackwardRule& rule, float out_value, float out_grad) {
    struct Visitor {
        float out_value;
        float out_grad;

        Contributions operator()(const rules::Add& r) const {
            return Contributions{GradientContribution{r.lhs, out_grad},
                                 GradientContribution{r.rhs, out_grad}};
        }

        Contributions operator()(const rules::Multiply& r) const {
            return Contributions{
                GradientContribution{r.lhs, r.rhs_value * out_grad},
                GradientContribution{r.rhs, r.lhs_value * out_grad}};
        }

        Contributions operator()(const rules::Pow& r) const {
            return Contributions{GradientContribution{
                r.base, r.exponent * std::pow(r.base_value, r.exponent - 1.0f) *
                            out_grad}};
        }

        Contributions operator()(const rules::ReLU& r) const {
            return Contributions{
                GradientContribution{r.input, out_value > 0.0f ? out_grad : 0.0f}};
        }
    };

    return std::visit(Visitor{out_value, out_grad}, rule);
}

}  // namespace micrograd::autograd
