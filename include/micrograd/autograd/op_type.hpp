#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string_view>

namespace micrograd::autograd {

/**
 * @brief Enumeration of operation types for graph nodes
 *
 * Records which operation produced a node. The tag is informational and
 * used for diagnostics only; the backward pass dispatches on the node's
 * backward rule instead.
 */
enum class OpType : std::uint8_t {
    Leaf,      ///< Created directly from a scalar
    Add,       ///< Addition
    Subtract,  ///< Subtraction, composed as a + (-b)
    Multiply,  ///< Multiplication
    Negate,    ///< Negation, composed as a * -1
    Divide,    ///< Division, composed as a * b^-1
    Pow,       ///< Power with a constant exponent
    ReLU       ///< Rectified linear unit
};

constexpr std::string_view to_string(OpType op) noexcept {
    switch (op) {
        case OpType::Leaf:
            return "Leaf";
        case OpType::Add:
            return "Add";
        case OpType::Subtract:
            return "Subtract";
        case OpType::Multiply:
            return "Multiply";
        case OpType::Negate:
            return "Negate";
        case OpType::Divide:
            return "Divide";
        case OpType::Pow:
            return "Pow";
        case OpType::ReLU:
            return "ReLU";
    }

    return "Unknown";
}

}  // namespace micrograd::autograd

template <>
struct fmt::formatter<micrograd::autograd::OpType>
    : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(micrograd::autograd::OpType op, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(
            micrograd::autograd::to_string(op), ctx);
    }
};
