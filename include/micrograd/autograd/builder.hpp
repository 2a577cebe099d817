#pragma once

#include <cmath>
#include <memory>
#include <micrograd/autograd/backward_rule.hpp>
#include <micrograd/autograd/node.hpp>
#include <micrograd/autograd/op_type.hpp>
#include <micrograd/autograd/policy.hpp>
#include <micrograd/core/macros.hpp>
#include <utility>

namespace micrograd::autograd::detail {
/**
 * @brief Node-level constructors for the four primitive operations
 *
 * @details Each reads its operands under their own locks, one at a time,
 * then builds the result node with its parent set and rule. Every other
 * operation is composed from these.
 */
template <AccessPolicy Policy>
struct GraphBuilder {
    using NodeType = Node<Policy>;
    using NodePtr = std::shared_ptr<NodeType>;
    using Parents = typename NodeType::Parents;

    struct BinaryOperands {
        Parents parents;
        rules::Slot lhs;
        rules::Slot rhs;
    };

    // The same node on both sides collapses to a single parent
    static BinaryOperands binary_operands(NodePtr lhs, NodePtr rhs) {
        if (lhs->id() == rhs->id())
            return {Parents{std::move(lhs)}, 0, 0};

        return {Parents{std::move(lhs), std::move(rhs)}, 0, 1};
    }

    static NodePtr leaf(float value) {
        return std::make_shared<NodeType>(value);
    }

    static NodePtr add(NodePtr lhs, NodePtr rhs) {
        const float a = lhs->value();
        const float b = rhs->value();

        auto operands = binary_operands(std::move(lhs), std::move(rhs));
        return std::make_shared<NodeType>(
            a + b, OpType::Add, std::move(operands.parents),
            rules::Add{operands.lhs, operands.rhs});
    }

    static NodePtr multiply(NodePtr lhs, NodePtr rhs) {
        const float a = lhs->value();
        const float b = rhs->value();

        auto operands = binary_operands(std::move(lhs), std::move(rhs));
        return std::make_shared<NodeType>(
            a * b, OpType::Multiply, std::move(operands.parents),
            rules::Multiply{operands.lhs, operands.rhs, a, b});
    }

    static NodePtr pow(NodePtr base, float exponent) {
        const float x = base->value();

        return std::make_shared<NodeType>(std::pow(x, exponent), OpType::Pow,
                                          Parents{std::move(base)},
                                          rules::Pow{0, x, exponent});
    }

    static NodePtr relu(NodePtr input) {
        const float x = input->value();

        return std::make_shared<NodeType>(x < 0.0f ? 0.0f : x, OpType::ReLU,
                                          Parents{std::move(input)},
                                          rules::ReLU{0});
    }

    // Composite results keep the primitive's node but carry their own tag
    static NodePtr relabel(NodePtr node, OpType op) {
        node->set_op(op);
        return node;
    }
};
}  // namespace micrograd::autograd::detail
