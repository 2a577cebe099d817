#pragma once

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <micrograd/autograd/builder.hpp>
#include <micrograd/autograd/graph.hpp>
#include <micrograd/autograd/node.hpp>
#include <micrograd/autograd/op_type.hpp>
#include <micrograd/autograd/policy.hpp>
#include <micrograd/core/error/error.hpp>
#include <micrograd/core/macros.hpp>
#include <utility>
#include <vector>

namespace micrograd::autograd {

/**
 * @brief Differentiable scalar
 *
 * Shared handle to a graph node. Copies refer to the same node, so a value
 * used in several expressions accumulates gradient from all of them.
 * Arithmetic on values records the computation graph; backward() then fills
 * in the gradient of every value that took part in it.
 *
 * @tparam Policy Access discipline of the underlying nodes
 */
template <AccessPolicy Policy>
class BasicValue {
public:
    using policy_type = Policy;
    using node_type = Node<Policy>;
    using NodePtr = std::shared_ptr<node_type>;

    /**
     * @brief Creates a leaf
     *
     * @param value Scalar value
     */
    MICROGRAD_NODISCARD static BasicValue from_scalar(float value) {
        return BasicValue(detail::GraphBuilder<Policy>::leaf(value));
    }

    explicit BasicValue(float value)
        : m_node(detail::GraphBuilder<Policy>::leaf(value)) {}

    /**
     * @brief Wraps an existing node
     *
     * @param node Node to share, must not be null
     */
    explicit BasicValue(NodePtr node) : m_node(std::move(node)) {
        MICROGRAD_ENSURE(m_node != nullptr, "Value requires a node");
    }

    /// @brief Another handle to the same node
    MICROGRAD_NODISCARD BasicValue clone() const { return *this; }

    // Accessors
    MICROGRAD_NODISCARD float value() const { return m_node->value(); }
    MICROGRAD_NODISCARD float grad() const { return m_node->grad(); }
    MICROGRAD_NODISCARD OpType op() const { return m_node->op(); }
    MICROGRAD_NODISCARD std::uint64_t id() const noexcept {
        return m_node->id();
    }
    MICROGRAD_NODISCARD bool is_leaf() const noexcept {
        return m_node->is_leaf();
    }

    MICROGRAD_NODISCARD const node_type& node() const noexcept {
        return *m_node;
    }
    MICROGRAD_NODISCARD const NodePtr& node_ptr() const noexcept {
        return m_node;
    }

    /// @brief Moves the node out, leaving this handle empty
    MICROGRAD_NODISCARD NodePtr release_node() && noexcept {
        return std::move(m_node);
    }

    /// @brief Handles to the operands this value was computed from
    MICROGRAD_NODISCARD std::vector<BasicValue> parents() const {
        std::vector<BasicValue> result;
        result.reserve(m_node->parents().size());

        for (const auto& parent : m_node->parents())
            result.emplace_back(parent);

        return result;
    }

    // Methods
    void zero_grad() { m_node->zero_grad(); }

    /**
     * @brief Gradient-descent update, value -= learning_rate * grad
     *
     * @param learning_rate Step size
     */
    void apply_gradient_step(float learning_rate) {
        m_node->apply_gradient_step(learning_rate);
    }

    /**
     * @brief Computes the gradient of this value with respect to every value
     * it depends on
     */
    void backward() const { run_backward(m_node); }

    /**
     * @brief Raises to a constant power
     *
     * @param exponent Exponent, not differentiated
     */
    MICROGRAD_NODISCARD BasicValue pow(float exponent) const {
        return BasicValue(detail::GraphBuilder<Policy>::pow(m_node, exponent));
    }

    /// @brief max(0, x)
    MICROGRAD_NODISCARD BasicValue relu() const {
        return BasicValue(detail::GraphBuilder<Policy>::relu(m_node));
    }

    // Identity comparison
    friend bool operator==(const BasicValue& lhs,
                           const BasicValue& rhs) noexcept {
        return lhs.id() == rhs.id();
    }

private:
    NodePtr m_node;
};

/**
 * @brief Every value reachable from @p root, parents before dependents
 *
 * @param root Terminal value
 * @return Values in topological order, @p root last
 */
template <AccessPolicy Policy>
MICROGRAD_NODISCARD std::vector<BasicValue<Policy>> topological_order(
    const BasicValue<Policy>& root) {
    auto nodes = topological_sort(root.node_ptr());

    std::vector<BasicValue<Policy>> order;
    order.reserve(nodes.size());
    for (auto& node : nodes)
        order.emplace_back(std::move(node));

    return order;
}

}  // namespace micrograd::autograd

namespace std {
template <micrograd::autograd::AccessPolicy Policy>
struct hash<micrograd::autograd::BasicValue<Policy>> {
    MICROGRAD_NODISCARD size_t operator()(
        const micrograd::autograd::BasicValue<Policy>& value) const noexcept {
        return std::hash<std::uint64_t>()(value.id());
    }
};
}  // namespace std

template <micrograd::autograd::AccessPolicy Policy>
struct fmt::formatter<micrograd::autograd::BasicValue<Policy>>
    : fmt::formatter<micrograd::autograd::Node<Policy>> {
    template <typename FormatContext>
    auto format(const micrograd::autograd::BasicValue<Policy>& value,
                FormatContext& ctx) const {
        return fmt::formatter<micrograd::autograd::Node<Policy>>::format(
            value.node(), ctx);
    }
};
