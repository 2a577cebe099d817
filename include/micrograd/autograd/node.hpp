#pragma once

#include <fmt/format.h>

#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <iterator>
#include <memory>
#include <micrograd/autograd/backward_rule.hpp>
#include <micrograd/autograd/op_type.hpp>
#include <micrograd/autograd/policy.hpp>
#include <micrograd/core/error/error.hpp>
#include <micrograd/core/macros.hpp>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace micrograd::autograd {

namespace detail {
/// @brief Mints a process-unique node id
MICROGRAD_API std::uint64_t next_node_id() noexcept;

template <AccessPolicy Policy>
struct GraphBuilder;

template <AccessPolicy Policy>
struct BackwardExecutor;
}  // namespace detail

/**
 * @brief Node in the computation graph that holds a scalar, its gradient
 * and the rule that propagates that gradient to the node's parents
 *
 * @details The id and the parent set are fixed at construction and read
 * without locking. Value, gradient, op tag and rule are mutable and only
 * touched under the policy's mutex, one short window at a time. Outside the
 * graph builder and the backward pass the only mutations are zero_grad()
 * and apply_gradient_step().
 *
 * @tparam Policy Access discipline (SingleThreaded or MultiThreaded)
 */
template <AccessPolicy Policy>
class Node {
public:
    using NodePtr = std::shared_ptr<Node>;
    using Parents = boost::container::small_vector<NodePtr, 2>;
    using mutex_type = typename Policy::mutex_type;

    /// @brief Rule taken out of a node together with the values it needs
    struct PendingBackward {
        BackwardRule rule;
        float value;
        float grad;
    };

    /// @brief Consistent copy of the mutable state
    struct Snapshot {
        float value;
        float grad;
        OpType op;
    };

    /**
     * @brief Construct a leaf node
     * @param value Scalar value
     */
    explicit Node(float value)
        : m_id(detail::next_node_id()), m_value(value), m_op(OpType::Leaf) {}

    /**
     * @brief Construct an interior node
     *
     * @param value Forward-pass result
     * @param op Operation that produced it
     * @param parents Deduplicated operands
     * @param rule Backward rule addressing @p parents by slot
     */
    Node(float value, OpType op, Parents parents, BackwardRule rule)
        : m_id(detail::next_node_id()),
          m_value(value),
          m_op(op),
          m_parents(std::move(parents)),
          m_backward(std::move(rule)) {
        MICROGRAD_ENSURE(!m_parents.empty(),
                         "Interior node of type {} needs at least one parent",
                         op);
    }

    /**
     * @brief Releases parent chains iteratively
     *
     * @details A chain of N nodes would otherwise be freed through N nested
     * destructor calls.
     */
    ~Node() {
        if (m_parents.empty())
            return;

        std::vector<NodePtr> pending(std::make_move_iterator(m_parents.begin()),
                                     std::make_move_iterator(m_parents.end()));
        m_parents.clear();

        while (!pending.empty()) {
            NodePtr node = std::move(pending.back());
            pending.pop_back();

            if (node.use_count() == 1) {
                for (auto& parent : node->m_parents)
                    pending.push_back(std::move(parent));

                node->m_parents.clear();
            }
        }
    }

    MICROGRAD_UNCOPYABLE(Node);
    MICROGRAD_IMMOVABLE(Node);

    // Immutable state
    MICROGRAD_NODISCARD std::uint64_t id() const noexcept { return m_id; }
    MICROGRAD_NODISCARD const Parents& parents() const noexcept {
        return m_parents;
    }
    MICROGRAD_NODISCARD bool is_leaf() const noexcept {
        return m_parents.empty();
    }

    // Guarded state
    MICROGRAD_NODISCARD float value() const {
        std::lock_guard lock(m_mutex);
        return m_value;
    }

    MICROGRAD_NODISCARD float grad() const {
        std::lock_guard lock(m_mutex);
        return m_grad;
    }

    MICROGRAD_NODISCARD OpType op() const {
        std::lock_guard lock(m_mutex);
        return m_op;
    }

    MICROGRAD_NODISCARD Snapshot snapshot() const {
        std::lock_guard lock(m_mutex);
        return Snapshot{m_value, m_grad, m_op};
    }

    void zero_grad() {
        std::lock_guard lock(m_mutex);
        m_grad = 0.0f;
    }

    /// @brief value -= learning_rate * grad
    void apply_gradient_step(float learning_rate) {
        std::lock_guard lock(m_mutex);
        m_value -= learning_rate * m_grad;
    }

    MICROGRAD_NODISCARD bool backward_consumed() const {
        std::lock_guard lock(m_mutex);
        return m_backward_consumed;
    }

private:
    friend struct detail::GraphBuilder<Policy>;
    friend struct detail::BackwardExecutor<Policy>;

    /// @brief Relabels a composed result (subtract, negate, divide)
    void set_op(OpType op) {
        std::lock_guard lock(m_mutex);
        m_op = op;
    }

    void set_grad(float grad) {
        std::lock_guard lock(m_mutex);
        m_grad = grad;
    }

    void accumulate_grad(float delta) {
        std::lock_guard lock(m_mutex);
        m_grad += delta;
    }

    /**
     * @brief Removes the backward rule, leaving the slot empty
     *
     * @return The rule with this node's value and gradient, or nullopt for
     * leaves and nodes whose rule already ran
     */
    MICROGRAD_NODISCARD std::optional<PendingBackward> take_backward() {
        std::lock_guard lock(m_mutex);
        if (!m_backward)
            return std::nullopt;

        PendingBackward pending{*std::exchange(m_backward, std::nullopt),
                                m_value, m_grad};
        m_backward_consumed = true;
        return pending;
    }

    const std::uint64_t m_id;
    float m_value;
    float m_grad{0.0f};
    OpType m_op;
    Parents m_parents;
    std::optional<BackwardRule> m_backward;
    bool m_backward_consumed{false};
    mutable mutex_type m_mutex;
};

}  // namespace micrograd::autograd

template <micrograd::autograd::AccessPolicy Policy>
struct fmt::formatter<micrograd::autograd::Node<Policy>> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const micrograd::autograd::Node<Policy>& node,
                FormatContext& ctx) const {
        const auto state = node.snapshot();
        return fmt::format_to(ctx.out(), "id: {}, data: {}, grad: {}, op: {}",
                              node.id(), state.value, state.grad, state.op);
    }
};
