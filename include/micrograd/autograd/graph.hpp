#pragma once

#include <cstddef>
#include <memory>
#include <micrograd/autograd/backward_rule.hpp>
#include <micrograd/autograd/node.hpp>
#include <micrograd/autograd/policy.hpp>
#include <micrograd/core/error/error.hpp>
#include <micrograd/core/macros.hpp>
#include <micrograd/utils/logger/logger.hpp>
#include <unordered_set>
#include <vector>

namespace micrograd::autograd {

/**
 * @brief Orders every node reachable from @p root so that each node comes
 * after all of its parents
 *
 * @details Depth-first post-order over the parent relation, parents taken in
 * insertion order, each node emitted once however many paths reach it.
 * Uses an explicit stack, so the depth of the graph is not bounded by the
 * call stack. Only ids and parent sets are read, both immutable, so no node
 * is locked and no handles are compared.
 *
 * @param root Terminal node
 * @return Nodes in topological order, @p root last
 */
template <AccessPolicy Policy>
MICROGRAD_NODISCARD std::vector<std::shared_ptr<Node<Policy>>>
topological_sort(const std::shared_ptr<Node<Policy>>& root) {
    using NodePtr = std::shared_ptr<Node<Policy>>;

    struct Frame {
        NodePtr node;
        std::size_t next_parent;
    };

    std::vector<NodePtr> order;
    std::unordered_set<std::uint64_t> visited;
    std::vector<Frame> stack;

    visited.insert(root->id());
    stack.push_back(Frame{root, 0});

    while (!stack.empty()) {
        auto& frame = stack.back();
        const auto& parents = frame.node->parents();

        if (frame.next_parent < parents.size()) {
            NodePtr parent = parents[frame.next_parent++];
            if (visited.insert(parent->id()).second)
                stack.push_back(Frame{std::move(parent), 0});

            continue;
        }

        order.push_back(std::move(frame.node));
        stack.pop_back();
    }

    return order;
}

namespace detail {
/// @brief Drives the reverse pass; the only writer of gradients and rules
template <AccessPolicy Policy>
struct BackwardExecutor {
    static void run(const std::shared_ptr<Node<Policy>>& root) {
        MICROGRAD_MAYBE_UNUSED auto scope = Policy::enter_backward();

        const auto order = topological_sort(root);
        MICROGRAD_LOG_DEBUG("backward from node {}: {} nodes ({})",
                            root->id(), order.size(), Policy::name);

        if (log::global_logger().should_log(log::Severity::Trace)) {
            for (const auto& node : order)
                MICROGRAD_LOG_TRACE("topo {}", *node);
        }

        root->set_grad(1.0f);

        for (auto it = order.rbegin(); it != order.rend(); ++it) {
            auto& node = **it;
            auto pending = node.take_backward();

            if (!pending) {
                MICROGRAD_ENSURE(node.is_leaf() || node.backward_consumed(),
                                 "Node {} ({}) has parents but no backward rule",
                                 node.id(), node.op());
                continue;
            }

            const auto& parents = node.parents();
            for (const auto& contribution : local_gradients(
                     pending->rule, pending->value, pending->grad)) {
                parents[contribution.slot]->accumulate_grad(contribution.delta);
            }
        }
    }
};
}  // namespace detail

/**
 * @brief Reverse-mode pass from @p root
 *
 * @details Seeds the root gradient to 1 and runs every pending backward rule
 * once, consumers before producers, so each node has received all of its
 * contributions before it forwards its own. Rules are one-shot: running
 * again over the same graph only re-seeds the root.
 *
 * @param root Terminal node, usually a loss
 * @throws LogicError if an interior node lost its rule without running it
 */
template <AccessPolicy Policy>
void run_backward(const std::shared_ptr<Node<Policy>>& root) {
    detail::BackwardExecutor<Policy>::run(root);
}

}  // namespace micrograd::autograd
