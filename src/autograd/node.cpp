#include <atomic>
#include <micrograd/autograd/node.hpp>

namespace micrograd::autograd::detail {
namespace {
MICROGRAD_ALIGN_CACHE std::atomic<std::uint64_t> node_counter{0};
}

std::uint64_t next_node_id() noexcept {
    return node_counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

}  // namespace micrograd::autograd::detail
