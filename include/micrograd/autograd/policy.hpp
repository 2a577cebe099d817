#pragma once

#include <concepts>
#include <micrograd/core/error/error.hpp>
#include <micrograd/core/macros.hpp>
#include <mutex>
#include <string_view>

namespace micrograd::autograd {

/**
 * @brief Non-blocking lockable that rejects overlapping access
 *
 * @details Satisfies the Lockable requirements so it can be used with
 * std::lock_guard. Where a mutex would block, lock() throws BorrowError:
 * within a single thread a second access while one is outstanding can only
 * come from a re-entrant access bug, and waiting would never end.
 */
class MICROGRAD_API BorrowFlag {
public:
    BorrowFlag() = default;
    MICROGRAD_UNCOPYABLE(BorrowFlag);
    MICROGRAD_IMMOVABLE(BorrowFlag);

    void lock() {
        if (MICROGRAD_PREDICT_FALSE(m_borrowed)) {
            throw core::error::BorrowError("Node is already borrowed");
        }

        m_borrowed = true;
    }

    bool try_lock() noexcept {
        if (m_borrowed)
            return false;

        m_borrowed = true;
        return true;
    }

    void unlock() noexcept { m_borrowed = false; }

    MICROGRAD_NODISCARD bool is_borrowed() const noexcept {
        return m_borrowed;
    }

private:
    bool m_borrowed{false};
};

/**
 * @brief All graph work happens on one thread; node access is checked
 * at run time and overlapping access fails fast
 */
struct MICROGRAD_API SingleThreaded {
    using mutex_type = BorrowFlag;

    static constexpr bool thread_safe = false;
    static constexpr std::string_view name = "SingleThreaded";

    struct BackwardScope {};

    static BackwardScope enter_backward() noexcept { return {}; }
};

/**
 * @brief Nodes are guarded by a mutex so that independent threads can
 * build subgraphs over shared leaves; backward passes are serialized
 * process-wide
 */
struct MICROGRAD_API MultiThreaded {
    using mutex_type = std::mutex;

    static constexpr bool thread_safe = true;
    static constexpr std::string_view name = "MultiThreaded";

    static std::unique_lock<std::mutex> enter_backward() {
        return std::unique_lock<std::mutex>(backward_mutex());
    }

private:
    static std::mutex& backward_mutex() {
        static std::mutex mutex;
        return mutex;
    }
};

/**
 * @brief Requirements on a node access policy
 */
template <typename P>
concept AccessPolicy = requires {
    typename P::mutex_type;
    { P::thread_safe } -> std::convertible_to<bool>;
    { P::name } -> std::convertible_to<std::string_view>;
    P::enter_backward();
};

#if defined(MICROGRAD_THREAD_SAFE)
using DefaultPolicy = MultiThreaded;
#else
using DefaultPolicy = SingleThreaded;
#endif

}  // namespace micrograd::autograd
