#pragma once

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include <cstddef>
#include <micrograd/core/macros.hpp>
#include <thread>
#include <type_traits>

namespace micrograd::parallel {
/**
 * @brief Parallelization configuration options
 */
struct MICROGRAD_API ParallelConfig {
    /// @brief Maximum number of threads to use (0 = auto)
    std::size_t num_threads = 0;

    /// @brief Minimum number of iterations per task
    std::size_t grain_size = 1;
};

/**
 * @brief Get the default parallel configuration
 * @return ParallelConfig Default parallel configuration
 */
MICROGRAD_NODISCARD inline ParallelConfig default_parallel_config() {
    return ParallelConfig{};
}

/**
 * @brief Number of threads a loop under @p config may use
 */
MICROGRAD_NODISCARD inline std::size_t effective_threads(
    const ParallelConfig& config) {
    if (config.num_threads != 0)
        return config.num_threads;

    const auto hardware = std::thread::hardware_concurrency();
    return hardware == 0 ? 4 : hardware;
}

/**
 * @brief Parallel for loop execution
 *
 * @details Executes a function over a range of indices in parallel using TBB,
 * inside a task arena capped at the configured number of threads. Ranges no
 * larger than the grain size, or a single-thread configuration, run inline
 * on the calling thread. An exception thrown by @p func is rethrown on the
 * calling thread.
 *
 * @tparam Index Index type (must be an integral type)
 * @tparam Func Function type
 * @param start Start index (inclusive)
 * @param end End index (exclusive)
 * @param func Function to execute for each index
 * @param config Parallelization configuration options
 */
template <typename Index, typename Func>
void parallel_for(Index start, Index end, Func&& func,
                  const ParallelConfig& config = default_parallel_config()) {
    static_assert(std::is_integral_v<Index>,
                  "Index type must be an integral type");

    if (end <= start)
        return;

    const auto range_size = static_cast<std::size_t>(end - start);
    const auto threads = effective_threads(config);
    const auto grain = config.grain_size == 0 ? 1 : config.grain_size;

    if (range_size <= grain || threads == 1) {
        for (Index i = start; i < end; ++i)
            func(i);

        return;
    }

    tbb::task_arena arena(static_cast<int>(threads));
    arena.execute([&]() {
        tbb::parallel_for(
            tbb::blocked_range<Index>(start, end, grain),
            [&](const tbb::blocked_range<Index>& range) {
                for (Index i = range.begin(); i < range.end(); ++i)
                    func(i);
            });
    });
}
}  // namespace micrograd::parallel
