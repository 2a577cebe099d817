#include <fmt/format.h>

#include <algorithm>
#include <micrograd/core/error/error.hpp>
#include <mutex>

namespace micrograd::core::error {
namespace {
// Expired entries are swept once the history outgrows this many
constexpr std::size_t kMinSweepThreshold = 64;

struct History {
    std::mutex mutex;
    std::vector<std::weak_ptr<const ErrorContext>> entries;
    std::size_t sweep_at = kMinSweepThreshold;

    // Requires mutex to be held
    void sweep() {
        std::erase_if(entries, [](const auto& weak) { return weak.expired(); });
        sweep_at = std::max(kMinSweepThreshold, 2 * entries.size());
    }
};

History& history() {
    static History instance;
    return instance;
}
}  // namespace

void Error::track(std::weak_ptr<const ErrorContext> context) {
    auto& h = history();
    std::lock_guard lock(h.mutex);

    h.entries.push_back(std::move(context));
    if (h.entries.size() >= h.sweep_at)
        h.sweep();
}

std::vector<std::shared_ptr<const ErrorContext>> Error::error_history() {
    auto& h = history();
    std::lock_guard lock(h.mutex);

    h.sweep();

    std::vector<std::shared_ptr<const ErrorContext>> live;
    live.reserve(h.entries.size());
    for (const auto& weak : h.entries) {
        if (auto context = weak.lock())
            live.push_back(std::move(context));
    }

    return live;
}

std::size_t Error::tracked_count() {
    auto& h = history();
    std::lock_guard lock(h.mutex);
    return h.entries.size();
}

std::string format_error(const Error& error) {
    std::string result = error.what();

    if (const auto* code = error.code())
        result += fmt::format("\n  code: {} ({})", code->message(),
                              code->value());

    for (const auto& note : error.notes())
        result += fmt::format("\n  note: {}", note);

    return result;
}

}  // namespace micrograd::core::error
