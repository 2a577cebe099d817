#pragma once

#include <fmt/format.h>
#include <tbb/concurrent_queue.h>

#include <atomic>
#include <boost/circular_buffer.hpp>
#include <boost/container/small_vector.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <micrograd/core/error/error.hpp>
#include <micrograd/core/error/error_code.hpp>
#include <micrograd/core/macros.hpp>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <source_location>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace micrograd::log {
/// @brief Log severity levels
enum class Severity : uint8_t { Trace, Debug, Info, Warning, Error, Fatal };

/// @brief Upper-case name of a severity level
MICROGRAD_API std::string_view to_string(Severity severity) noexcept;

/**
 * @brief Parses a severity name such as "debug" or "WARNING"
 *
 * @param name Case-insensitive severity name
 * @return The severity, or an InvalidArgument error for unknown names
 */
MICROGRAD_API core::error::Result<Severity> parse_severity(
    std::string_view name);

/// @brief Log entry containing message and metadata
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    Severity severity{Severity::Info};
    std::string message;
    std::source_location location;
    std::thread::id thread_id;
    std::optional<core::error::ErrorCode> error;
};

/// @brief Renders an entry as a single line without trailing newline
MICROGRAD_API std::string format_entry(const LogEntry& entry);

/// @brief Interface for log sinks
class MICROGRAD_API LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;

protected:
    LogSink() = default;
    MICROGRAD_IMMOVABLE(LogSink);
};

/**
 * @brief Writes entries to standard error
 */
class MICROGRAD_API ConsoleLogSink : public LogSink {
public:
    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::mutex m_mutex;
};

/**
 * @brief File-based log sink with rotation
 */
class MICROGRAD_API FileLogSink : public LogSink {
public:
    struct Config {
        std::filesystem::path path;
        size_t max_size = 10 * 1024 * 1024;  // 10MB
        size_t max_files = 5;
        bool auto_flush = true;
    };

    explicit FileLogSink(Config config);
    void write(const LogEntry& entry) override;
    void flush() override;

private:
    void rotate_if_needed();

    Config m_config;
    std::ofstream m_file;
    size_t m_current_size{0};
    std::mutex m_mutex;
};

/**
 * @brief Memory-based circular buffer sink
 */
class MICROGRAD_API CircularBufferSink : public LogSink {
public:
    explicit CircularBufferSink(size_t capacity);
    void write(const LogEntry& entry) override;
    void flush() override {}

    /// @brief Copy of the buffered entries, oldest first
    std::vector<LogEntry> entries() const;

private:
    boost::circular_buffer<LogEntry> m_buffer;
    mutable std::shared_mutex m_mutex;
};

/**
 * @brief Async logger with multiple sinks
 */
class MICROGRAD_API Logger {
public:
    struct Config {
        Severity min_severity = Severity::Info;
        size_t batch_size = 32;
        bool async = true;
    };

    Logger();
    explicit Logger(Config config);
    ~Logger();

    MICROGRAD_UNCOPYABLE(Logger);
    MICROGRAD_IMMOVABLE(Logger);

    void add_sink(std::shared_ptr<LogSink> sink);
    void clear_sinks();

    void set_min_severity(Severity severity) noexcept {
        m_min_severity.store(severity, std::memory_order_relaxed);
    }

    MICROGRAD_NODISCARD Severity min_severity() const noexcept {
        return m_min_severity.load(std::memory_order_relaxed);
    }

    MICROGRAD_NODISCARD bool should_log(Severity severity) const noexcept {
        return severity >= min_severity();
    }

    /**
     * @brief Logs a new entry
     *
     * @tparam Args Format argument types
     * @param severity Severity level
     * @param location Location where the message occured
     * @param fmt Format string
     * @param args Format argument
     */
    template <typename... Args>
    void log(Severity severity, const std::source_location& location,
             fmt::format_string<Args...> fmt, Args&&... args) {
        if (!should_log(severity))
            return;

        submit(LogEntry{
            .timestamp = std::chrono::system_clock::now(),
            .severity = severity,
            .message = fmt::format(fmt, std::forward<Args>(args)...),
            .location = location,
            .thread_id = std::this_thread::get_id(),
            .error = std::nullopt});
    }

    /**
     * @brief Logs a new entry with error information
     *
     * @tparam Args Format argument types
     * @param severity Severity level
     * @param error Error that occurred
     * @param location Location where the message occured
     * @param fmt Format string
     * @param args Format argument
     */
    template <typename... Args>
    void log_with_error(Severity severity, const core::error::ErrorCode& error,
                        const std::source_location& location,
                        fmt::format_string<Args...> fmt, Args&&... args) {
        if (!should_log(severity))
            return;

        submit(LogEntry{
            .timestamp = std::chrono::system_clock::now(),
            .severity = severity,
            .message = fmt::format(fmt, std::forward<Args>(args)...),
            .location = location,
            .thread_id = std::this_thread::get_id(),
            .error = error});
    }

    /**
     * @brief Drains the queue into the sinks and flushes every sink
     *
     * @details Waits for a batch the worker is already writing, so every
     * entry logged before the call reaches the sinks in submission order.
     */
    void flush();

private:
    void submit(LogEntry entry);
    void process_queue(std::stop_token stop);
    void write_entry(const LogEntry& entry);

    Config m_config;
    std::atomic<Severity> m_min_severity;
    tbb::concurrent_queue<LogEntry> m_queue;
    boost::container::small_vector<std::shared_ptr<LogSink>, 4> m_sinks;
    std::mutex m_mutex;
    // Held from the pop of a batch until its last entry is written
    std::mutex m_drain_mutex;
    std::jthread m_worker;
};

// Global logger instance, writing to stderr
MICROGRAD_API Logger& global_logger();

}  // namespace micrograd::log

#define MICROGRAD_LOG_AT(severity, ...)                                  \
    do {                                                                 \
        auto& micrograd_logger_ = ::micrograd::log::global_logger();     \
        if (micrograd_logger_.should_log(severity)) {                    \
            micrograd_logger_.log(severity, std::source_location::current(), \
                                  __VA_ARGS__);                          \
        }                                                                \
    } while (0)

// Convenience macros
#define MICROGRAD_LOG_TRACE(...) \
    MICROGRAD_LOG_AT(::micrograd::log::Severity::Trace, __VA_ARGS__)

#define MICROGRAD_LOG_DEBUG(...) \
    MICROGRAD_LOG_AT(::micrograd::log::Severity::Debug, __VA_ARGS__)

#define MICROGRAD_LOG_INFO(...) \
    MICROGRAD_LOG_AT(::micrograd::log::Severity::Info, __VA_ARGS__)

#define MICROGRAD_LOG_WARNING(...) \
    MICROGRAD_LOG_AT(::micrograd::log::Severity::Warning, __VA_ARGS__)

#define MICROGRAD_LOG_ERROR(...) \
    MICROGRAD_LOG_AT(::micrograd::log::Severity::Error, __VA_ARGS__)

#define MICROGRAD_LOG_FATAL(...) \
    MICROGRAD_LOG_AT(::micrograd::log::Severity::Fatal, __VA_ARGS__)

#define MICROGRAD_LOG_ERROR_CODE(severity, error, ...)  \
    ::micrograd::log::global_logger().log_with_error(   \
        severity, error, std::source_location::current(), __VA_ARGS__)
