#pragma once

#include <fmt/format.h>

#include <boost/stacktrace.hpp>
#include <cstddef>
#include <memory>
#include <micrograd/core/error/error_code.hpp>
#include <micrograd/core/macros.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <tl/expected.hpp>
#include <vector>

namespace micrograd::core::error {
/**
 * @brief Where an error was raised and what was noted about it since
 */
struct ErrorContext {
    std::vector<std::string> notes;
    boost::stacktrace::stacktrace stacktrace;
};

/**
 * @brief Base error class with rich context and history tracking
 *
 */
class MICROGRAD_API Error : public std::runtime_error {
public:
    template <typename... Args>
    explicit Error(fmt::format_string<Args...> fmt, Args&&... args)
        : std::runtime_error(fmt::format(fmt, std::forward<Args>(args)...)),
          m_context(std::make_shared<ErrorContext>()) {
        track(m_context);
    }

    template <typename... Args>
    explicit Error(const ErrorCode& code, fmt::format_string<Args...> fmt,
                   Args&&... args)
        : std::runtime_error(fmt::format(fmt, std::forward<Args>(args)...)),
          m_context(std::make_shared<ErrorContext>()),
          m_code(code) {
        track(m_context);
    }

    // Context accessors
    const ErrorContext* context() const noexcept { return m_context.get(); }
    const ErrorCode* code() const noexcept {
        return m_code ? &*m_code : nullptr;
    }

    void add_note(std::string note) {
        m_context->notes.push_back(std::move(note));
    }

    const std::vector<std::string>& notes() const noexcept {
        return m_context->notes;
    }

    /**
     * @brief Snapshot of the contexts of all errors still alive
     *
     * @details Entries of destroyed errors are dropped from the history as
     * a side effect.
     *
     * @return Contexts of errors that have not been destroyed yet
     */
    static std::vector<std::shared_ptr<const ErrorContext>> error_history();

    /// @brief Number of history entries held, expired ones included
    static std::size_t tracked_count();

protected:
    std::shared_ptr<ErrorContext> m_context;
    std::optional<ErrorCode> m_code;

private:
    static void track(std::weak_ptr<const ErrorContext> context);
};

// Derived error classes
class MICROGRAD_API RuntimeError : public Error {
public:
    using Error::Error;
};

class MICROGRAD_API LogicError : public Error {
public:
    using Error::Error;
};

/// @brief Rejected argument, coded LogicCategory::Code::InvalidArgument
class MICROGRAD_API InvalidArgument : public LogicError {
public:
    using LogicError::LogicError;

    template <typename... Args>
    explicit InvalidArgument(fmt::format_string<Args...> fmt, Args&&... args)
        : LogicError(make_error_code(LogicCategory::Code::InvalidArgument), fmt,
                     std::forward<Args>(args)...) {}
};

/**
 * @brief Overlapping exclusive access to a graph node
 *
 * @details Raised by the single-threaded access policy when a node is
 * accessed while another access to it is still outstanding. Coded
 * LogicCategory::Code::AlreadyBorrowed.
 */
class MICROGRAD_API BorrowError : public LogicError {
public:
    using LogicError::LogicError;

    template <typename... Args>
    explicit BorrowError(fmt::format_string<Args...> fmt, Args&&... args)
        : LogicError(make_error_code(LogicCategory::Code::AlreadyBorrowed),
                     fmt, std::forward<Args>(args)...) {}
};

// Result type for error handling
template <typename T>
using Result = tl::expected<T, std::shared_ptr<Error>>;

/**
 * @brief Renders an error for display
 *
 * @details The message, followed by the error code and every note, one per
 * line.
 *
 * @param error Error to render
 * @return Multi-line description
 */
MICROGRAD_NODISCARD MICROGRAD_API std::string format_error(const Error& error);
}  // namespace micrograd::core::error

#define MICROGRAD_ENSURE(condition, ...)                             \
    do {                                                             \
        if (!(condition)) {                                          \
            throw ::micrograd::core::error::LogicError(__VA_ARGS__); \
        }                                                            \
    } while (0)

#define MICROGRAD_THROW_IF(condition, exception_type, ...)               \
    do {                                                                 \
        if (condition) {                                                 \
            throw ::micrograd::core::error::exception_type(__VA_ARGS__); \
        }                                                                \
    } while (0)
