#pragma once

#include <tbb/concurrent_unordered_map.h>

#include <array>
#include <micrograd/core/macros.hpp>
#include <string>
#include <string_view>

namespace micrograd::core::error {
/**
 * @brief Base class for error categories
 *
 * @details A category names a family of error codes and renders each code
 * as a message. Messages are built once per code and cached, so the
 * returned reference stays valid for the life of the program.
 */
class MICROGRAD_API ErrorCategory {
public:
    virtual ~ErrorCategory() = default;

    MICROGRAD_NODISCARD virtual std::string_view name() const noexcept = 0;

    MICROGRAD_NODISCARD const std::string& message(int code) const {
        auto it = m_message_cache.find(code);
        if (it != m_message_cache.end())
            return it->second;

        return m_message_cache.insert({code, describe(code)}).first->second;
    }

protected:
    ErrorCategory() = default;
    MICROGRAD_UNCOPYABLE(ErrorCategory);
    MICROGRAD_IMMOVABLE(ErrorCategory);

    MICROGRAD_NODISCARD virtual std::string describe(int code) const = 0;

    /// @brief Looks @p code up in a table indexed by the code's value
    template <std::size_t N>
    static std::string describe_from(
        const std::array<std::string_view, N>& table, int code) {
        if (code >= 0 && static_cast<std::size_t>(code) < N)
            return std::string(table[static_cast<std::size_t>(code)]);

        return "Unknown error code: " + std::to_string(code);
    }

private:
    mutable tbb::concurrent_unordered_map<int, std::string> m_message_cache;
};

/**
 * @brief Failures outside the caller's control, such as an unwritable log
 * file
 */
class MICROGRAD_API RuntimeCategory final : public ErrorCategory {
public:
    enum class Code { Success = 0, IoError };

    static const RuntimeCategory& instance() noexcept {
        static const RuntimeCategory category;
        return category;
    }

    MICROGRAD_NODISCARD std::string_view name() const noexcept override {
        return "Runtime";
    }

private:
    RuntimeCategory() = default;

    MICROGRAD_NODISCARD std::string describe(int code) const override {
        static constexpr std::array<std::string_view, 2> messages = {
            "Success", "I/O error"};
        return describe_from(messages, code);
    }
};

/**
 * @brief Misuse of the library by its caller
 */
class MICROGRAD_API LogicCategory final : public ErrorCategory {
public:
    enum class Code { Success = 0, InvalidArgument, AlreadyBorrowed };

    static const LogicCategory& instance() noexcept {
        static const LogicCategory category;
        return category;
    }

    MICROGRAD_NODISCARD std::string_view name() const noexcept override {
        return "Logic";
    }

private:
    LogicCategory() = default;

    MICROGRAD_NODISCARD std::string describe(int code) const override {
        static constexpr std::array<std::string_view, 3> messages = {
            "Success", "Invalid argument", "Already borrowed"};
        return describe_from(messages, code);
    }
};
}  // namespace micrograd::core::error
