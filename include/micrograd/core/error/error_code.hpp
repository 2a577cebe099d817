#pragma once

#include <micrograd/core/error/error_category.hpp>
#include <micrograd/core/macros.hpp>
#include <string>

namespace micrograd::core::error {
/**
 * @brief A code paired with the category that gives it meaning
 *
 * @details Codes are plain values: two codes are equal when they carry the
 * same value in the same category. A zero value means success.
 */
class MICROGRAD_API ErrorCode {
public:
    ErrorCode() noexcept : m_category(&LogicCategory::instance()) {}

    ErrorCode(LogicCategory::Code code) noexcept
        : m_value(static_cast<int>(code)),
          m_category(&LogicCategory::instance()) {}

    ErrorCode(RuntimeCategory::Code code) noexcept
        : m_value(static_cast<int>(code)),
          m_category(&RuntimeCategory::instance()) {}

    MICROGRAD_NODISCARD int value() const noexcept { return m_value; }
    MICROGRAD_NODISCARD const ErrorCategory& category() const noexcept {
        return *m_category;
    }
    MICROGRAD_NODISCARD const std::string& message() const {
        return m_category->message(m_value);
    }

    bool operator==(const ErrorCode& other) const noexcept {
        return m_value == other.m_value && m_category == other.m_category;
    }

    explicit operator bool() const noexcept { return m_value != 0; }

private:
    int m_value{0};
    const ErrorCategory* m_category;
};

inline ErrorCode make_error_code(LogicCategory::Code code) noexcept {
    return ErrorCode{code};
}

inline ErrorCode make_error_code(RuntimeCategory::Code code) noexcept {
    return ErrorCode{code};
}
}  // namespace micrograd::core::error
