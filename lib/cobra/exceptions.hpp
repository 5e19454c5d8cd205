#pragma once

#include <concepts>
#include <functional>
#include <format>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace cobra {

// Rejected precondition (bad name, missing bifurcation label, dimension
// mismatch). Raised before any engine invocation.
class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Failure reported by the native computation engine.
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The engine build does not provide the requested native operation.
class MissingCapabilityError : public EngineError {
public:
    explicit MissingCapabilityError(std::string_view operation)
        : EngineError(std::format(
              "Native operation '{}' is not available in this engine build",
              operation)),
          m_operation(operation) {}

    [[nodiscard]] const std::string& operation() const noexcept {
        return m_operation;
    }

private:
    std::string m_operation;
};

// Cooperative cancellation. Not a failure.
class AbortError : public std::runtime_error {
public:
    AbortError() : std::runtime_error("cancelled") {}
};

namespace error_check {

// Internal invariant violation. Carries the call site so engine-boundary
// and decoding faults point back at the offending check.
class DetailedException : public std::runtime_error {
public:
    explicit DetailedException(
        std::string_view what,
        const std::source_location& where = std::source_location::current())
        : std::runtime_error(std::format("{} [{}:{} in {}]", what,
                                         where.file_name(), where.line(),
                                         where.function_name())) {}
};

inline void
check(bool condition,
      std::string_view what,
      const std::source_location& where = std::source_location::current()) {
    if (!condition) {
        throw DetailedException(what, where);
    }
}

namespace detail {
template <typename T, typename U, typename Op>
inline void compare(const T& lhs,
                    const U& rhs,
                    Op op,
                    std::string_view symbol,
                    std::string_view what,
                    const std::source_location& where) {
    if (op(lhs, rhs)) {
        return;
    }
    throw DetailedException(
        std::format("{}: expected {} {} {}",
                    what.empty() ? std::string_view{"check failed"} : what,
                    lhs, symbol, rhs),
        where);
}
} // namespace detail

template <typename T, typename U>
inline void
check_equal(const T& lhs,
            const U& rhs,
            std::string_view what             = {},
            const std::source_location& where = std::source_location::current()) {
    detail::compare(lhs, rhs, std::equal_to<>(), "==", what, where);
}

template <typename T, typename U>
inline void check_greater(
    const T& lhs,
    const U& rhs,
    std::string_view what             = {},
    const std::source_location& where = std::source_location::current()) {
    detail::compare(lhs, rhs, std::greater<>(), ">", what, where);
}

template <typename T, typename U>
inline void check_greater_equal(
    const T& lhs,
    const U& rhs,
    std::string_view what             = {},
    const std::source_location& where = std::source_location::current()) {
    detail::compare(lhs, rhs, std::greater_equal<>(), ">=", what, where);
}

inline void check_not_null(
    const void* ptr,
    std::string_view what             = "null pointer",
    const std::source_location& where = std::source_location::current()) {
    check(ptr != nullptr, what, where);
}

// Point or row index into a container of `size` elements.
template <std::integral Index, std::integral Size>
inline void
check_range(Index index,
            Size size,
            std::string_view what             = "index",
            const std::source_location& where = std::source_location::current()) {
    const bool in_range =
        std::cmp_greater_equal(index, 0) && std::cmp_less(index, size);
    if (!in_range) {
        throw DetailedException(
            std::format("{} {} outside [0, {})", what, index, size), where);
    }
}

} // namespace error_check

// Throws ValidationError with the given message when the condition fails.
inline void require(bool condition, std::string_view msg) {
    if (!condition) {
        throw ValidationError(std::string(msg));
    }
}

} // namespace cobra
