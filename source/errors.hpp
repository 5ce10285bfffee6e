#pragma once

#include <cstddef>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "log.hpp"

namespace sigsys {

/**
 * @brief Unrecognized signal/system type, or an out-of-domain configuration value.
 */
class InvalidArgument : public std::invalid_argument {
   public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief A custom-function expression failed to parse or evaluate.
 *
 * position() is the character offset into the source text where the failure was detected.
 */
class InvalidExpression : public std::invalid_argument {
   public:
    InvalidExpression(const std::string& what, std::size_t position = 0)
        : std::invalid_argument(what), position_(position) {}

    std::size_t position() const noexcept { return position_; }

   private:
    std::size_t position_;
};

/**
 * @brief Empty coefficient array or near-zero leading denominator coefficient.
 */
class InvalidCoefficients : public std::invalid_argument {
   public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Internal numeric failure of a response computation.
 *
 * Never thrown. Carried as the error value of Result<T> and resolved locally by a fallback.
 */
struct NumericFailure {
    std::string reason;
};

template <typename T>
using Result = std::expected<T, NumericFailure>;

inline std::unexpected<NumericFailure> numeric_failure(std::string reason) {
    return std::unexpected<NumericFailure>(NumericFailure{std::move(reason)});
}

/**
 * @brief Resolve a Result by substituting a fallback computation on failure.
 *
 * @param result    Outcome of the primary method
 * @param fallback  Nullary callable producing the documented fallback value
 * @param what      Name of the operation, used in the debug log line
 */
template <typename T, typename Fallback>
T or_fallback(Result<T>&& result, Fallback&& fallback, std::string_view what) {
    if (result.has_value()) {
        return std::move(*result);
    }
    logger()->debug("{}: {}; using fallback", what, result.error().reason);
    return std::forward<Fallback>(fallback)();
}

}  // namespace sigsys
