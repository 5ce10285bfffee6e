#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sigsys {

/**
 * @brief Restricted arithmetic expression over the sample-time variable t.
 *
 * Grammar (whitespace ignored):
 *
 *     expr    := term (('+' | '-') term)*
 *     term    := unary (('*' | '/') unary)*
 *     unary   := ('+' | '-') unary | power
 *     power   := primary (('**' | '^') unary)?
 *     primary := number | name | name '(' expr (',' expr)? ')' | '(' expr ')'
 *
 * Names are t, pi, e and a fixed whitelist of elementary functions (sin, cos, tan, arcsin,
 * arccos, arctan, sinh, cosh, tanh, exp, log, log10, log2, sqrt, abs, floor, ceil, sign,
 * pow, arctan2, minimum, maximum and their short aliases). A leading "np." or "numpy."
 * on a name is accepted and ignored. Anything else is rejected with InvalidExpression.
 */
class Expression {
   public:
    struct Node;

    /**
     * @brief  Compile an expression.
     *
     * @throws InvalidExpression  on any syntax error, unknown name or wrong call arity
     */
    static Expression parse(std::string_view text);

    // Evaluate at a single time instant. No finiteness check.
    double evaluate(double t) const;

    /**
     * @brief  Evaluate over a time vector.
     *
     * @throws InvalidExpression  if any sample evaluates to NaN or +/-inf
     */
    std::vector<double> evaluate(const std::vector<double>& t) const;

    // True if the variable t appears anywhere in the expression
    bool uses_time() const { return uses_time_; }

    const std::string& source() const { return source_; }

   private:
    Expression(std::string source, std::shared_ptr<const Node> root, bool uses_time);

    std::string                 source_;
    std::shared_ptr<const Node> root_;  // Immutable once parsed; shared between copies
    bool                        uses_time_ = false;
};

/**
 * @brief  Parse a textual coefficient list such as "[1, -0.5, 0.25]".
 *
 * Accepts "[...]", "(...)", "np.array([...])" or a bare comma separated list. Each element is a
 * constant expression (no t). A trailing comma is allowed. "[]" yields an empty vector.
 *
 * @throws InvalidCoefficients  if the list or any element is malformed or non-finite
 */
std::vector<double> parse_coefficients(std::string_view text);

}  // namespace sigsys
