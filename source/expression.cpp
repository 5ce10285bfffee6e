#include "expression.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <numbers>

#include <fmt/core.h>

#include "errors.hpp"

namespace sigsys {

using UnaryFn  = double (*)(double);
using BinaryFn = double (*)(double, double);

struct Expression::Node {
    enum class Kind {
        Constant,
        Time,
        Negate,
        Add,
        Subtract,
        Multiply,
        Divide,
        Power,
        Call1,
        Call2,
    };

    Kind                  kind  = Kind::Constant;
    double                value = 0.0;
    UnaryFn               fn1   = nullptr;
    BinaryFn              fn2   = nullptr;
    size_t                height = 1;
    std::unique_ptr<Node> lhs, rhs;
};

namespace {

    using Node    = Expression::Node;
    using NodePtr = std::unique_ptr<Node>;

    struct UnaryEntry {
        std::string_view name;
        UnaryFn          fn;
    };

    struct BinaryEntry {
        std::string_view name;
        BinaryFn         fn;
    };

    // clang-format off
    const std::array<UnaryEntry, 21> kUnaryFunctions = {{
        {"sin",     [](double x) { return std::sin(x); }},
        {"cos",     [](double x) { return std::cos(x); }},
        {"tan",     [](double x) { return std::tan(x); }},
        {"arcsin",  [](double x) { return std::asin(x); }},
        {"asin",    [](double x) { return std::asin(x); }},
        {"arccos",  [](double x) { return std::acos(x); }},
        {"acos",    [](double x) { return std::acos(x); }},
        {"arctan",  [](double x) { return std::atan(x); }},
        {"atan",    [](double x) { return std::atan(x); }},
        {"sinh",    [](double x) { return std::sinh(x); }},
        {"cosh",    [](double x) { return std::cosh(x); }},
        {"tanh",    [](double x) { return std::tanh(x); }},
        {"exp",     [](double x) { return std::exp(x); }},
        {"log",     [](double x) { return std::log(x); }},
        {"log10",   [](double x) { return std::log10(x); }},
        {"log2",    [](double x) { return std::log2(x); }},
        {"sqrt",    [](double x) { return std::sqrt(x); }},
        {"abs",     [](double x) { return std::abs(x); }},
        {"floor",   [](double x) { return std::floor(x); }},
        {"ceil",    [](double x) { return std::ceil(x); }},
        {"sign",    [](double x) { return x > 0.0 ? 1.0 : (x < 0.0 ? -1.0 : 0.0); }},
    }};

    const std::array<BinaryEntry, 8> kBinaryFunctions = {{
        {"pow",     [](double x, double y) { return std::pow(x, y); }},
        {"power",   [](double x, double y) { return std::pow(x, y); }},
        {"arctan2", [](double y, double x) { return std::atan2(y, x); }},
        {"atan2",   [](double y, double x) { return std::atan2(y, x); }},
        {"minimum", [](double x, double y) { return std::fmin(x, y); }},
        {"min",     [](double x, double y) { return std::fmin(x, y); }},
        {"maximum", [](double x, double y) { return std::fmax(x, y); }},
        {"max",     [](double x, double y) { return std::fmax(x, y); }},
    }};
    // clang-format on

    UnaryFn findUnary(std::string_view name) {
        for (const auto& entry : kUnaryFunctions) {
            if (entry.name == name) return entry.fn;
        }
        return nullptr;
    }

    BinaryFn findBinary(std::string_view name) {
        for (const auto& entry : kBinaryFunctions) {
            if (entry.name == name) return entry.fn;
        }
        return nullptr;
    }

    std::string_view stripModulePrefix(std::string_view name) {
        for (std::string_view prefix : {std::string_view("numpy."), std::string_view("np.")}) {
            if (name.starts_with(prefix)) {
                return name.substr(prefix.size());
            }
        }
        return name;
    }

    NodePtr makeLeaf(Node::Kind kind, double value = 0.0) {
        auto node   = std::make_unique<Node>();
        node->kind  = kind;
        node->value = value;
        return node;
    }

    void updateHeight(Node& node) {
        node.height = 1 + std::max(node.lhs ? node.lhs->height : 0, node.rhs ? node.rhs->height : 0);
    }

    NodePtr makeBinary(Node::Kind kind, NodePtr lhs, NodePtr rhs) {
        auto node  = std::make_unique<Node>();
        node->kind = kind;
        node->lhs  = std::move(lhs);
        node->rhs  = std::move(rhs);
        updateHeight(*node);
        return node;
    }

    /* Recursive-descent parser producing an owned AST */
    class Parser {
       public:
        explicit Parser(std::string_view text)
            : text_(text) {}

        NodePtr parseAll() {
            NodePtr root = parseExpr();
            skipSpace();
            if (pos_ != text_.size()) {
                fail(fmt::format("unexpected '{}'", text_[pos_]));
            }
            return root;
        }

        bool usesTime() const { return uses_time_; }

       private:
        // Bounds on parser recursion and on evaluation recursion through the tree
        static constexpr size_t kMaxDepth  = 256;
        static constexpr size_t kMaxHeight = 4096;

        class DepthGuard {
           public:
            explicit DepthGuard(Parser& parser)
                : parser_(parser) {
                if (++parser_.depth_ > kMaxDepth) {
                    parser_.fail("expression nested too deeply");
                }
            }
            ~DepthGuard() { --parser_.depth_; }

            DepthGuard(const DepthGuard&)            = delete;
            DepthGuard& operator=(const DepthGuard&) = delete;

           private:
            Parser& parser_;
        };

        NodePtr chain(Node::Kind kind, NodePtr lhs, NodePtr rhs) {
            NodePtr node = makeBinary(kind, std::move(lhs), std::move(rhs));
            if (node->height > kMaxHeight) {
                fail("expression too long");
            }
            return node;
        }

        [[noreturn]] void fail(const std::string& message) const {
            throw InvalidExpression(fmt::format("Invalid expression '{}' at {}: {}", text_, pos_, message), pos_);
        }

        void skipSpace() {
            while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
                ++pos_;
            }
        }

        bool accept(std::string_view token) {
            skipSpace();
            if (text_.substr(pos_).starts_with(token)) {
                pos_ += token.size();
                return true;
            }
            return false;
        }

        void expect(char c) {
            if (!accept(std::string_view(&c, 1))) {
                fail(fmt::format("expected '{}'", c));
            }
        }

        NodePtr parseExpr() {
            NodePtr lhs = parseTerm();
            while (true) {
                if (accept("+")) {
                    lhs = chain(Node::Kind::Add, std::move(lhs), parseTerm());
                } else if (accept("-")) {
                    lhs = chain(Node::Kind::Subtract, std::move(lhs), parseTerm());
                } else {
                    return lhs;
                }
            }
        }

        NodePtr parseTerm() {
            NodePtr lhs = parseUnary();
            while (true) {
                skipSpace();
                // "**" is power, not two multiplications
                if (text_.substr(pos_).starts_with("**")) {
                    return lhs;
                }
                if (accept("*")) {
                    lhs = chain(Node::Kind::Multiply, std::move(lhs), parseUnary());
                } else if (accept("/")) {
                    lhs = chain(Node::Kind::Divide, std::move(lhs), parseUnary());
                } else {
                    return lhs;
                }
            }
        }

        // Every recursive production passes through here
        NodePtr parseUnary() {
            DepthGuard guard(*this);
            if (accept("-")) {
                return makeBinary(Node::Kind::Negate, parseUnary(), nullptr);
            }
            if (accept("+")) {
                return parseUnary();
            }
            return parsePower();
        }

        NodePtr parsePower() {
            NodePtr base = parsePrimary();
            if (accept("**") || accept("^")) {
                // Right associative: the exponent may itself be a signed power
                return makeBinary(Node::Kind::Power, std::move(base), parseUnary());
            }
            return base;
        }

        NodePtr parsePrimary() {
            skipSpace();
            if (pos_ >= text_.size()) {
                fail("unexpected end of input");
            }

            const char c = text_[pos_];
            if (c == '(') {
                ++pos_;
                NodePtr inner = parseExpr();
                expect(')');
                return inner;
            }
            if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
                return parseNumber();
            }
            if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
                return parseName();
            }
            fail(fmt::format("unexpected '{}'", c));
        }

        NodePtr parseNumber() {
            const size_t start  = pos_;
            bool         digits = false;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                ++pos_;
                digits = true;
            }
            if (pos_ < text_.size() && text_[pos_] == '.') {
                ++pos_;
                while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                    ++pos_;
                    digits = true;
                }
            }
            if (!digits) {
                pos_ = start;
                fail("malformed number");
            }
            if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
                size_t exp_pos = pos_ + 1;
                if (exp_pos < text_.size() && (text_[exp_pos] == '+' || text_[exp_pos] == '-')) {
                    ++exp_pos;
                }
                if (exp_pos < text_.size() && std::isdigit(static_cast<unsigned char>(text_[exp_pos]))) {
                    pos_ = exp_pos;
                    while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                        ++pos_;
                    }
                }
            }

            // from_chars does not accept a leading '.', so parse "0" + literal in that case
            std::string literal(text_.substr(start, pos_ - start));
            if (literal.front() == '.') {
                literal.insert(literal.begin(), '0');
            }
            double value = 0.0;
            auto [end, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), value);
            if (ec != std::errc() || end != literal.data() + literal.size()) {
                pos_ = start;
                fail("malformed number");
            }
            return makeLeaf(Node::Kind::Constant, value);
        }

        NodePtr parseName() {
            const size_t start = pos_;
            while (pos_ < text_.size() && (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_' || text_[pos_] == '.')) {
                ++pos_;
            }
            const std::string_view name = stripModulePrefix(text_.substr(start, pos_ - start));

            skipSpace();
            if (pos_ < text_.size() && text_[pos_] == '(') {
                ++pos_;
                return parseCall(name, start);
            }

            if (name == "t") {
                uses_time_ = true;
                return makeLeaf(Node::Kind::Time);
            }
            if (name == "pi") {
                return makeLeaf(Node::Kind::Constant, std::numbers::pi);
            }
            if (name == "e") {
                return makeLeaf(Node::Kind::Constant, std::numbers::e);
            }
            pos_ = start;
            fail(fmt::format("unknown name '{}'", name));
        }

        NodePtr parseCall(std::string_view name, size_t name_pos) {
            NodePtr first = parseExpr();
            NodePtr second;
            if (accept(",")) {
                second = parseExpr();
            }
            expect(')');

            auto node = std::make_unique<Node>();
            if (!second) {
                if (UnaryFn fn = findUnary(name)) {
                    node->kind = Node::Kind::Call1;
                    node->fn1  = fn;
                    node->lhs  = std::move(first);
                    updateHeight(*node);
                    return node;
                }
            } else if (BinaryFn fn = findBinary(name)) {
                node->kind = Node::Kind::Call2;
                node->fn2  = fn;
                node->lhs  = std::move(first);
                node->rhs  = std::move(second);
                updateHeight(*node);
                return node;
            }

            pos_ = name_pos;
            if (findUnary(name) || findBinary(name)) {
                fail(fmt::format("wrong number of arguments to '{}'", name));
            }
            fail(fmt::format("unknown function '{}'", name));
        }

        std::string_view text_;
        size_t           pos_       = 0;
        size_t           depth_     = 0;
        bool             uses_time_ = false;
    };

    double evaluateNode(const Node& node, double t) {
        switch (node.kind) {
            case Node::Kind::Constant:
                return node.value;
            case Node::Kind::Time:
                return t;
            case Node::Kind::Negate:
                return -evaluateNode(*node.lhs, t);
            case Node::Kind::Add:
                return evaluateNode(*node.lhs, t) + evaluateNode(*node.rhs, t);
            case Node::Kind::Subtract:
                return evaluateNode(*node.lhs, t) - evaluateNode(*node.rhs, t);
            case Node::Kind::Multiply:
                return evaluateNode(*node.lhs, t) * evaluateNode(*node.rhs, t);
            case Node::Kind::Divide:
                return evaluateNode(*node.lhs, t) / evaluateNode(*node.rhs, t);
            case Node::Kind::Power:
                return std::pow(evaluateNode(*node.lhs, t), evaluateNode(*node.rhs, t));
            case Node::Kind::Call1:
                return node.fn1(evaluateNode(*node.lhs, t));
            case Node::Kind::Call2:
                return node.fn2(evaluateNode(*node.lhs, t), evaluateNode(*node.rhs, t));
        }
        return 0.0;
    }

}  // namespace

Expression::Expression(std::string source, std::shared_ptr<const Node> root, bool uses_time)
    : source_(std::move(source)), root_(std::move(root)), uses_time_(uses_time) {}

Expression Expression::parse(std::string_view text) {
    Parser  parser(text);
    NodePtr root = parser.parseAll();
    return Expression(std::string(text), std::shared_ptr<const Node>(std::move(root)), parser.usesTime());
}

double Expression::evaluate(double t) const {
    return evaluateNode(*root_, t);
}

std::vector<double> Expression::evaluate(const std::vector<double>& t) const {
    std::vector<double> result;
    result.reserve(t.size());
    for (double ti : t) {
        const double value = evaluateNode(*root_, ti);
        if (!std::isfinite(value)) {
            throw InvalidExpression(fmt::format("Expression '{}' is not finite at t={}", source_, ti));
        }
        result.push_back(value);
    }
    return result;
}

static std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// Remove one matching pair of enclosing delimiters, if present
static bool unwrap(std::string_view& s, std::string_view open, char close) {
    if (s.starts_with(open) && s.ends_with(close)) {
        s = trim(s.substr(open.size(), s.size() - open.size() - 1));
        return true;
    }
    return false;
}

std::vector<double> parse_coefficients(std::string_view text) {
    std::string_view body = trim(text);
    if (!unwrap(body, "np.array(", ')')) {
        unwrap(body, "numpy.array(", ')');
    }
    if (!unwrap(body, "[", ']')) {
        unwrap(body, "(", ')');
    }

    // Split on top-level commas
    std::vector<std::string_view> elements;
    int                           depth = 0;
    size_t                        start = 0;
    for (size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (c == '(' || c == '[') {
            ++depth;
        } else if (c == ')' || c == ']') {
            --depth;
        } else if (c == ',' && depth == 0) {
            elements.push_back(trim(body.substr(start, i - start)));
            start = i + 1;
        }
    }
    // An empty tail is either "[]" or a trailing comma
    const std::string_view last = trim(body.substr(start));
    if (!last.empty()) {
        elements.push_back(last);
    }

    std::vector<double> coeffs;
    coeffs.reserve(elements.size());
    for (const auto& element : elements) {
        if (element.empty()) {
            throw InvalidCoefficients(fmt::format("Invalid coefficient list '{}': empty element", text));
        }
        try {
            const Expression expr = Expression::parse(element);
            if (expr.uses_time()) {
                throw InvalidCoefficients(fmt::format("Invalid coefficient list '{}': '{}' depends on t", text, element));
            }
            const double value = expr.evaluate(0.0);
            if (!std::isfinite(value)) {
                throw InvalidCoefficients(fmt::format("Invalid coefficient list '{}': '{}' is not finite", text, element));
            }
            coeffs.push_back(value);
        } catch (const InvalidExpression& e) {
            throw InvalidCoefficients(fmt::format("Invalid coefficient list '{}': {}", text, e.what()));
        }
    }
    return coeffs;
}

}  // namespace sigsys
