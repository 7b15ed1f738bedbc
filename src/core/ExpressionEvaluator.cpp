/* @file ExpressionEvaluator.cpp
 * @brief tokenizer, recursive-descent parser and tree evaluator for flow expressions
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

// TrialFlow headers
#include "core/Errors.hpp"
#include "core/ExpressionEvaluator.hpp"
#include "core/VariableEnvironment.hpp"

namespace trialflow::core {

  namespace detail {

    enum class NodeKind { Literal, Name, Unary, Binary, Ternary, Call };

    struct ExprNode {
      NodeKind kind{ NodeKind::Literal };
      Value literal{ 0.0 };
      std::string text; ///< name, operator or function name
      std::vector<std::shared_ptr<const ExprNode>> children;
    };

  } // namespace detail

  namespace {

    using detail::ExprNode;
    using detail::NodeKind;
    using NodePtr = std::shared_ptr<const ExprNode>;

    enum class Tok { Number, String, Ident, Op, End };

    struct Token {
      Tok type{ Tok::End };
      std::string text;
      double number{ 0.0 };
      std::size_t pos{ 0 };
    };

    bool isIdentStart(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
    bool isIdentChar(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

    bool digitAt(const std::string& s, std::size_t i) {
      return i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]));
    }

    // Length of the decimal literal at \p i: digits [. digits] [e [+-] digits].
    std::size_t scanDecimal(const std::string& s, std::size_t i) {
      const std::size_t begin = i;
      while (digitAt(s, i))
        ++i;
      if (i < s.size() && s[i] == '.') {
        ++i;
        while (digitAt(s, i))
          ++i;
      }
      if (i > begin && i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        std::size_t j = i + 1;
        if (j < s.size() && (s[j] == '+' || s[j] == '-'))
          ++j;
        if (digitAt(s, j)) {
          while (digitAt(s, j))
            ++j;
          i = j;
        }
      }
      return i - begin;
    }

    std::vector<Token> tokenize(const std::string& src) {
      std::vector<Token> out;
      std::size_t i = 0;
      while (i < src.size()) {
        char c = src[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
          ++i;
          continue;
        }

        Token tok;
        tok.pos = i;

        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && i + 1 < src.size() && std::isdigit(static_cast<unsigned char>(src[i + 1])))) {
          std::size_t len = scanDecimal(src, i);
          if (len == 0)
            throw EvaluationError(src, "invalid number at offset " + std::to_string(i));
          tok.type = Tok::Number;
          tok.text = src.substr(i, len);
          tok.number = std::strtod(tok.text.c_str(), nullptr);
          i += len;
          if (i < src.size() && isIdentStart(src[i]))
            throw EvaluationError(src, "invalid number at offset " + std::to_string(tok.pos));
          out.push_back(std::move(tok));
          continue;
        }

        if (c == '\'' || c == '"') {
          std::string text;
          std::size_t j = i + 1;
          bool closed = false;
          while (j < src.size()) {
            if (src[j] == '\\' && j + 1 < src.size()) {
              char e = src[j + 1];
              text += (e == 'n') ? '\n' : (e == 't') ? '\t' : e;
              j += 2;
              continue;
            }
            if (src[j] == c) {
              closed = true;
              break;
            }
            text += src[j++];
          }
          if (!closed)
            throw EvaluationError(src, "unterminated string literal");
          tok.type = Tok::String;
          tok.text = std::move(text);
          i = j + 1;
          out.push_back(std::move(tok));
          continue;
        }

        if (isIdentStart(c)) {
          std::size_t j = i;
          while (j < src.size() && isIdentChar(src[j]))
            ++j;
          // dotted access: trials.thisN, mouse.clicked_name
          while (j + 1 < src.size() && src[j] == '.' && isIdentStart(src[j + 1])) {
            ++j;
            while (j < src.size() && isIdentChar(src[j]))
              ++j;
          }
          tok.type = Tok::Ident;
          tok.text = src.substr(i, j - i);
          i = j;
          out.push_back(std::move(tok));
          continue;
        }

        static const char* const twoCharOps[] = { "<=", ">=", "==", "!=", "&&", "||" };
        bool matched = false;
        for (const char* op : twoCharOps) {
          if (src.compare(i, 2, op) == 0) {
            tok.type = Tok::Op;
            tok.text = op;
            i += 2;
            matched = true;
            break;
          }
        }
        if (!matched) {
          if (std::string("+-*/%<>!?:(),").find(c) == std::string::npos)
            throw EvaluationError(src, std::string("unexpected character '") + c + "' at offset " +
                                           std::to_string(i));
          tok.type = Tok::Op;
          tok.text = std::string(1, c);
          ++i;
        }
        out.push_back(std::move(tok));
      }

      Token end;
      end.type = Tok::End;
      end.pos = src.size();
      out.push_back(end);
      return out;
    }

    NodePtr makeNode(NodeKind kind, std::string text, std::vector<NodePtr> children = {}) {
      auto n = std::make_shared<ExprNode>();
      n->kind = kind;
      n->text = std::move(text);
      n->children = std::move(children);
      return n;
    }

    NodePtr makeLiteral(Value v) {
      auto n = std::make_shared<ExprNode>();
      n->kind = NodeKind::Literal;
      n->literal = std::move(v);
      return n;
    }

    const char* const kFunctions[] = { "abs", "min", "max", "round", "floor", "ceil", "int", "str" };

    // ---------------------------------------------------------------
    // Parser
    // Precedence (low → high): ternary, or, and, not, comparison,
    // additive, multiplicative, unary, primary.
    // ---------------------------------------------------------------
    class Parser {
    public:
      Parser(const std::string& src, std::vector<std::string>& names)
          : src_(src), toks_(tokenize(src)), names_(names) {}

      NodePtr parse() {
        if (peek().type == Tok::End)
          throw EvaluationError(src_, "empty expression");
        NodePtr root = ternary();
        if (peek().type != Tok::End)
          fail("unexpected '" + peek().text + "'");
        return root;
      }

    private:
      const Token& peek() const { return toks_[idx_]; }
      Token next() { return toks_[idx_++]; }

      bool acceptOp(const char* op) {
        if (peek().type == Tok::Op && peek().text == op) {
          ++idx_;
          return true;
        }
        return false;
      }

      bool acceptWord(const char* word) {
        if (peek().type == Tok::Ident && peek().text == word) {
          ++idx_;
          return true;
        }
        return false;
      }

      [[noreturn]] void fail(const std::string& why) const {
        throw EvaluationError(src_, why + " at offset " + std::to_string(peek().pos));
      }

      NodePtr ternary() {
        NodePtr cond = logicalOr();
        if (acceptOp("?")) {
          NodePtr a = ternary();
          if (!acceptOp(":"))
            fail("expected ':' in conditional expression");
          NodePtr b = ternary();
          return makeNode(NodeKind::Ternary, "?", { cond, a, b });
        }
        return cond;
      }

      NodePtr logicalOr() {
        NodePtr lhs = logicalAnd();
        while (acceptOp("||") || acceptWord("or"))
          lhs = makeNode(NodeKind::Binary, "or", { lhs, logicalAnd() });
        return lhs;
      }

      NodePtr logicalAnd() {
        NodePtr lhs = logicalNot();
        while (acceptOp("&&") || acceptWord("and"))
          lhs = makeNode(NodeKind::Binary, "and", { lhs, logicalNot() });
        return lhs;
      }

      NodePtr logicalNot() {
        if (acceptOp("!") || acceptWord("not"))
          return makeNode(NodeKind::Unary, "not", { logicalNot() });
        return comparison();
      }

      NodePtr comparison() {
        NodePtr lhs = additive();
        static const char* const ops[] = { "<=", ">=", "==", "!=", "<", ">" };
        for (;;) {
          const char* found = nullptr;
          for (const char* op : ops) {
            if (acceptOp(op)) {
              found = op;
              break;
            }
          }
          if (!found)
            return lhs;
          lhs = makeNode(NodeKind::Binary, found, { lhs, additive() });
        }
      }

      NodePtr additive() {
        NodePtr lhs = multiplicative();
        for (;;) {
          if (acceptOp("+"))
            lhs = makeNode(NodeKind::Binary, "+", { lhs, multiplicative() });
          else if (acceptOp("-"))
            lhs = makeNode(NodeKind::Binary, "-", { lhs, multiplicative() });
          else
            return lhs;
        }
      }

      NodePtr multiplicative() {
        NodePtr lhs = unary();
        for (;;) {
          if (acceptOp("*"))
            lhs = makeNode(NodeKind::Binary, "*", { lhs, unary() });
          else if (acceptOp("/"))
            lhs = makeNode(NodeKind::Binary, "/", { lhs, unary() });
          else if (acceptOp("%"))
            lhs = makeNode(NodeKind::Binary, "%", { lhs, unary() });
          else
            return lhs;
        }
      }

      NodePtr unary() {
        if (acceptOp("-"))
          return makeNode(NodeKind::Unary, "-", { unary() });
        if (acceptOp("+"))
          return makeNode(NodeKind::Unary, "+", { unary() });
        return primary();
      }

      NodePtr primary() {
        const Token& tok = peek();
        switch (tok.type) {
        case Tok::Number:
          return makeLiteral(next().number);
        case Tok::String:
          return makeLiteral(next().text);
        case Tok::Ident:
          return identifier();
        case Tok::Op:
          if (acceptOp("(")) {
            NodePtr inner = ternary();
            if (!acceptOp(")"))
              fail("expected ')'");
            return inner;
          }
          fail("unexpected '" + tok.text + "'");
        case Tok::End:
        default:
          fail("unexpected end of expression");
        }
      }

      NodePtr identifier() {
        Token tok = next();
        if (tok.text == "true" || tok.text == "True")
          return makeLiteral(true);
        if (tok.text == "false" || tok.text == "False")
          return makeLiteral(false);
        if (tok.text == "and" || tok.text == "or" || tok.text == "not")
          fail("unexpected keyword '" + tok.text + "'");

        if (acceptOp("(")) {
          if (std::find_if(std::begin(kFunctions), std::end(kFunctions), [&](const char* f) {
                return tok.text == f;
              }) == std::end(kFunctions))
            throw EvaluationError(src_, "unknown function '" + tok.text + "'");
          std::vector<NodePtr> args;
          if (!acceptOp(")")) {
            do {
              args.push_back(ternary());
            } while (acceptOp(","));
            if (!acceptOp(")"))
              fail("expected ')' after arguments");
          }
          return makeNode(NodeKind::Call, tok.text, std::move(args));
        }

        if (std::find(names_.begin(), names_.end(), tok.text) == names_.end())
          names_.push_back(tok.text);
        return makeNode(NodeKind::Name, tok.text);
      }

      const std::string& src_;
      std::vector<Token> toks_;
      std::size_t idx_{ 0 };
      std::vector<std::string>& names_;
    };

    // ---------------------------------------------------------------
    // Evaluation
    // ---------------------------------------------------------------
    class Interpreter {
    public:
      Interpreter(const std::string& src, const VariableEnvironment& env) : src_(src), env_(env) {}

      Value eval(const ExprNode& n) const {
        switch (n.kind) {
        case NodeKind::Literal:
          return n.literal;
        case NodeKind::Name:
          return env_.get(n.text);
        case NodeKind::Unary:
          return unary(n);
        case NodeKind::Binary:
          return binary(n);
        case NodeKind::Ternary:
          return isTruthy(eval(*n.children[0])) ? eval(*n.children[1]) : eval(*n.children[2]);
        case NodeKind::Call:
          return call(n);
        }
        throw EvaluationError(src_, "corrupt expression tree");
      }

    private:
      double number(const Value& v, const std::string& op) const {
        double d = 0.0;
        if (!asNumber(v, d))
          throw EvaluationError(src_, "operator '" + op + "' expects a number, got " +
                                          toString(typeOf(v)));
        return d;
      }

      Value unary(const ExprNode& n) const {
        Value v = eval(*n.children[0]);
        if (n.text == "not")
          return !isTruthy(v);
        double d = number(v, n.text);
        return n.text == "-" ? -d : d;
      }

      Value binary(const ExprNode& n) const {
        const std::string& op = n.text;

        if (op == "and") {
          if (!isTruthy(eval(*n.children[0])))
            return false;
          return isTruthy(eval(*n.children[1]));
        }
        if (op == "or") {
          if (isTruthy(eval(*n.children[0])))
            return true;
          return isTruthy(eval(*n.children[1]));
        }

        Value a = eval(*n.children[0]);
        Value b = eval(*n.children[1]);

        if (op == "==")
          return looselyEqual(a, b);
        if (op == "!=")
          return !looselyEqual(a, b);

        const auto* sa = std::get_if<std::string>(&a);
        const auto* sb = std::get_if<std::string>(&b);
        if (sa && sb) {
          if (op == "+")
            return *sa + *sb;
          if (op == "<")
            return *sa < *sb;
          if (op == "<=")
            return *sa <= *sb;
          if (op == ">")
            return *sa > *sb;
          if (op == ">=")
            return *sa >= *sb;
          throw EvaluationError(src_, "operator '" + op + "' is not defined for strings");
        }

        double x = number(a, op);
        double y = number(b, op);
        if (op == "+")
          return x + y;
        if (op == "-")
          return x - y;
        if (op == "*")
          return x * y;
        if (op == "/") {
          if (y == 0.0)
            throw EvaluationError(src_, "division by zero");
          return x / y;
        }
        if (op == "%") {
          if (y == 0.0)
            throw EvaluationError(src_, "modulo by zero");
          double r = std::fmod(x, y);
          if (r != 0.0 && ((r < 0) != (y < 0)))
            r += y; // sign follows the divisor
          return r;
        }
        if (op == "<")
          return x < y;
        if (op == "<=")
          return x <= y;
        if (op == ">")
          return x > y;
        if (op == ">=")
          return x >= y;
        throw EvaluationError(src_, "unknown operator '" + op + "'");
      }

      Value call(const ExprNode& n) const {
        const std::string& fn = n.text;
        std::vector<Value> args;
        args.reserve(n.children.size());
        for (const auto& c : n.children)
          args.push_back(eval(*c));

        auto arity = [&](std::size_t expected) {
          if (args.size() != expected)
            throw EvaluationError(src_, fn + "() takes " + std::to_string(expected) +
                                            " argument(s), got " + std::to_string(args.size()));
        };

        if (fn == "str") {
          arity(1);
          return toDisplayString(args[0]);
        }
        if (fn == "min" || fn == "max") {
          if (args.empty())
            throw EvaluationError(src_, fn + "() needs at least one argument");
          double best = number(args[0], fn);
          for (std::size_t i = 1; i < args.size(); ++i) {
            double v = number(args[i], fn);
            best = (fn == "min") ? std::min(best, v) : std::max(best, v);
          }
          return best;
        }

        arity(1);
        if (fn == "int") {
          if (const auto* s = std::get_if<std::string>(&args[0])) {
            const std::size_t sign = (!s->empty() && (s->front() == '-' || s->front() == '+')) ? 1 : 0;
            const std::size_t len = scanDecimal(*s, sign);
            if (len == 0 || sign + len != s->size())
              throw EvaluationError(src_, "int() cannot convert '" + *s + "'");
            return std::trunc(std::strtod(s->c_str(), nullptr));
          }
          return std::trunc(number(args[0], fn));
        }
        double d = number(args[0], fn);
        if (fn == "abs")
          return std::fabs(d);
        if (fn == "round")
          return std::nearbyint(d); // banker's rounding under the default FE mode
        if (fn == "floor")
          return std::floor(d);
        if (fn == "ceil")
          return std::ceil(d);
        throw EvaluationError(src_, "unknown function '" + fn + "'");
      }

      const std::string& src_;
      const VariableEnvironment& env_;
    };

  } // namespace

  CompiledExpression ExpressionEvaluator::compile(const std::string& expr) {
    CompiledExpression compiled;
    compiled.source_ = expr;
    Parser parser(expr, compiled.names_);
    compiled.root_ = parser.parse();
    return compiled;
  }

  Value ExpressionEvaluator::evaluate(const CompiledExpression& expr,
                                      const VariableEnvironment& env) {
    if (expr.empty())
      throw EvaluationError(expr.source(), "expression was never compiled");
    return Interpreter(expr.source(), env).eval(*expr.root_);
  }

  Value ExpressionEvaluator::evaluate(const std::string& expr, const VariableEnvironment& env) {
    return evaluate(compile(expr), env);
  }

  bool ExpressionEvaluator::isValidName(const std::string& name) {
    if (name.empty() || !isIdentStart(name.front()))
      return false;
    bool afterDot = false;
    for (char c : name) {
      if (c == '.') {
        if (afterDot)
          return false;
        afterDot = true;
        continue;
      }
      if (afterDot && !isIdentStart(c))
        return false;
      if (!isIdentChar(c))
        return false;
      afterDot = false;
    }
    if (afterDot)
      return false;
    static const char* const reserved[] = { "and", "or", "not", "true", "false", "True", "False" };
    return std::find(std::begin(reserved), std::end(reserved), name) == std::end(reserved);
  }

} // namespace trialflow::core
