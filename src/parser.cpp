#include "scriptward/parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace scriptward {

namespace {

enum class Tok { name, number, string, op, newline, indent, dedent, end };

struct Token {
  Tok kind{Tok::end};
  std::string text;  // identifier/operator/number text; decoded value for strings
  SourcePosition pos;
  bool plain_str{false};  // string literal evaluating to str (no b or f prefix)
};

struct SyntaxFailure {
  std::string message;
  SourcePosition pos;
};

// The expression part of one f-string replacement field, positioned at its
// first character in the enclosing source.
struct EmbeddedExpression {
  std::string text;
  SourcePosition pos;
};

constexpr int kMaxFStringNesting = 8;

constexpr std::array<std::string_view, 35> kKeywords = {
    "False", "None", "True", "and", "as", "assert", "async", "await",
    "break", "class", "continue", "def", "del", "elif", "else", "except",
    "finally", "for", "from", "global", "if", "import", "in", "is",
    "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
    "while", "with", "yield"};

constexpr std::array<std::string_view, 11> kCompoundHeads = {
    "if", "elif", "else", "for", "while", "try", "except", "finally",
    "with", "def", "class"};

// Soft keywords may legitimately be followed directly by an operand.
constexpr std::array<std::string_view, 3> kSoftKeywords = {"match", "case", "type"};

template <size_t N>
bool in_list(const std::array<std::string_view, N>& list, std::string_view word) {
  return std::find(list.begin(), list.end(), word) != list.end();
}

bool is_keyword(const std::string& w) { return in_list(kKeywords, w); }

bool is_ident_start(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c >= 0x80;
}
bool is_ident_char(unsigned char c) {
  return is_ident_start(c) || (c >= '0' && c <= '9');
}
bool is_digit(unsigned char c) { return c >= '0' && c <= '9'; }

// Decode the escapes that matter for path inspection. Unknown escapes stay
// verbatim, as the interpreter keeps them.
std::string decode_escapes(std::string_view body) {
  std::string out;
  out.reserve(body.size());
  for (size_t i = 0; i < body.size(); ++i) {
    const char c = body[i];
    if (c != '\\' || i + 1 >= body.size()) {
      out += c;
      continue;
    }
    const char n = body[++i];
    switch (n) {
      case '\\': out += '\\'; break;
      case '\'': out += '\''; break;
      case '"': out += '"'; break;
      case 'n': out += '\n'; break;
      case 't': out += '\t'; break;
      case 'r': out += '\r'; break;
      case '0': out += '\0'; break;
      case '\n': break;  // line continuation inside the literal
      default:
        out += '\\';
        out += n;
    }
  }
  return out;
}

// Pulls the replacement-field expressions out of an f-string body (the raw
// text between the quotes). `{{` and `}}` are literal braces; a field ends its
// expression at a top-level `!` conversion, `:` format spec, `=` debug marker
// or the closing `}`. Fields nested in a format spec are collected too.
class FieldScanner {
 public:
  FieldScanner(std::string_view body, SourcePosition start, bool raw,
               std::vector<EmbeddedExpression>& out)
      : b_(body), raw_(raw), out_(out), line_(start.line), col_base_(start.column) {}

  bool run() {
    size_t j = 0;
    while (j < b_.size()) {
      const char c = b_[j];
      if (c == '\\' && !raw_ && j + 1 < b_.size()) {
        if (b_[j + 1] == 'N' && j + 2 < b_.size() && b_[j + 2] == '{') {
          const size_t close = b_.find('}', j + 3);
          j = close == std::string_view::npos ? b_.size() : close + 1;
        } else {
          j += (b_[j + 1] == '{' || b_[j + 1] == '}') ? 1 : 2;
        }
        continue;
      }
      if (c == '{') {
        if (j + 1 < b_.size() && b_[j + 1] == '{') {
          j += 2;
          continue;
        }
        if (!field(j + 1, &j)) return false;
        continue;
      }
      ++j;
    }
    return true;
  }

  const std::string& message() const { return message_; }
  SourcePosition error_pos() const { return error_pos_; }

 private:
  // from is the first character after '{'; *next receives the index just
  // past the matching '}'.
  bool field(size_t from, size_t* next) {
    int depth = 0;
    size_t k = from;
    size_t expr_end = std::string_view::npos;
    while (k < b_.size() && expr_end == std::string_view::npos) {
      const char c = b_[k];
      if (c == '\'' || c == '"') {
        k = skip_quoted(k);
        continue;
      }
      if (c == '(' || c == '[' || c == '{') ++depth;
      if (c == ')' || c == ']') --depth;
      if (c == '}') {
        if (depth == 0) {
          expr_end = k;
          break;
        }
        --depth;
      }
      if (depth == 0) {
        const char n = k + 1 < b_.size() ? b_[k + 1] : '\0';
        const char p = k > from ? b_[k - 1] : '\0';
        if ((c == '!' && n != '=') || c == ':' ||
            (c == '=' && n != '=' && p != '=' && p != '!' && p != '<' && p != '>')) {
          expr_end = k;
          break;
        }
      }
      ++k;
    }
    if (expr_end == std::string_view::npos) return fail("f-string: expecting '}'", from - 1);

    const std::string_view expr = b_.substr(from, expr_end - from);
    if (expr.find_first_not_of(" \t\n") == std::string_view::npos) {
      return fail("f-string: valid expression required before '" + std::string(1, b_[expr_end]) + "'",
                  expr_end);
    }
    out_.push_back(EmbeddedExpression{std::string(expr), position_of(from)});

    // Conversion, debug marker and format spec up to the closing brace.
    k = expr_end;
    while (k < b_.size()) {
      if (b_[k] == '}') {
        *next = k + 1;
        return true;
      }
      if (b_[k] == '{') {
        if (!field(k + 1, &k)) return false;
        continue;
      }
      ++k;
    }
    return fail("f-string: expecting '}'", from - 1);
  }

  // k points at a quote inside an expression; returns the index past the
  // closing quote, or the end of the body.
  size_t skip_quoted(size_t k) const {
    const char q = b_[k];
    const bool triple = k + 2 < b_.size() && b_[k + 1] == q && b_[k + 2] == q;
    k += triple ? 3 : 1;
    while (k < b_.size()) {
      if (b_[k] == '\\') {
        k += 2;
        continue;
      }
      if (b_[k] == q) {
        if (!triple) return k + 1;
        if (k + 2 < b_.size() && b_[k + 1] == q && b_[k + 2] == q) return k + 3;
      }
      ++k;
    }
    return b_.size();
  }

  // Offsets are requested in increasing order, so line counting is linear.
  SourcePosition position_of(size_t off) {
    for (; cursor_ < off && cursor_ < b_.size(); ++cursor_) {
      if (b_[cursor_] == '\n') {
        ++line_;
        line_start_ = cursor_ + 1;
        first_line_ = false;
      }
    }
    const int col = static_cast<int>(off - line_start_) + 1;
    return SourcePosition{line_, first_line_ ? col_base_ + col - 1 : col};
  }

  bool fail(const std::string& message, size_t off) {
    message_ = message;
    error_pos_ = position_of(std::max(off, cursor_));
    return false;
  }

  std::string_view b_;
  bool raw_;
  std::vector<EmbeddedExpression>& out_;
  int line_;
  int col_base_;
  size_t cursor_{0};
  size_t line_start_{0};
  bool first_line_{true};
  std::string message_;
  SourcePosition error_pos_;
};

class Lexer {
 public:
  explicit Lexer(const std::string& src) : s_(src) {}

  bool run(std::vector<Token>& out, std::vector<EmbeddedExpression>& fields, SyntaxFailure& fail) {
    out_ = &out;
    fields_ = &fields;
    fail_ = &fail;
    if (s_.compare(0, 3, "\xEF\xBB\xBF") == 0) i_ = 3;
    line_start_ = i_;
    while (true) {
      if (at_line_start_ && brackets_.empty()) {
        if (!handle_indentation()) return false;
        if (i_ >= s_.size()) break;
        if (at_line_start_) continue;  // blank or comment-only line consumed
      }
      if (i_ >= s_.size()) break;
      const unsigned char c = static_cast<unsigned char>(s_[i_]);
      if (c == ' ' || c == '\t' || c == '\f') { ++i_; continue; }
      if (c == '#') { skip_comment(); continue; }
      if (c == '\\') {
        if (i_ + 1 < s_.size() && s_[i_ + 1] == '\n') {
          i_ += 2;
          new_line();
          continue;
        }
        return failure("unexpected character after line continuation character", here());
      }
      if (c == '\n') {
        if (brackets_.empty()) emit_newline(here());
        ++i_;
        new_line();
        if (brackets_.empty()) at_line_start_ = true;
        continue;
      }
      if (is_ident_start(c)) {
        if (!lex_name_or_prefixed_string()) return false;
        continue;
      }
      if (is_digit(c) || (c == '.' && i_ + 1 < s_.size() && is_digit(static_cast<unsigned char>(s_[i_ + 1])))) {
        lex_number();
        continue;
      }
      if (c == '"' || c == '\'') {
        if (!lex_string(i_, here(), "")) return false;
        continue;
      }
      if (!lex_operator()) return false;
    }

    if (!brackets_.empty()) {
      const auto& [ch, pos] = brackets_.back();
      return failure(std::string("'") + ch + "' was never closed", pos);
    }
    emit_newline(here());
    while (indents_.size() > 1) {
      indents_.pop_back();
      push(Tok::dedent, "", here());
    }
    push(Tok::end, "", here());
    return true;
  }

 private:
  SourcePosition here() const {
    return SourcePosition{line_, static_cast<int>(i_ - line_start_) + 1};
  }

  void new_line() {
    ++line_;
    line_start_ = i_;
  }

  bool failure(const std::string& message, SourcePosition pos) {
    fail_->message = message;
    fail_->pos = pos;
    return false;
  }

  void push(Tok kind, std::string text, SourcePosition pos, bool plain = false) {
    out_->push_back(Token{kind, std::move(text), pos, plain});
  }

  void emit_newline(SourcePosition pos) {
    if (out_->empty()) return;
    const Tok last = out_->back().kind;
    if (last == Tok::newline || last == Tok::indent || last == Tok::dedent) return;
    push(Tok::newline, "", pos);
  }

  void skip_comment() {
    while (i_ < s_.size() && s_[i_] != '\n') ++i_;
  }

  // Measures the indentation of a new logical line and emits INDENT/DEDENT.
  // Blank and comment-only lines are consumed without tokens.
  bool handle_indentation() {
    int col = 0;
    while (i_ < s_.size()) {
      const char c = s_[i_];
      if (c == ' ') ++col;
      else if (c == '\t') col = (col / 8 + 1) * 8;
      else if (c == '\f') col = 0;
      else break;
      ++i_;
    }
    if (i_ >= s_.size()) return true;
    if (s_[i_] == '#' || s_[i_] == '\n') {
      skip_comment();
      if (i_ < s_.size()) {
        ++i_;
        new_line();
      }
      return true;  // stays at line start
    }
    if (s_[i_] == '\\' && i_ + 1 < s_.size() && s_[i_ + 1] == '\n') {
      at_line_start_ = false;
      return true;
    }
    at_line_start_ = false;
    const SourcePosition pos = here();
    if (col > indents_.back()) {
      indents_.push_back(col);
      push(Tok::indent, "", pos);
    } else if (col < indents_.back()) {
      while (indents_.size() > 1 && col < indents_.back()) {
        indents_.pop_back();
        push(Tok::dedent, "", pos);
      }
      if (col != indents_.back()) {
        return failure("unindent does not match any outer indentation level", pos);
      }
    }
    return true;
  }

  bool lex_name_or_prefixed_string() {
    const SourcePosition pos = here();
    const size_t start = i_;
    while (i_ < s_.size() && is_ident_char(static_cast<unsigned char>(s_[i_]))) ++i_;
    std::string word = s_.substr(start, i_ - start);
    if (i_ < s_.size() && (s_[i_] == '"' || s_[i_] == '\'') && word.size() <= 2) {
      std::string lower = word;
      for (auto& ch : lower) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
      static constexpr std::array<std::string_view, 8> kPrefixes = {
          "r", "u", "b", "f", "br", "rb", "fr", "rf"};
      if (in_list(kPrefixes, lower)) return lex_string(i_, pos, lower);
    }
    push(Tok::name, std::move(word), pos);
    return true;
  }

  void lex_number() {
    const SourcePosition pos = here();
    const size_t start = i_;
    const bool hex = s_.compare(i_, 2, "0x") == 0 || s_.compare(i_, 2, "0X") == 0;
    while (i_ < s_.size()) {
      const unsigned char c = static_cast<unsigned char>(s_[i_]);
      if (is_ident_char(c) || c == '.') {
        ++i_;
        continue;
      }
      const char prev = s_[i_ - 1];
      if ((c == '+' || c == '-') && !hex && (prev == 'e' || prev == 'E')) {
        ++i_;
        continue;
      }
      break;
    }
    push(Tok::number, s_.substr(start, i_ - start), pos);
  }

  // quote_at points at the opening quote; prefix is lower-case.
  bool lex_string(size_t quote_at, SourcePosition pos, const std::string& prefix) {
    const char q = s_[quote_at];
    const bool raw = prefix.find('r') != std::string::npos;
    const bool plain = prefix.find('b') == std::string::npos && prefix.find('f') == std::string::npos;
    const bool triple = quote_at + 2 < s_.size() && s_[quote_at + 1] == q && s_[quote_at + 2] == q;
    i_ = quote_at + (triple ? 3 : 1);
    const size_t body_start = i_;
    const SourcePosition body_pos = here();
    while (true) {
      if (i_ >= s_.size()) {
        const std::string kind = triple ? "unterminated triple-quoted string literal" : "unterminated string literal";
        return failure(kind + " (detected at line " + std::to_string(line_) + ")", pos);
      }
      const char c = s_[i_];
      if (c == '\\' && i_ + 1 < s_.size()) {
        const bool escaped_newline = s_[i_ + 1] == '\n';
        i_ += 2;
        if (escaped_newline) new_line();
        continue;
      }
      if (c == '\n') {
        if (!triple) {
          return failure("unterminated string literal (detected at line " + std::to_string(line_) + ")", pos);
        }
        ++i_;
        new_line();
        continue;
      }
      if (c == q) {
        if (!triple) break;
        if (i_ + 2 < s_.size() && s_[i_ + 1] == q && s_[i_ + 2] == q) break;
      }
      ++i_;
    }
    const std::string_view body(s_.data() + body_start, i_ - body_start);
    if (prefix.find('f') != std::string::npos) {
      FieldScanner fields(body, body_pos, raw, *fields_);
      if (!fields.run()) return failure(fields.message(), fields.error_pos());
    }
    i_ += triple ? 3 : 1;
    push(Tok::string, raw ? std::string(body) : decode_escapes(body), pos, plain);
    return true;
  }

  bool lex_operator() {
    static constexpr std::array<std::string_view, 5> kThree = {"**=", "//=", ">>=", "<<=", "..."};
    static constexpr std::array<std::string_view, 19> kTwo = {
        "**", "//", ">>", "<<", "<=", ">=", "==", "!=", "->", "+=",
        "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=", ":="};
    static constexpr std::string_view kOne = "+-*/%@&|^~<>,:;.=()[]{}";

    const SourcePosition pos = here();
    const std::string_view rest(s_.data() + i_, s_.size() - i_);
    for (auto op : kThree) {
      if (rest.substr(0, 3) == op) {
        i_ += 3;
        push(Tok::op, std::string(op), pos);
        return true;
      }
    }
    for (auto op : kTwo) {
      if (rest.substr(0, 2) == op) {
        i_ += 2;
        push(Tok::op, std::string(op), pos);
        return true;
      }
    }
    const char c = s_[i_];
    if (kOne.find(c) == std::string_view::npos) {
      if (c == '$' || c == '?' || c == '`' || c == '!') return failure("invalid syntax", pos);
      return failure("invalid non-printable character", pos);
    }
    if (c == '(' || c == '[' || c == '{') {
      brackets_.emplace_back(c, pos);
    } else if (c == ')' || c == ']' || c == '}') {
      if (brackets_.empty()) return failure(std::string("unmatched '") + c + "'", pos);
      const char open = brackets_.back().first;
      const char expected = open == '(' ? ')' : open == '[' ? ']' : '}';
      if (c != expected) {
        return failure(std::string("closing parenthesis '") + c +
                           "' does not match opening parenthesis '" + open + "'",
                       pos);
      }
      brackets_.pop_back();
    }
    ++i_;
    push(Tok::op, std::string(1, c), pos);
    return true;
  }

  const std::string& s_;
  size_t i_{0};
  size_t line_start_{0};
  int line_{1};
  bool at_line_start_{true};
  std::vector<int> indents_{0};
  std::vector<std::pair<char, SourcePosition>> brackets_;
  std::vector<Token>* out_{nullptr};
  std::vector<EmbeddedExpression>* fields_{nullptr};
  SyntaxFailure* fail_{nullptr};
};

bool is_op(const Token& t, std::string_view op) { return t.kind == Tok::op && t.text == op; }
bool is_kw(const Token& t, std::string_view kw) { return t.kind == Tok::name && t.text == kw; }

bool is_name_operand(const Token& t) {
  return t.kind == Tok::name &&
         (!is_keyword(t.text) || t.text == "True" || t.text == "False" || t.text == "None");
}
bool is_operand(const Token& t) {
  return is_name_operand(t) || t.kind == Tok::number || t.kind == Tok::string;
}

// Walks the token stream one logical line at a time and collects imports and
// calls. Token ranges are half-open [b, e).
class StatementScanner {
 public:
  StatementScanner(const std::vector<Token>& toks, ParseOutcome& out, SyntaxFailure& fail)
      : t_(toks), out_(out), fail_(fail) {}

  bool run() {
    size_t k = 0;
    bool expect_indent = false;
    while (k < t_.size() && t_[k].kind != Tok::end) {
      if (t_[k].kind == Tok::dedent) {
        if (expect_indent) return failure("expected an indented block", t_[k].pos);
        ++k;
        continue;
      }
      if (t_[k].kind == Tok::indent) {
        if (!expect_indent) return failure("unexpected indent", t_[k].pos);
        expect_indent = false;
        ++k;
        continue;
      }
      if (expect_indent) return failure("expected an indented block", t_[k].pos);

      size_t e = k;
      while (e < t_.size() && t_[e].kind != Tok::newline && t_[e].kind != Tok::end) ++e;
      if (!scan_logical_line(k, e)) return false;
      expect_indent = e > k && is_op(t_[e - 1], ":");
      k = (e < t_.size() && t_[e].kind == Tok::newline) ? e + 1 : e;
    }
    if (expect_indent) {
      const SourcePosition pos = t_.empty() ? SourcePosition{1, 1} : t_.back().pos;
      return failure("expected an indented block", pos);
    }
    return true;
  }

 private:
  bool failure(const std::string& message, SourcePosition pos) {
    fail_.message = message;
    fail_.pos = pos;
    return false;
  }

  // Splits on ';' at bracket depth 0.
  bool scan_logical_line(size_t b, size_t e) {
    int depth = 0;
    size_t start = b;
    for (size_t k = b; k < e; ++k) {
      const Token& t = t_[k];
      if (t.kind == Tok::op && (t.text == "(" || t.text == "[" || t.text == "{")) ++depth;
      if (t.kind == Tok::op && (t.text == ")" || t.text == "]" || t.text == "}")) --depth;
      if (depth == 0 && is_op(t, ";")) {
        if (k == start) return failure("invalid syntax", t.pos);
        if (!scan_statement(start, k)) return false;
        start = k + 1;
      }
    }
    if (start < e) return scan_statement(start, e);
    return true;
  }

  bool scan_statement(size_t b, size_t e) {
    const Token& first = t_[b];
    size_t head = b;
    if (is_kw(first, "async") && b + 1 < e) head = b + 1;
    if (t_[head].kind == Tok::name && in_list(kCompoundHeads, t_[head].text)) {
      return scan_compound(b, head, e);
    }
    if (is_kw(first, "import")) return scan_import(b, e);
    if (is_kw(first, "from")) return scan_from_import(b, e);
    return scan_expression_tokens(b, e);
  }

  bool scan_compound(size_t b, size_t head, size_t e) {
    const std::string& kw = t_[head].text;
    if ((kw == "def" || kw == "class") &&
        (head + 1 >= e || t_[head + 1].kind != Tok::name || is_keyword(t_[head + 1].text))) {
      const SourcePosition pos = head + 1 < e ? t_[head + 1].pos : t_[head].pos;
      return failure("invalid syntax", pos);
    }

    int depth = 0;
    int pending_lambdas = 0;
    size_t colon = e;
    for (size_t k = head + 1; k < e; ++k) {
      const Token& t = t_[k];
      if (t.kind == Tok::op && (t.text == "(" || t.text == "[" || t.text == "{")) ++depth;
      if (t.kind == Tok::op && (t.text == ")" || t.text == "]" || t.text == "}")) --depth;
      if (depth != 0) continue;
      if (is_kw(t, "lambda")) ++pending_lambdas;
      if (is_op(t, ":")) {
        if (pending_lambdas > 0) {
          --pending_lambdas;
          continue;
        }
        colon = k;
        break;
      }
    }
    if (colon == e) return failure("expected ':'", t_[e - 1].pos);
    if ((kw == "else" || kw == "try" || kw == "finally") && colon != head + 1) {
      return failure("expected ':'", t_[head + 1].pos);
    }

    // Header: skip the defined name so `def eval(...)` is not a call.
    size_t header_begin = head + 1;
    if (kw == "def" || kw == "class") header_begin = head + 2;
    if (!scan_expression_tokens(header_begin, colon)) return false;

    // One-line body after the header colon.
    if (colon + 1 < e) return scan_statement(colon + 1, e);
    return true;
  }

  // import a.b [as c], d
  bool scan_import(size_t b, size_t e) {
    size_t k = b + 1;
    while (true) {
      if (k >= e || !is_name_operand(t_[k])) {
        return failure("invalid syntax", k < e ? t_[k].pos : t_[b].pos);
      }
      std::string module = t_[k].text;
      ++k;
      while (k + 1 < e && is_op(t_[k], ".") && is_name_operand(t_[k + 1])) {
        module += "." + t_[k + 1].text;
        k += 2;
      }
      out_.imports.push_back(module);
      if (k < e && is_kw(t_[k], "as")) {
        if (k + 1 >= e || !is_name_operand(t_[k + 1])) {
          return failure("invalid syntax", t_[k].pos);
        }
        k += 2;
      }
      if (k >= e) return true;
      if (!is_op(t_[k], ",")) return failure("invalid syntax", t_[k].pos);
      ++k;
    }
  }

  // from [.]*a.b import x [as y], ... | from . import (x, y) | from a import *
  bool scan_from_import(size_t b, size_t e) {
    size_t k = b + 1;
    bool relative = false;
    while (k < e && (is_op(t_[k], ".") || is_op(t_[k], "..."))) {
      relative = true;
      ++k;
    }
    std::string module;
    if (k < e && is_name_operand(t_[k])) {
      module = t_[k].text;
      ++k;
      while (k + 1 < e && is_op(t_[k], ".") && is_name_operand(t_[k + 1])) {
        module += "." + t_[k + 1].text;
        k += 2;
      }
    }
    if (module.empty() && !relative) {
      return failure("invalid syntax", k < e ? t_[k].pos : t_[b].pos);
    }
    if (k >= e || !is_kw(t_[k], "import")) {
      return failure("invalid syntax", k < e ? t_[k].pos : t_[e - 1].pos);
    }
    if (k + 1 >= e) return failure("invalid syntax", t_[k].pos);
    out_.imports.push_back(module);
    return true;
  }

  bool scan_expression_tokens(size_t b, size_t e) {
    for (size_t k = b; k < e; ++k) {
      const Token& t = t_[k];
      if (k > b) {
        const Token& prev = t_[k - 1];
        const bool prev_soft = prev.kind == Tok::name && in_list(kSoftKeywords, prev.text);
        if (!prev_soft && is_operand(prev) && (is_name_operand(t) || t.kind == Tok::number)) {
          return failure("invalid syntax", t.pos);
        }
        if (!prev_soft && (is_name_operand(prev) || prev.kind == Tok::number) && t.kind == Tok::string) {
          return failure("invalid syntax", t.pos);
        }
      }
      if (t.kind == Tok::name && !is_keyword(t.text) && k + 1 < e && is_op(t_[k + 1], "(") &&
          (k == b || !is_op(t_[k - 1], "."))) {
        out_.calls.push_back(CallSite{t.text, t.pos, first_literal_after(k + 1, e)});
      }
      if (is_op(t, "(") && (k == b || opens_group(t_[k - 1]))) record_grouped_callee(k, e);
    }
    return true;
  }

  // A '(' after one of these is a grouping parenthesis, not a call or a
  // subscript continuation.
  static bool opens_group(const Token& prev) {
    if (prev.kind == Tok::op) return prev.text != ")" && prev.text != "]" && prev.text != "}";
    return prev.kind == Tok::name && is_keyword(prev.text) && !is_name_operand(prev);
  }

  // (eval)(...), ((open))(...): a bare name inside grouping parentheses that
  // is then called.
  void record_grouped_callee(size_t open, size_t e) {
    size_t k = open;
    size_t groups = 0;
    while (k < e && is_op(t_[k], "(")) {
      ++groups;
      ++k;
    }
    if (k >= e || t_[k].kind != Tok::name || is_keyword(t_[k].text)) return;
    const size_t name = k++;
    for (; groups > 0; --groups, ++k) {
      if (k >= e || !is_op(t_[k], ")")) return;
    }
    if (k >= e || !is_op(t_[k], "(")) return;
    out_.calls.push_back(CallSite{t_[name].text, t_[name].pos, first_literal_after(k, e)});
  }

  // paren points at '('. The first argument counts only when it is a run of
  // plain string literals, optionally wrapped in grouping parentheses, and
  // terminated by ',' or ')'.
  std::optional<std::string> first_literal_after(size_t paren, size_t e) const {
    size_t k = paren + 1;
    size_t groups = 0;
    while (k < e && is_op(t_[k], "(")) {
      ++groups;
      ++k;
    }
    std::string value;
    bool any = false;
    while (k < e && t_[k].kind == Tok::string) {
      if (!t_[k].plain_str) return std::nullopt;
      value += t_[k].text;
      any = true;
      ++k;
    }
    for (; groups > 0; --groups, ++k) {
      if (k >= e || !is_op(t_[k], ")")) return std::nullopt;
    }
    if (!any || k >= e) return std::nullopt;
    if (!is_op(t_[k], ",") && !is_op(t_[k], ")")) return std::nullopt;
    return value;
  }

  const std::vector<Token>& t_;
  ParseOutcome& out_;
  SyntaxFailure& fail_;
};

std::string normalize_newlines(const std::string& source) {
  std::string out;
  out.reserve(source.size());
  for (size_t i = 0; i < source.size(); ++i) {
    if (source[i] == '\r') {
      out += '\n';
      if (i + 1 < source.size() && source[i + 1] == '\n') ++i;
    } else {
      out += source[i];
    }
  }
  return out;
}

std::string line_text(const std::string& source, int line) {
  size_t start = 0;
  for (int l = 1; l < line; ++l) {
    start = source.find('\n', start);
    if (start == std::string::npos) return {};
    ++start;
  }
  size_t end = source.find('\n', start);
  if (end == std::string::npos) end = source.size();
  return source.substr(start, end - start);
}

}  // namespace

namespace {

// A field expression is parsed wrapped in parentheses, so on its first line
// columns shift left by one.
SourcePosition shift_into(SourcePosition inner, SourcePosition origin) {
  if (inner.line <= 1) {
    return SourcePosition{origin.line, std::max(1, origin.column + inner.column - 2)};
  }
  return SourcePosition{origin.line + inner.line - 1, inner.column};
}

ParseOutcome parse_normalized(const std::string& text, int nesting) {
  ParseOutcome out;
  std::vector<Token> tokens;
  std::vector<EmbeddedExpression> fields;
  SyntaxFailure fail;
  Lexer lexer(text);
  bool ok = lexer.run(tokens, fields, fail);
  if (ok) {
    StatementScanner scanner(tokens, out, fail);
    ok = scanner.run();
  }
  for (size_t i = 0; ok && i < fields.size(); ++i) {
    const EmbeddedExpression& field = fields[i];
    if (nesting >= kMaxFStringNesting) {
      fail = SyntaxFailure{"f-string: expressions nested too deeply", field.pos};
      ok = false;
      break;
    }
    const ParseOutcome inner = parse_normalized("(" + field.text + ")", nesting + 1);
    if (!inner.ok) {
      const bool tagged = inner.message.rfind("f-string:", 0) == 0;
      fail = SyntaxFailure{tagged ? inner.message : "f-string: " + inner.message,
                           shift_into(inner.position, field.pos)};
      ok = false;
      break;
    }
    out.imports.insert(out.imports.end(), inner.imports.begin(), inner.imports.end());
    for (CallSite call : inner.calls) {
      call.position = shift_into(call.position, field.pos);
      out.calls.push_back(std::move(call));
    }
  }
  if (!ok) {
    ParseOutcome failed;
    failed.ok = false;
    failed.message = fail.message;
    failed.position = fail.pos;
    failed.source_line = line_text(text, fail.pos.line);
    return failed;
  }
  out.ok = true;
  return out;
}

}  // namespace

ParseOutcome PythonTokenParser::parse(const std::string& source) const {
  return parse_normalized(normalize_newlines(source), 0);
}

}  // namespace scriptward
