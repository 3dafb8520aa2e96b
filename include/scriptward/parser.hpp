#pragma once

// scriptward/parser.hpp - Guest-language parsing capability.
//
// The Static Validator only needs a syntax verdict plus two facts about the
// source: which modules it imports and which plain names it calls. Parser
// produces exactly that summary, so a different guest language plugs in by
// providing another implementation.
//
// EXTENSION_POINT: guest_language
//   Current: PythonTokenParser, a tokenizer plus statement-level checks for
//   Python 3. It rejects the malformed input the interpreter would reject at
//   compile time in the common cases (unterminated strings, bracket mismatch,
//   indentation errors, missing ':' on block headers, adjacent operands).
//   It is not a full grammar: anything it accepts that the interpreter
//   rejects surfaces at execution time as an ordinary SyntaxError in stderr.

#include <optional>
#include <string>
#include <vector>

namespace scriptward {

struct SourcePosition {
  int line{0};    // 1-based
  int column{0};  // 1-based, in bytes
};

// A call whose callee is a bare name: eval(...), open(...), also when the
// name sits in grouping parentheses, (eval)(...). Calls inside f-string
// replacement fields are included. Attribute calls such as obj.eval(...) are
// not recorded.
struct CallSite {
  std::string name;
  SourcePosition position;
  // First positional argument when it is a plain (non-bytes, non-f) string
  // literal, with escapes decoded and implicit concatenation applied.
  std::optional<std::string> first_literal;
};

struct ParseOutcome {
  bool ok{false};
  std::string message;
  SourcePosition position;
  std::string source_line;  // text of the offending line, no trailing newline
  // Module names as written in `import a.b` / `from a.b import c`. Relative
  // imports keep only the part after the dots; `from . import x` yields "".
  std::vector<std::string> imports;
  std::vector<CallSite> calls;
};

class Parser {
 public:
  virtual ~Parser() = default;
  virtual ParseOutcome parse(const std::string& source) const = 0;
};

class PythonTokenParser final : public Parser {
 public:
  ParseOutcome parse(const std::string& source) const override;
};

}  // namespace scriptward
