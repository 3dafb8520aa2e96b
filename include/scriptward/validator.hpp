#pragma once

// scriptward/validator.hpp - Static Validator.
//
// Produces a fresh ValidationResult for every source it sees. Checks run only
// after a successful parse, in a fixed order: dangerous textual patterns,
// denylisted imports (one combined reason), denylisted calls, unsafe literal
// open() paths. The result is ok iff no reason was produced.

#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "scriptward/config.hpp"
#include "scriptward/parser.hpp"
#include "scriptward/types.hpp"

namespace scriptward {

class Validator {
 public:
  // Throws EngineError(config_invalid) if a dangerous pattern does not
  // compile. validate_config() reports the same condition without throwing.
  Validator(ValidationPolicy policy, std::shared_ptr<const Parser> parser);

  ValidationResult validate(const std::string& source) const;

  const ValidationPolicy& policy() const { return policy_; }
  bool is_denied_module(const std::string& root) const;

 private:
  ValidationPolicy policy_;
  std::shared_ptr<const Parser> parser_;
  std::vector<std::pair<std::string, std::regex>> patterns_;
};

// Root identifier of a dotted module name: "a.b.c" -> "a".
std::string module_root(const std::string& module);

// True for literal paths that escape the run directory: absolute, home,
// UNC/backslash-rooted, or containing "..".
bool is_unsafe_literal_path(const std::string& path);

}  // namespace scriptward
