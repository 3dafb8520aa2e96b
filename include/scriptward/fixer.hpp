#pragma once

// scriptward/fixer.hpp - Source repair strategies for the auto-correct loop.
//
// A Fixer looks at the parsed error of a failed attempt and the source that
// produced it, and may propose a replacement source. The controller walks its
// fixers in order and takes the first proposal.

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "scriptward/types.hpp"

namespace scriptward {

// Parses interpreter stderr: type and message come from the last non-empty
// line ("Type: message"), location from the last `File "f", line N` frame,
// raw is the trimmed text cut to raw_cap bytes.
ErrorDetail parse_error_detail(const std::string& stderr_text, std::size_t raw_cap);

// Inserts import_line after a leading shebang and any leading comment or
// blank lines. nullopt when import_line already occurs anywhere in the
// source, e.g. followed by a trailing comment.
std::optional<std::string> prepend_import(const std::string& source, const std::string& import_line);

// Removes one surrounding ``` fence (with optional language tag) and trims.
std::string strip_code_fences(const std::string& text);

struct FixSuggestion {
  std::string source;
  std::string method;
};

// EXTENSION_POINT: fixer_strategy
//   Current: HeuristicFixer, RemoteFixer.
//   Invariant: suggest() never throws for an ordinary "no idea" outcome; it
//   returns nullopt.
class Fixer {
 public:
  virtual ~Fixer() = default;
  virtual std::string name() const = 0;
  virtual std::optional<FixSuggestion> suggest(const ErrorDetail& error,
                                               const std::string& source) const = 0;
};

struct HeuristicRule {
  std::string error_type;
  std::string message_fragment;
  std::string import_line;
  std::string method;
};

// NameError for np / pd / plt.
std::vector<HeuristicRule> default_heuristic_rules();

class HeuristicFixer final : public Fixer {
 public:
  explicit HeuristicFixer(std::vector<HeuristicRule> rules = default_heuristic_rules())
      : rules_(std::move(rules)) {}

  std::string name() const override { return "heuristic"; }
  std::optional<FixSuggestion> suggest(const ErrorDetail& error,
                                       const std::string& source) const override;

 private:
  std::vector<HeuristicRule> rules_;
};

// External "fix suggestion" capability. Absence is normal.
class RemoteFixClient {
 public:
  virtual ~RemoteFixClient() = default;
  virtual std::optional<std::string> suggest_fix(const ErrorDetail& error,
                                                 const std::string& source) const = 0;
};

// Adapts a RemoteFixClient into the fixer chain under method "remote_fixer".
// An empty client pointer yields no fix.
class RemoteFixer final : public Fixer {
 public:
  explicit RemoteFixer(std::shared_ptr<const RemoteFixClient> client) : client_(std::move(client)) {}

  std::string name() const override { return "remote_fixer"; }
  std::optional<FixSuggestion> suggest(const ErrorDetail& error,
                                       const std::string& source) const override;

 private:
  std::shared_ptr<const RemoteFixClient> client_;
};

// Runs `argv... <request.json>` and reads the replacement source from stdout.
// The request file holds {"error":{...},"source":"..."}. A non-zero exit, a
// timeout, a spawn failure or empty output all mean "no fix".
class CommandFixClient final : public RemoteFixClient {
 public:
  CommandFixClient(std::vector<std::string> argv, std::map<std::string, std::string> env,
                   int timeout_seconds, std::size_t output_cap_bytes);

  std::optional<std::string> suggest_fix(const ErrorDetail& error,
                                         const std::string& source) const override;

 private:
  std::vector<std::string> argv_;
  std::map<std::string, std::string> env_;
  int timeout_seconds_;
  std::size_t output_cap_bytes_;
};

}  // namespace scriptward
