#pragma once

// scriptward/autocorrect.hpp - Auto-Correct Controller.
//
// STATE MACHINE:
//   VALIDATING -> EXECUTING -> { SUCCEEDED | RETRY | FATAL }
//
//   VALIDATING (original source): a validation or dependency failure is FATAL
//     with one synthetic attempt; nothing is executed.
//   EXECUTING: ok -> SUCCEEDED. timeout -> FATAL whatever the budget. error
//     with budget left and auto-correct on -> RETRY, else FATAL.
//   RETRY: first fixer proposal wins. The proposal goes back through
//     validation and dependency checks; a rejected proposal is FATAL without
//     another execution and is recorded as autocorrect{applied:false}.
//
// Every Attempt is handed to the AttemptSink exactly once, before the next
// state is entered.

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "scriptward/fixer.hpp"
#include "scriptward/resolver.hpp"
#include "scriptward/types.hpp"
#include "scriptward/validator.hpp"

namespace scriptward {

struct AttemptOutcome {
  RunStatus status{RunStatus::error};  // ok, error or timeout
  std::string stdout_text;
  std::string stderr_text;
  double execution_time_seconds{0.0};
  // Paths created or modified during this execution, relative to the run
  // directory, sorted.
  std::vector<std::string> changed_paths;
};

// Executes one source in the run's sandbox. Throws EngineError on
// infrastructure failure (cannot write the source, cannot spawn).
class AttemptRunner {
 public:
  virtual ~AttemptRunner() = default;
  virtual AttemptOutcome run(const std::string& source, int timeout_seconds) = 0;
};

using AttemptSink = std::function<void(const Attempt&)>;

struct ControllerLimits {
  std::size_t output_cap_bytes{200000};
  std::size_t preview_cap_bytes{50000};
  std::size_t error_raw_cap_bytes{20000};
};

struct ControllerOutcome {
  RunStatus status{RunStatus::error};
  std::vector<Attempt> attempts;
  ValidationResult validation;  // last validation computed
  std::vector<std::string> missing_dependencies;
  std::string stdout_text;
  std::string stderr_text;
  double execution_time_seconds{0.0};
  std::vector<std::string> created_paths;  // from the ok attempt only
};

class AutoCorrectController {
 public:
  AutoCorrectController(const Validator& validator, const ModuleResolver& resolver,
                        std::vector<std::shared_ptr<const Fixer>> fixers, ControllerLimits limits)
      : validator_(validator),
        resolver_(resolver),
        fixers_(std::move(fixers)),
        limits_(limits) {}

  // timeout_seconds and max_attempts are clamped here.
  ControllerOutcome run(const std::string& source, int timeout_seconds, bool auto_correct,
                        int max_attempts, AttemptRunner& runner, const AttemptSink& sink) const;

 private:
  Attempt synthetic_attempt(const std::string& source, RunStatus status,
                            const std::string& error_type, const std::string& stderr_text) const;

  const Validator& validator_;
  const ModuleResolver& resolver_;
  std::vector<std::shared_ptr<const Fixer>> fixers_;
  ControllerLimits limits_;
};

}  // namespace scriptward
