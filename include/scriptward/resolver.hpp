#pragma once

// scriptward/resolver.hpp - Dependency Resolver.
//
// Runs after a passing validation and before any guest process: decides which
// import roots the guest runtime cannot locate. Nothing is imported.

#include <map>
#include <string>
#include <vector>

#include "scriptward/validator.hpp"

namespace scriptward {

// EXTENSION_POINT: module_resolution
//   Current: InterpreterModuleResolver (asks the configured interpreter).
//   Upgrade path: a resolver backed by a precomputed module inventory.
//   Invariant: must not execute guest-controlled code.
class ModuleResolver {
 public:
  virtual ~ModuleResolver() = default;

  // Returns the subset of roots that cannot be located. Order unspecified.
  // Throws EngineError(spawn_failed) when resolution is impossible altogether.
  virtual std::vector<std::string> unresolvable(const std::vector<std::string>& roots) const = 0;
};

// Asks `<interpreter> -I -c <script> root...`, run under the Sandbox
// Executor. The script reports every root importlib.util.find_spec() locates;
// any root it does not confirm (including when the script crashes or times
// out) is unresolvable.
class InterpreterModuleResolver final : public ModuleResolver {
 public:
  InterpreterModuleResolver(std::string interpreter, std::map<std::string, std::string> env,
                            int timeout_seconds);

  std::vector<std::string> unresolvable(const std::vector<std::string>& roots) const override;

 private:
  std::string interpreter_;
  std::map<std::string, std::string> env_;
  int timeout_seconds_;
};

// Skips roots on the validator's module denylist, asks the resolver about the
// rest, returns the sorted, deduplicated unresolvable roots.
std::vector<std::string> find_missing_dependencies(const std::vector<std::string>& imports,
                                                   const Validator& validator,
                                                   const ModuleResolver& resolver);

}  // namespace scriptward
