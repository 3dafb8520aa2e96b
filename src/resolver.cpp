#include "scriptward/resolver.hpp"

#include <algorithm>
#include <set>
#include <sstream>

#include "scriptward/sandbox.hpp"

namespace scriptward {

namespace {

// Prints "+<root>" for each root that find_spec locates. Errors raised by
// find_spec (broken parent packages, bad names) leave the root unconfirmed.
constexpr const char* kLookupScript =
    "import importlib.util, sys\n"
    "for n in sys.argv[1:]:\n"
    "    try:\n"
    "        found = importlib.util.find_spec(n) is not None\n"
    "    except Exception:\n"
    "        found = False\n"
    "    if found:\n"
    "        print('+' + n)\n";

constexpr std::size_t kLookupOutputCap = 64 * 1024;

}  // namespace

InterpreterModuleResolver::InterpreterModuleResolver(std::string interpreter,
                                                     std::map<std::string, std::string> env,
                                                     int timeout_seconds)
    : interpreter_(std::move(interpreter)),
      env_(std::move(env)),
      timeout_seconds_(std::max(1, timeout_seconds)) {}

std::vector<std::string> InterpreterModuleResolver::unresolvable(
    const std::vector<std::string>& roots) const {
  if (roots.empty()) return {};

  ProcessSpec spec;
  spec.command = interpreter_;
  spec.argv = {"-I", "-c", kLookupScript};
  spec.argv.insert(spec.argv.end(), roots.begin(), roots.end());
  spec.env = env_;
  spec.timeout_ms = static_cast<std::uint64_t>(timeout_seconds_) * 1000;
  spec.max_output_bytes = kLookupOutputCap;

  const ProcessResult r = run_process(spec);
  if (!r.spawned) {
    throw EngineError(ErrorCode::spawn_failed,
                      "dependency lookup failed to start: " + r.error_message);
  }

  std::set<std::string> found;
  if (!r.timed_out) {
    std::istringstream in(r.stdout_text);
    std::string line;
    while (std::getline(in, line)) {
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (line.size() > 1 && line[0] == '+') found.insert(line.substr(1));
    }
  }

  std::vector<std::string> missing;
  for (const auto& root : roots) {
    if (!found.contains(root)) missing.push_back(root);
  }
  return missing;
}

std::vector<std::string> find_missing_dependencies(const std::vector<std::string>& imports,
                                                   const Validator& validator,
                                                   const ModuleResolver& resolver) {
  std::vector<std::string> candidates;
  for (const auto& root : imports) {
    if (root.empty() || validator.is_denied_module(root)) continue;
    candidates.push_back(root);
  }
  std::sort(candidates.begin(), candidates.end());
  candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());

  std::vector<std::string> missing = resolver.unresolvable(candidates);
  std::sort(missing.begin(), missing.end());
  missing.erase(std::unique(missing.begin(), missing.end()), missing.end());
  return missing;
}

}  // namespace scriptward
