#pragma once

// scriptward/observability.hpp - Run events, engine statistics, artifact
// notifications.
//
// DESIGN:
//   RunEvent is the observable unit. Every Engine::execute() emits exactly one,
//   after the Run has been persisted. emit_run_event():
//     1. records it in the process-wide EngineStats (always),
//     2. hands it to a registered hook if one is set,
//     3. otherwise appends one JSON line to $SCRIPTWARD_EVENT_LOG when set.
//   Events carry metadata only: never stdout, stderr or source text.
//
// EXTENSION_POINT: event_exporter
//   Current: JSONL file sink or in-process hook.
//   Upgrade path: an exporter that forwards RunEvents to a metrics pipeline.
//   Invariant: emission must never fail or block a Run.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "scriptward/types.hpp"

namespace scriptward {

struct RunEvent {
  std::string run_id;
  std::string session_id;
  RunStatus status{RunStatus::error};
  int attempts{0};
  bool autocorrect_applied{false};
  std::uint64_t duration_ns{0};  // wall clock of the whole execute() call
  std::size_t created_files{0};
};

std::string run_event_to_json(const RunEvent& ev);

// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 32;

  void record(std::uint64_t duration_ns);

  // Approximate percentile in microseconds, p in [0.0, 1.0]. 0.0 when empty.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<std::uint64_t> count_{0};
  alignas(64) std::atomic<std::uint64_t> sum_us_{0};
};

// Infrastructure failures by ErrorCode. Guarded by EngineStats::failure_mu_.
struct FailureCategoryStats {
  std::uint64_t io_failed{0};
  std::uint64_t path_escape{0};
  std::uint64_t spawn_failed{0};
  std::uint64_t config_invalid{0};
  std::uint64_t publisher_failed{0};
  std::uint64_t other{0};

  void record(ErrorCode code);
  std::string to_json() const;
};

// Thread-safe. Counters are atomic; the ring buffer and failure table use
// their own mutexes.
class EngineStats {
 public:
  void record_run(const RunEvent& ev);
  void record_failure(ErrorCode code);
  std::string to_json() const;

  alignas(64) std::atomic<std::uint64_t> total_runs{0};
  alignas(64) std::atomic<std::uint64_t> runs_ok{0};
  std::atomic<std::uint64_t> runs_error{0};
  std::atomic<std::uint64_t> runs_timeout{0};
  std::atomic<std::uint64_t> runs_blocked{0};
  std::atomic<std::uint64_t> runs_syntax_error{0};
  std::atomic<std::uint64_t> runs_deps_missing{0};
  alignas(64) std::atomic<std::uint64_t> attempts_total{0};
  std::atomic<std::uint64_t> autocorrect_applied{0};
  std::atomic<std::uint64_t> artifacts_published{0};
  std::atomic<std::uint64_t> publisher_failures{0};

  LatencyHistogram latency_histogram;

  static constexpr std::size_t kMaxRecentEvents = 256;
  std::vector<RunEvent> recent_events_snapshot() const;  // oldest first

 private:
  mutable std::mutex failure_mu_;
  FailureCategoryStats failure_categories_;

  mutable std::mutex ring_mu_;
  std::vector<RunEvent> ring_buffer_;
  std::size_t ring_head_{0};  // next slot to overwrite once full
};

EngineStats& global_engine_stats();

using RunEventHook = void (*)(const RunEvent&);
void set_run_event_hook(RunEventHook hook);

// Never throws.
void emit_run_event(const RunEvent& ev);

// ---------------------------------------------------------------------------
// Artifact notifications
// ---------------------------------------------------------------------------

struct ArtifactEvent {
  std::string session_id;
  std::string run_id;
  std::string op{"write"};
  std::string path;  // relative to the run directory
  FileMeta meta;
};

std::string artifact_event_to_json(const ArtifactEvent& ev);

// EXTENSION_POINT: artifact_bus
//   Fire-and-forget. Implementations may throw; the engine catches, counts the
//   failure in EngineStats::publisher_failures and carries on.
class ArtifactPublisher {
 public:
  virtual ~ArtifactPublisher() = default;
  virtual void publish(const ArtifactEvent& ev) = 0;
};

using ArtifactEventHook = std::function<void(const ArtifactEvent&)>;

// Forwards to the hook when one is given, else appends JSONL to log_path.
// With neither, events are dropped.
class EventLogArtifactPublisher final : public ArtifactPublisher {
 public:
  explicit EventLogArtifactPublisher(std::string log_path, ArtifactEventHook hook = nullptr)
      : log_path_(std::move(log_path)), hook_(std::move(hook)) {}

  // Throws EngineError(publisher_failed) when the log cannot be appended.
  void publish(const ArtifactEvent& ev) override;

 private:
  std::string log_path_;
  ArtifactEventHook hook_;
  std::mutex mu_;
};

// RAII duration capture.
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

}  // namespace scriptward
