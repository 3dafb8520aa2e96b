#include "scriptward/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "scriptward/jsonlite.hpp"
#include "scriptward/version.hpp"

namespace scriptward {

namespace {

// floor(log2(us)) + 1, capped at the last bucket.
inline std::size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  const std::size_t b = static_cast<std::size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_fixed(std::string& out, const char* fmt, double value) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, value);
  out += buf;
}

void append_counter(std::string& out, const char* key, std::uint64_t value, bool first = false) {
  if (!first) out += ',';
  out += '"';
  out += key;
  out += "\":";
  out += std::to_string(value);
}

bool append_line(const std::string& path, const std::string& line) {
  FILE* f = std::fopen(path.c_str(), "a");
  if (!f) return false;
  const bool ok = std::fwrite(line.data(), 1, line.size(), f) == line.size();
  return std::fclose(f) == 0 && ok;
}

}  // namespace

std::string run_event_to_json(const RunEvent& ev) {
  std::string out;
  out.reserve(256);
  out += "{\"event_format_version\":";
  out += std::to_string(version::EVENT_FORMAT_VERSION);
  out += ",\"run_id\":\"";
  out += jsonlite::escape(ev.run_id);
  out += "\",\"session_id\":\"";
  out += jsonlite::escape(ev.session_id);
  out += "\",\"status\":\"";
  out += to_string(ev.status);
  out += "\",\"attempts\":";
  out += std::to_string(ev.attempts);
  out += ",\"autocorrect_applied\":";
  out += ev.autocorrect_applied ? "true" : "false";
  out += ",\"duration_ns\":";
  out += std::to_string(ev.duration_ns);
  out += ",\"created_files\":";
  out += std::to_string(ev.created_files);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  std::uint64_t counts[kBuckets];
  for (std::size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  const std::uint64_t target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target) {
      // Midpoint of [2^(i-1), 2^i) us; bucket 0 reports 0.5us.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(192);
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  append_fixed(out, "%.2f", mean_us());
  const double p50 = percentile(0.50);
  const double p95 = percentile(0.95);
  const double p99 = percentile(0.99);
  out += ",\"p50_ms\":";
  append_fixed(out, "%.3f", p50 / 1000.0);
  out += ",\"p95_ms\":";
  append_fixed(out, "%.3f", p95 / 1000.0);
  out += ",\"p99_ms\":";
  append_fixed(out, "%.3f", p99 / 1000.0);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// FailureCategoryStats
// ---------------------------------------------------------------------------

void FailureCategoryStats::record(ErrorCode code) {
  switch (code) {
    case ErrorCode::io_failed: ++io_failed; break;
    case ErrorCode::path_escape: ++path_escape; break;
    case ErrorCode::spawn_failed: ++spawn_failed; break;
    case ErrorCode::config_invalid: ++config_invalid; break;
    case ErrorCode::publisher_failed: ++publisher_failed; break;
    default: ++other; break;
  }
}

std::string FailureCategoryStats::to_json() const {
  std::string out = "{";
  append_counter(out, "io_failed", io_failed, true);
  append_counter(out, "path_escape", path_escape);
  append_counter(out, "spawn_failed", spawn_failed);
  append_counter(out, "config_invalid", config_invalid);
  append_counter(out, "publisher_failed", publisher_failed);
  append_counter(out, "other", other);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_run(const RunEvent& ev) {
  total_runs.fetch_add(1, std::memory_order_relaxed);
  switch (ev.status) {
    case RunStatus::ok: runs_ok.fetch_add(1, std::memory_order_relaxed); break;
    case RunStatus::error: runs_error.fetch_add(1, std::memory_order_relaxed); break;
    case RunStatus::timeout: runs_timeout.fetch_add(1, std::memory_order_relaxed); break;
    case RunStatus::blocked: runs_blocked.fetch_add(1, std::memory_order_relaxed); break;
    case RunStatus::syntax_error: runs_syntax_error.fetch_add(1, std::memory_order_relaxed); break;
    case RunStatus::deps_missing: runs_deps_missing.fetch_add(1, std::memory_order_relaxed); break;
  }
  attempts_total.fetch_add(static_cast<std::uint64_t>(ev.attempts), std::memory_order_relaxed);
  if (ev.autocorrect_applied) autocorrect_applied.fetch_add(1, std::memory_order_relaxed);

  latency_histogram.record(ev.duration_ns);

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

void EngineStats::record_failure(ErrorCode code) {
  std::lock_guard<std::mutex> lk(failure_mu_);
  failure_categories_.record(code);
}

std::vector<RunEvent> EngineStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  std::vector<RunEvent> out;
  out.reserve(ring_buffer_.size());
  for (std::size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

std::string EngineStats::to_json() const {
  std::string out;
  out.reserve(768);
  out += "{\"runs\":{";
  append_counter(out, "total", total_runs.load(std::memory_order_relaxed), true);
  append_counter(out, "ok", runs_ok.load(std::memory_order_relaxed));
  append_counter(out, "error", runs_error.load(std::memory_order_relaxed));
  append_counter(out, "timeout", runs_timeout.load(std::memory_order_relaxed));
  append_counter(out, "blocked", runs_blocked.load(std::memory_order_relaxed));
  append_counter(out, "syntax_error", runs_syntax_error.load(std::memory_order_relaxed));
  append_counter(out, "deps_missing", runs_deps_missing.load(std::memory_order_relaxed));
  out += '}';
  append_counter(out, "attempts_total", attempts_total.load(std::memory_order_relaxed));
  append_counter(out, "autocorrect_applied", autocorrect_applied.load(std::memory_order_relaxed));
  out += ",\"artifacts\":{";
  append_counter(out, "published", artifacts_published.load(std::memory_order_relaxed), true);
  append_counter(out, "publisher_failures", publisher_failures.load(std::memory_order_relaxed));
  out += '}';
  out += ",\"latency\":";
  out += latency_histogram.to_json();
  out += ",\"failure_categories\":";
  {
    std::lock_guard<std::mutex> lk(failure_mu_);
    out += failure_categories_.to_json();
  }
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

namespace {
std::atomic<RunEventHook> g_event_hook{nullptr};
}

void set_run_event_hook(RunEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_run_event(const RunEvent& ev) {
  global_engine_stats().record_run(ev);

  RunEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("SCRIPTWARD_EVENT_LOG");
  if (!log_path || !log_path[0]) return;
  if (!append_line(log_path, run_event_to_json(ev) + "\n")) {
    global_engine_stats().record_failure(ErrorCode::io_failed);
  }
}

// ---------------------------------------------------------------------------
// Artifact notifications
// ---------------------------------------------------------------------------

std::string artifact_event_to_json(const ArtifactEvent& ev) {
  std::string out;
  out.reserve(256);
  out += "{\"session_id\":\"";
  out += jsonlite::escape(ev.session_id);
  out += "\",\"run_id\":\"";
  out += jsonlite::escape(ev.run_id);
  out += "\",\"op\":\"";
  out += jsonlite::escape(ev.op);
  out += "\",\"path\":\"";
  out += jsonlite::escape(ev.path);
  out += "\",\"meta\":";
  out += file_meta_to_json(ev.meta);
  out += '}';
  return out;
}

void EventLogArtifactPublisher::publish(const ArtifactEvent& ev) {
  if (hook_) {
    hook_(ev);
    return;
  }
  if (log_path_.empty()) return;
  std::lock_guard<std::mutex> lk(mu_);
  if (!append_line(log_path_, artifact_event_to_json(ev) + "\n")) {
    throw EngineError(ErrorCode::publisher_failed, "cannot append to artifact log: " + log_path_);
  }
}

}  // namespace scriptward
