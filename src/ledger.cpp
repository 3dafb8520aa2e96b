#include "scriptward/ledger.hpp"

#include <sys/file.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <random>

#include "scriptward/config.hpp"

namespace fs = std::filesystem;

namespace scriptward {

namespace {

// flock() is per open file description, so two threads of one process would
// both acquire it. The in-process mutex covers that case.
std::shared_ptr<std::mutex> index_mutex_for(const fs::path& path) {
  static std::mutex registry_mu;
  static std::map<std::string, std::shared_ptr<std::mutex>> registry;
  std::lock_guard<std::mutex> lk(registry_mu);
  auto& slot = registry[path.string()];
  if (!slot) slot = std::make_shared<std::mutex>();
  return slot;
}

class FlockGuard {
 public:
  explicit FlockGuard(int fd) : fd_(fd), locked_(::flock(fd, LOCK_EX) == 0) {}
  ~FlockGuard() {
    if (locked_) ::flock(fd_, LOCK_UN);
  }
  FlockGuard(const FlockGuard&) = delete;
  FlockGuard& operator=(const FlockGuard&) = delete;
  bool locked() const { return locked_; }

 private:
  int fd_;
  bool locked_;
};

void append_line(const fs::path& path, const std::string& line) {
  FILE* f = std::fopen(path.c_str(), "ae");
  if (!f) throw EngineError(ErrorCode::io_failed, "cannot open " + path.string());
  std::fseek(f, 0, SEEK_END);
  const bool written = std::fwrite(line.data(), 1, line.size(), f) == line.size();
  const bool flushed = std::fflush(f) == 0;
  const bool closed = std::fclose(f) == 0;
  if (!written || !flushed || !closed) {
    throw EngineError(ErrorCode::io_failed, "cannot append to " + path.string());
  }
}

void write_file(const fs::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  out.close();
  if (!out) throw EngineError(ErrorCode::io_failed, "cannot write " + path.string());
}

std::string random_hex(std::size_t digits) {
  static constexpr char kHex[] = "0123456789abcdef";
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::string out;
  out.reserve(digits);
  std::uint64_t bits = 0;
  for (std::size_t i = 0; i < digits; ++i) {
    if (i % 16 == 0) bits = rng();
    out.push_back(kHex[bits & 0xF]);
    bits >>= 4;
  }
  return out;
}

}  // namespace

std::string make_run_id() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto us = duration_cast<microseconds>(now.time_since_epoch()).count();
  const std::time_t secs = static_cast<std::time_t>(us / 1000000);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d%02d%02dT%02d%02d%02d%06d", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<int>(us % 1000000));
  return std::string(buf) + "-" + random_hex(12);
}

RunLedger::RunLedger(fs::path session_root) : runs_dir_(std::move(session_root) / "runs") {}

RunLedger RunLedger::at_runs_dir(fs::path runs_dir) {
  RunLedger ledger{fs::path{}};
  ledger.runs_dir_ = std::move(runs_dir);
  return ledger;
}

fs::path RunLedger::create_run_dir(const std::string& run_id) const {
  std::error_code ec;
  fs::create_directories(runs_dir_, ec);
  if (ec) {
    throw EngineError(ErrorCode::io_failed,
                      "cannot create " + runs_dir_.string() + ": " + ec.message());
  }
  const fs::path dir = run_dir(run_id);
  if (!fs::create_directory(dir, ec) || ec) {
    throw EngineError(ErrorCode::io_failed, "cannot create run directory " + dir.string() +
                                                (ec ? ": " + ec.message() : ": already exists"));
  }
  return dir;
}

void RunLedger::write_source(const fs::path& run_dir, const std::string& file_name,
                             const std::string& source) const {
  write_file(run_dir / file_name, source);
}

void RunLedger::append_attempt(const fs::path& run_dir, const Attempt& attempt) const {
  append_line(run_dir / "attempts.jsonl", attempt_to_json(attempt) + "\n");
}

void RunLedger::write_result(const fs::path& run_dir, const Run& run) const {
  const fs::path final_path = run_dir / "result.json";
  const fs::path tmp_path = run_dir / "result.json.tmp";
  write_file(tmp_path, run_to_json(run) + "\n");
  std::error_code ec;
  fs::rename(tmp_path, final_path, ec);
  if (ec) {
    fs::remove(tmp_path, ec);
    throw EngineError(ErrorCode::io_failed, "cannot publish " + final_path.string());
  }
}

void RunLedger::append_index(const RunSummary& summary) const {
  std::error_code ec;
  fs::create_directories(runs_dir_, ec);
  const fs::path path = index_path();
  const std::string line = run_summary_to_json(summary) + "\n";

  auto mu = index_mutex_for(path);
  std::lock_guard<std::mutex> lk(*mu);

  FILE* f = std::fopen(path.c_str(), "ae");
  if (!f) throw EngineError(ErrorCode::io_failed, "cannot open index " + path.string());
  bool ok = false;
  {
    FlockGuard lock(::fileno(f));
    std::fseek(f, 0, SEEK_END);
    ok = lock.locked() && std::fwrite(line.data(), 1, line.size(), f) == line.size();
    ok = (std::fflush(f) == 0) && ok;
  }
  ok = (std::fclose(f) == 0) && ok;
  if (!ok) throw EngineError(ErrorCode::io_failed, "cannot append to index " + path.string());
}

bool RunLedger::truncate_index() const {
  const fs::path path = index_path();
  std::error_code ec;
  if (!fs::exists(path, ec)) return true;

  auto mu = index_mutex_for(path);
  std::lock_guard<std::mutex> lk(*mu);
  FILE* f = std::fopen(path.c_str(), "r+e");
  if (!f) return false;
  bool ok = false;
  {
    FlockGuard lock(::fileno(f));
    ok = lock.locked() && ::ftruncate(::fileno(f), 0) == 0;
  }
  return (std::fclose(f) == 0) && ok;
}

RunList RunLedger::list_runs(const std::string& session_id, int limit) const {
  RunList list;
  list.session_id = session_id;
  const std::size_t keep = static_cast<std::size_t>(clamp_list_limit(limit));

  std::ifstream in(index_path(), std::ios::binary);
  if (!in) return list;

  std::vector<RunSummary> all;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    if (auto s = parse_run_summary(line)) all.push_back(std::move(*s));
  }

  std::sort(all.begin(), all.end(), [](const RunSummary& a, const RunSummary& b) {
    if (a.started_at != b.started_at) return a.started_at < b.started_at;
    return a.run_id < b.run_id;
  });
  const std::size_t start = all.size() > keep ? all.size() - keep : 0;
  list.items.assign(std::make_move_iterator(all.begin() + static_cast<std::ptrdiff_t>(start)),
                    std::make_move_iterator(all.end()));
  return list;
}

}  // namespace scriptward
