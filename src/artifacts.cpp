#include "scriptward/artifacts.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace fs = std::filesystem;

namespace scriptward {

namespace {

bool stat_regular(const fs::path& p, FileStamp* out) {
  struct stat st;
  if (::lstat(p.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return false;
  out->size = static_cast<std::uint64_t>(st.st_size);
  out->mtime_ns = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000000000LL +
                  static_cast<std::int64_t>(st.st_mtim.tv_nsec);
  return true;
}

const std::unordered_map<std::string, std::string>& mime_table() {
  static const std::unordered_map<std::string, std::string> table = {
      {"png", "image/png"},
      {"jpg", "image/jpeg"},
      {"jpeg", "image/jpeg"},
      {"gif", "image/gif"},
      {"svg", "image/svg+xml"},
      {"webp", "image/webp"},
      {"pdf", "application/pdf"},
      {"csv", "text/csv"},
      {"tsv", "text/tab-separated-values"},
      {"txt", "text/plain"},
      {"md", "text/markdown"},
      {"json", "application/json"},
      {"html", "text/html"},
      {"htm", "text/html"},
      {"xml", "text/xml"},
      {"py", "text/x-python"},
      {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
      {"xls", "application/vnd.ms-excel"},
      {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
      {"zip", "application/zip"},
      {"mp3", "audio/mpeg"},
      {"wav", "audio/wav"},
      {"mp4", "video/mp4"},
  };
  return table;
}

}  // namespace

Snapshot take_snapshot(const fs::path& run_dir, const std::vector<std::string>& excluded_top_level) {
  Snapshot snap;
  std::error_code ec;
  fs::recursive_directory_iterator it(run_dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) return snap;
  for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) break;
    const fs::path& p = it->path();
    FileStamp stamp;
    if (!stat_regular(p, &stamp)) continue;
    const fs::path rel = p.lexically_relative(run_dir);
    const std::string key = rel.generic_string();
    if (it.depth() == 0 &&
        std::find(excluded_top_level.begin(), excluded_top_level.end(), key) !=
            excluded_top_level.end()) {
      continue;
    }
    snap.emplace(key, stamp);
  }
  return snap;
}

std::vector<std::string> changed_paths(const Snapshot& before, const Snapshot& after) {
  std::vector<std::string> out;
  for (const auto& [path, stamp] : after) {
    auto it = before.find(path);
    if (it == before.end() || !(it->second == stamp)) out.push_back(path);
  }
  return out;  // std::map iteration order is already sorted
}

std::vector<FileMeta> describe_files(const fs::path& run_dir, const std::vector<std::string>& paths) {
  std::vector<FileMeta> out;
  out.reserve(paths.size());
  for (const auto& rel : paths) {
    FileStamp stamp;
    if (!stat_regular(run_dir / rel, &stamp)) continue;
    FileMeta meta;
    meta.path = rel;
    meta.size_bytes = stamp.size;
    meta.modified_at = format_utc_iso(stamp.mtime_ns);
    meta.mime_type = mime_type_for(rel);
    out.push_back(std::move(meta));
  }
  std::sort(out.begin(), out.end(),
            [](const FileMeta& a, const FileMeta& b) { return a.path < b.path; });
  return out;
}

std::string mime_type_for(const std::string& path) {
  const std::string name = fs::path(path).filename().string();
  const auto dot = name.rfind('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == name.size()) return "";
  std::string ext = name.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  auto it = mime_table().find(ext);
  return it == mime_table().end() ? "" : it->second;
}

}  // namespace scriptward
