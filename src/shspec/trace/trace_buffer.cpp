#include "shspec/trace/trace_buffer.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "shspec/trace/trace_record.hpp"

namespace shspec::trace {

namespace fs = std::filesystem;

namespace {

auto CanonicalString(const fs::path& path, const fs::path& base)
    -> std::string {
  fs::path absolute = path.is_absolute() ? path : base / path;
  std::error_code ec;
  fs::path canonical = fs::weakly_canonical(absolute, ec);
  if (ec) {
    return absolute.lexically_normal().string();
  }
  return canonical.string();
}

}  // namespace

TraceBuffer::TraceBuffer(
    fs::path record_file, fs::path working_dir,
    std::vector<fs::path> excluded, size_t batch_size)
    : record_file_(std::move(record_file)),
      working_dir_(std::move(working_dir)),
      batch_size_(std::max<size_t>(batch_size, 1)) {
  excluded_.reserve(excluded.size());
  for (const auto& path : excluded) {
    excluded_.push_back(CanonicalString(path, working_dir_));
  }
  batch_.reserve(batch_size_);
}

TraceBuffer::~TraceBuffer() {
  Finalize();
}

auto TraceBuffer::Resolve(const std::string& raw_path) -> const std::string& {
  auto it = resolved_paths_.find(raw_path);
  if (it == resolved_paths_.end()) {
    it = resolved_paths_
             .emplace(raw_path, CanonicalString(raw_path, working_dir_))
             .first;
  }
  return it->second;
}

void TraceBuffer::OnEvent(const TraceRecord& record) {
  if (record.path.empty() || record.line == 0) {
    return;
  }
  const std::string& path = Resolve(record.path);
  if (std::ranges::find(excluded_, path) != excluded_.end()) {
    return;
  }
  batch_.push_back(TraceRecord{.path = path, .line = record.line});
  if (batch_.size() >= batch_size_) {
    Flush();
  }
}

void TraceBuffer::Feed(std::string_view chunk) {
  partial_line_.append(chunk);

  size_t start = 0;
  while (true) {
    auto end = partial_line_.find('\n', start);
    if (end == std::string::npos) {
      break;
    }
    auto line = std::string_view(partial_line_).substr(start, end - start);
    if (auto record = ParseTraceRecord(line)) {
      OnEvent(*record);
    }
    start = end + 1;
  }
  partial_line_.erase(0, start);
}

void TraceBuffer::Finalize() {
  if (!partial_line_.empty()) {
    if (auto record = ParseTraceRecord(partial_line_)) {
      OnEvent(*record);
    }
    partial_line_.clear();
  }
  Flush();
}

void TraceBuffer::Flush() {
  if (batch_.empty()) {
    return;
  }
  std::ofstream out(record_file_, std::ios::app);
  if (!out) {
    spdlog::warn(
        "cannot append trace records to {}, dropping {} record(s)",
        record_file_.string(), batch_.size());
    batch_.clear();
    return;
  }
  for (const auto& record : batch_) {
    out << record.path << ':' << record.line << '\n';
  }
  batch_.clear();
  ++flush_count_;
}

}  // namespace shspec::trace
