#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "shspec/trace/trace_record.hpp"
#include "shspec/trace/trace_sink.hpp"

namespace shspec::trace {

// Records are appended to the record file once this many are buffered.
inline constexpr size_t kTraceBatchSize = 50;

// Collects the trace records of one test. Paths are made absolute and
// canonical against working_dir; records from excluded files (the engine's
// own scripts) are dropped.
class TraceBuffer : public TraceSink {
 public:
  TraceBuffer(
      std::filesystem::path record_file, std::filesystem::path working_dir,
      std::vector<std::filesystem::path> excluded,
      size_t batch_size = kTraceBatchSize);

  TraceBuffer(const TraceBuffer&) = delete;
  auto operator=(const TraceBuffer&) -> TraceBuffer& = delete;
  TraceBuffer(TraceBuffer&&) = delete;
  auto operator=(TraceBuffer&&) -> TraceBuffer& = delete;

  ~TraceBuffer() override;

  void OnEvent(const TraceRecord& record) override;

  // Flush whatever is still buffered. Safe to call more than once.
  void Finalize() override;

  // Split raw side-channel bytes into "path:line" records. A partial last
  // line is kept until the next chunk or Finalize().
  void Feed(std::string_view chunk);

  [[nodiscard]] auto RecordFile() const -> const std::filesystem::path& {
    return record_file_;
  }
  [[nodiscard]] auto BufferedCount() const -> size_t {
    return batch_.size();
  }
  [[nodiscard]] auto FlushCount() const -> size_t {
    return flush_count_;
  }

 private:
  auto Resolve(const std::string& raw_path) -> const std::string&;
  void Flush();

  std::filesystem::path record_file_;
  std::filesystem::path working_dir_;
  std::vector<std::string> excluded_;
  size_t batch_size_;

  std::vector<TraceRecord> batch_;
  std::unordered_map<std::string, std::string> resolved_paths_;
  std::string partial_line_;
  size_t flush_count_ = 0;
};

}  // namespace shspec::trace
