#include "shspec/report/result_stream.hpp"

#include <cerrno>
#include <cstring>
#include <expected>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include <fmt/core.h>

#include "shspec/common/diagnostic.hpp"
#include "shspec/common/text.hpp"
#include "shspec/executor/execution_result.hpp"

namespace shspec::report {

auto FormatResultRecord(const executor::ExecutionResult& result)
    -> std::string {
  auto status = executor::StatusLabel(result.State());
  std::string message;
  if (status == "FAIL" || status == "TODO") {
    message = common::StripAnsi(result.Output());
  }

  nlohmann::ordered_json record = {
      {"file", result.Case().file.display_path},
      {"test", result.Case().procedure},
      {"status", std::string(status)},
      {"message", message},
      {"duration_ms", result.DurationMs()},
  };
  // Invalid UTF-8 in captured output is replaced rather than thrown on
  return record.dump(
      -1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

auto ResultStream::Open(const std::filesystem::path& path)
    -> Result<std::unique_ptr<ResultStream>> {
  std::unique_ptr<ResultStream> stream(new ResultStream());
  stream->file_.open(path, std::ios::trunc);
  if (!stream->file_) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "cannot open result stream {}: {}", path.string(),
                std::strerror(errno))));
  }
  stream->out_ = &stream->file_;
  return stream;
}

void ResultStream::OnResult(const executor::ExecutionResult& result) {
  *out_ << FormatResultRecord(result) << '\n';
  out_->flush();
}

}  // namespace shspec::report
