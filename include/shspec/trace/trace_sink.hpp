#pragma once

#include "shspec/trace/trace_record.hpp"

namespace shspec::trace {

class TraceSink {
 public:
  virtual ~TraceSink() = default;
  virtual void OnEvent(const TraceRecord& record) = 0;
  virtual void Finalize() {
  }
};

}  // namespace shspec::trace
