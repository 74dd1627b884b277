#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lc {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct FetchStats {
  std::uint64_t requests = 0;     // byte-source reads
  std::uint64_t bytes = 0;        // bytes received
  std::uint64_t rows_stored = 0;  // newly stored, non-ignored rows
  std::uint64_t passes = 0;       // fetch passes (one row-source parse each)
  std::uint64_t resolved = 0;     // "resolve" notifications sent

  std::vector<StageTiming> stages;
};

class FetchMetrics {
public:
  void reset();
  void add_request(std::uint64_t bytes) noexcept { ++requests_; bytes_ += bytes; }
  void add_row_stored() noexcept { ++rows_stored_; }
  void add_pass() noexcept { ++passes_; }
  void add_resolved() noexcept { ++resolved_; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  FetchStats snapshot() const;

private:
  std::uint64_t requests_{0};
  std::uint64_t bytes_{0};
  std::uint64_t rows_stored_{0};
  std::uint64_t passes_{0};
  std::uint64_t resolved_{0};
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

// Times one stage for the lifetime of the scope, including exits by exception.
// A null registry makes it a no-op.
class ScopedStage {
public:
  ScopedStage(FetchMetrics* m, std::string_view name) : m_(m), name_(name) {
    if (m_) m_->start_stage(name_);
  }
  ~ScopedStage() { if (m_) m_->end_stage(name_); }
  ScopedStage(const ScopedStage&) = delete;
  ScopedStage& operator=(const ScopedStage&) = delete;

private:
  FetchMetrics* m_;
  std::string_view name_;
};

}
