#include "lazy_csv/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace lc {

void FetchMetrics::reset() {
  requests_ = bytes_ = rows_stored_ = passes_ = resolved_ = 0;
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void FetchMetrics::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void FetchMetrics::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

FetchStats FetchMetrics::snapshot() const {
  FetchStats s;
  s.requests = requests_;
  s.bytes = bytes_;
  s.rows_stored = rows_stored_;
  s.passes = passes_;
  s.resolved = resolved_;
  s.stages.reserve(stage_accum_ms_.size());
  for (auto& kv : stage_accum_ms_) s.stages.push_back(StageTiming{kv.first, kv.second});
  std::sort(s.stages.begin(), s.stages.end(),
            [](const StageTiming& a, const StageTiming& b) { return a.name < b.name; });
  return s;
}

}
