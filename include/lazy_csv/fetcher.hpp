#pragma once
#include <cstdint>
#include <functional>
#include <string>

#include "lazy_csv/config.hpp"

namespace lc {

class CancelToken;
class CoverageCache;
class Estimator;
class EventTarget;
class FetchMetrics;
class RowSource;

// Rows parsed ahead of an estimated start, to land on a row boundary.
inline constexpr std::int64_t kPaddingRows = 3;

// Turns a row window into byte windows for the row source and stores what
// comes back. Blocking; one fetch at a time per cache.
class RowFetcher {
public:
  RowFetcher(std::string url, CoverageCache& cache, Estimator& estimator, RowSource& source,
             EventTarget& events, const Config& cfg, FetchMetrics* metrics = nullptr);

  // Make rows [row_start, row_end) available, as far as the file has them.
  // Emits Resolve for every newly stored row of the window and at most one
  // RowCountChanged, from the single estimator refresh that ends the call.
  // Throws Cancelled, TransportError, InconsistentState.
  void fetch(std::int64_t row_start, std::int64_t row_end, const CancelToken* cancel = nullptr);

private:
  void refresh_and_notify();
  void run_passes(std::int64_t row_start, std::int64_t row_end, const std::function<void()>& check);

  std::string url_;
  CoverageCache& cache_;
  Estimator& estimator_;
  RowSource& source_;
  EventTarget& events_;
  Config cfg_;
  FetchMetrics* metrics_;
};

}
