#include "lazy_csv/fetcher.hpp"
#include "lazy_csv/cancel.hpp"
#include "lazy_csv/coverage_cache.hpp"
#include "lazy_csv/errors.hpp"
#include "lazy_csv/estimator.hpp"
#include "lazy_csv/events.hpp"
#include "lazy_csv/metrics.hpp"
#include "lazy_csv/row_source.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace lc {

RowFetcher::RowFetcher(std::string url, CoverageCache& cache, Estimator& estimator,
                       RowSource& source, EventTarget& events, const Config& cfg,
                       FetchMetrics* metrics)
  : url_(std::move(url)), cache_(cache), estimator_(estimator), source_(source),
    events_(events), cfg_(cfg), metrics_(metrics) {}

void RowFetcher::refresh_and_notify() {
  if (estimator_.refresh()) events_.emit(DataFrameEvent{EventKind::RowCountChanged, -1});
}

namespace {

// Where the next pass starts reading, and whether its first row may be a
// fragment.
struct PassStart {
  std::int64_t byte = 0;
  bool discard_first = false;
};

// Byte offset of the first missing row, or nothing when the window is done.
std::optional<std::int64_t> first_missing_byte(const Estimator& est, std::int64_t row_start,
                                               std::int64_t row_end) {
  const MissingRowGuess g = est.guess_first_missing_row(row_start);
  if (g.row >= row_end) return std::nullopt;
  if (const auto* m = std::get_if<status::Missing>(&g.status)) return m->byte_offset.value;
  return std::nullopt;
}

}

void RowFetcher::fetch(std::int64_t row_start, std::int64_t row_end, const CancelToken* cancel) {
  if (row_start < 0 || row_end < row_start)
    throw InvalidArgument("invalid row window [" + std::to_string(row_start) + ", " +
                          std::to_string(row_end) + ")");
  auto check = [cancel] { if (cancel) cancel->check(); };
  check();

  // The estimate is committed once, after the batch: passes aim with the
  // average the fetch started with.
  if (!cache_.complete() && row_start < row_end) {
    ScopedStage stage(metrics_, "fetch");
    try {
      run_passes(row_start, row_end, check);
    } catch (const InconsistentState& e) {
      std::cerr << "[fetch] inconsistent state while fetching rows [" << row_start << ", "
                << row_end << ") of " << url_ << ": " << e.what() << "\n";
      throw;
    }
  }
  refresh_and_notify();
}

void RowFetcher::run_passes(std::int64_t row_start, std::int64_t row_end,
                            const std::function<void()>& check) {
  const std::int64_t byte_length = cache_.byte_length();
  const auto chunk = static_cast<std::int64_t>(cfg_.chunk_size);
  // every row spans at least one byte, so no window holds more rows than the file has bytes
  const std::int64_t width = std::min(row_end - row_start, byte_length + 1);
  const std::int64_t max_loops = (width + kPaddingRows) * 10 + 10;
  const std::int64_t max_rows_per_pass = max_loops + chunk;

  bool force_exact = false;
  for (std::int64_t pass = 0;; ++pass) {
    if (pass >= max_loops)
      throw InconsistentState("fetch of rows [" + std::to_string(row_start) + ", " +
                              std::to_string(row_end) + ") did not converge after " +
                              std::to_string(max_loops) + " passes");
    check();

    const MissingRowGuess first = estimator_.guess_first_missing_row(row_start);
    if (first.row >= row_end) return;
    // Unknown (no average yet) and BeyondEOF: nothing to aim at
    const auto* missing = std::get_if<status::Missing>(&first.status);
    if (!missing) return;
    const CoverageRange* left = missing->left;
    const Position target = missing->byte_offset;
    if (left->next_byte() >= byte_length) return;

    const auto last = estimator_.guess_last_missing_row(row_end - 1);
    if (!last || last->row < first.row) return;

    // after an estimated pass that stored nothing, sweep forward from the
    // exact boundary instead of re-aiming at the same estimate
    const bool sweep = force_exact;
    PassStart start{left->next_byte(), false};
    if (target.is_estimate && !sweep) {
      const double avg = estimator_.average_row_byte_count().value_or(0.0);
      std::int64_t b = target.value -
          static_cast<std::int64_t>(std::llround(static_cast<double>(kPaddingRows) * avg));
      b = std::max(b, left->next_byte());
      b -= b % chunk;
      if (b > left->next_byte()) start = PassStart{b, true};
    }
    force_exact = false;

    ParseRequest req;
    req.url = url_;
    req.window = ByteWindow{start.byte, byte_length};
    req.byte_length = byte_length;
    req.delimiter = cache_.dialect().delimiter;
    req.newline = cache_.dialect().newline;
    req.chunk_size = cfg_.chunk_size;

    const std::int64_t row_limit = sweep ? byte_length - start.byte + 1 : max_rows_per_pass;
    std::int64_t parsed = 0;
    std::int64_t stored = 0;
    std::int64_t resolved = 0;
    bool discard = start.discard_first;
    bool done = false;

    source_.parse(req, [&](const ParsedRow& r) {
      check();
      if (++parsed > row_limit)
        throw InconsistentState("pass from byte " + std::to_string(start.byte) +
                                " parsed more than " + std::to_string(row_limit) + " rows");
      if (discard) {
        discard = false;
        return true;
      }
      if (r.byte_count == 0) {
        done = true;  // empty trailing line
        return false;
      }

      if (!cache_.is_stored(r.byte_offset)) {
        const bool ignored = is_empty_row(r.cells);
        const std::int64_t hint = estimator_.row_at_byte(r.byte_offset).value;
        std::optional<Cells> cells;
        if (!ignored) cells = r.cells;
        if (cache_.store(r.byte_offset, r.byte_count, std::move(cells), hint)) {
          ++stored;
          if (!ignored) {
            if (metrics_) metrics_->add_row_stored();
            // the index the row is served under, once the cache has placed it
            const auto row = estimator_.stored_row_at_byte(r.byte_offset);
            if (row && *row >= row_start && *row < row_end) {
              ++resolved;
              if (metrics_) metrics_->add_resolved();
              events_.emit(DataFrameEvent{EventKind::Resolve, *row});
            }
          }
        }
      }

      const auto next = first_missing_byte(estimator_, row_start, row_end);
      if (!next) {
        done = true;  // window covered
        return false;
      }
      const std::int64_t row_end_byte = r.byte_offset + r.byte_count;
      if (*next < row_end_byte) return false;  // next gap is behind: new pass
      if (!sweep && *next > row_end_byte + chunk) return false;  // too far ahead: new pass
      return true;
    });

    if (metrics_) metrics_->add_pass();
    if (cfg_.verbose)
      std::cerr << "[fetch] pass " << pass << " rows [" << row_start << ", " << row_end
                << ") from byte " << start.byte << (start.discard_first ? " (estimated)" : "")
                << ": parsed=" << parsed << " stored=" << stored << " resolved=" << resolved
                << "\n";

    if (done || cache_.complete()) return;
    if (stored == 0) {
      if (!start.discard_first) return;  // exact start made no progress: nothing left to read
      force_exact = true;
    }
  }
}

}
