#pragma once
#include <cstdint>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <variant>

#include "lazy_csv/coverage_cache.hpp"

namespace lc {

inline constexpr std::int64_t kUnboundedRows = std::numeric_limits<std::int64_t>::max();

// A row index or byte offset, with whether it was observed or derived from
// the average row size.
struct Position {
  std::int64_t value = 0;
  bool is_estimate = false;
};

namespace status {

struct Stored {
  const CoverageRange* range = nullptr;
  const Cells* cells = nullptr;
  Position first_row;  // row index of range->row(0)
};

// The row is not parsed yet. It lives in the byte gap after `left`
// (before `right`, or before EOF when right is null).
struct Missing {
  const CoverageRange* left = nullptr;
  const CoverageRange* right = nullptr;
  Position byte_offset;
};

struct BeyondEOF {
  bool is_estimate = false;
};

// No average yet, and the row is not next to a known boundary.
struct Unknown {};

}

using RowStatus = std::variant<status::Stored, status::Missing, status::BeyondEOF, status::Unknown>;

struct MissingRowGuess {
  std::int64_t row = 0;
  RowStatus status;
};

// Row <-> byte mapping over a CoverageCache, and the row count shown to the
// viewer. The average only moves on refresh(), so a batch of stores causes at
// most one visible change.
class Estimator {
public:
  explicit Estimator(const CoverageCache& cache);

  // Recompute the average row size. Returns true iff num_rows() may have
  // changed: first average, >1% drift, or the switch to exact on completion.
  bool refresh();

  std::int64_t num_rows() const;
  bool is_num_rows_estimated() const noexcept { return mode_ != Mode::Exact; }
  // Upper bound for row queries that might still resolve.
  std::int64_t max_num_rows() const;
  std::optional<double> average_row_byte_count() const noexcept;

  RowStatus status(std::int64_t row, bool snap_to_exact_eof = false) const;

  // Cells only for stored rows; row numbers may be guessed below num_rows().
  std::optional<std::string> cell(std::int64_t row, std::size_t column) const;
  std::optional<std::int64_t> row_number(std::int64_t row) const;

  // First row >= min_row (last row <= max_row) that is not stored.
  MissingRowGuess guess_first_missing_row(std::int64_t min_row) const;
  std::optional<MissingRowGuess> guess_last_missing_row(std::int64_t max_row) const;

  // Row index a row starting at an uncovered byte would get.
  Position row_at_byte(std::int64_t byte_offset) const;

  // Row index the stored row starting at `byte_offset` is served under, or
  // nothing if no stored row starts there.
  std::optional<std::int64_t> stored_row_at_byte(std::int64_t byte_offset) const;

  const CoverageCache& cache() const noexcept { return cache_; }

private:
  enum class Mode { Unset, Estimated, Exact };

  double usable_average() const noexcept;

  const CoverageCache& cache_;
  Mode mode_{Mode::Unset};
  double average_{0.0};
};

}
