#include "lazy_csv/estimator.hpp"
#include "lazy_csv/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace lc {

// Relative drift of the average below which refresh() keeps the old value.
static constexpr double kDampingThreshold = 0.01;

Estimator::Estimator(const CoverageCache& cache) : cache_(cache) {}

double Estimator::usable_average() const noexcept {
  return (mode_ == Mode::Estimated && average_ > 0.0) ? average_ : 0.0;
}

std::optional<double> Estimator::average_row_byte_count() const noexcept {
  if (mode_ != Mode::Estimated) return std::nullopt;
  return average_;
}

bool Estimator::refresh() {
  if (mode_ == Mode::Exact) return false;
  if (cache_.complete()) {
    mode_ = Mode::Exact;
    return true;
  }
  const std::size_t rows = cache_.row_count();
  if (rows == 0) return false;

  const double avg = static_cast<double>(cache_.row_byte_count()) / static_cast<double>(rows);
  if (mode_ == Mode::Unset || average_ == 0.0) {
    mode_ = Mode::Estimated;
    average_ = avg;
    return true;
  }
  if (std::abs(avg - average_) / average_ > kDampingThreshold) {
    average_ = avg;
    return true;
  }
  return false;
}

std::int64_t Estimator::num_rows() const {
  if (mode_ == Mode::Exact) return static_cast<std::int64_t>(cache_.row_count());
  const double avg = usable_average();
  if (avg <= 0.0) return static_cast<std::int64_t>(cache_.row_count());
  const double data_bytes = static_cast<double>(cache_.byte_length() - cache_.header_byte_count());
  return static_cast<std::int64_t>(std::llround(data_bytes / avg));
}

std::int64_t Estimator::max_num_rows() const {
  return mode_ == Mode::Exact ? num_rows() : kUnboundedRows;
}

// Row index of the first stored row of every range, in cache_.ranges() order.
// Random ranges carry a guess; it never goes below the previous range's next
// row plus one, so row order follows byte order. With `snap`, a trailing range
// that reaches EOF is pinned against num_rows().
static std::vector<std::int64_t> effective_first_rows(const std::vector<const CoverageRange*>& ranges,
                                                      std::int64_t byte_length,
                                                      std::int64_t num_rows, bool snap) {
  std::vector<std::int64_t> out(ranges.size(), 0);
  if (ranges.empty()) return out;
  out[0] = ranges[0]->first_row();
  for (std::size_t i = 1; i < ranges.size(); ++i) {
    const CoverageRange& r = *ranges[i];
    std::int64_t first = r.first_row();
    if (snap && i + 1 == ranges.size() && r.next_byte() == byte_length)
      first = num_rows - static_cast<std::int64_t>(r.row_count());
    const std::int64_t floor = out[i - 1] + static_cast<std::int64_t>(ranges[i - 1]->row_count()) + 1;
    out[i] = std::max(first, floor);
  }
  return out;
}

RowStatus Estimator::status(std::int64_t row, bool snap_to_exact_eof) const {
  if (row < 0) throw InvalidArgument("row index must be non-negative");

  const auto ranges = cache_.ranges();
  const std::int64_t byte_length = cache_.byte_length();
  const double avg = usable_average();
  const bool snap = snap_to_exact_eof && avg > 0.0;
  const auto firsts = effective_first_rows(ranges, byte_length, snap ? num_rows() : 0, snap);

  for (std::size_t i = 0; i < ranges.size(); ++i) {
    const CoverageRange& left = *ranges[i];
    const CoverageRange* right = (i + 1 < ranges.size()) ? ranges[i + 1] : nullptr;
    const bool left_estimated = i > 0;
    const std::int64_t left_first = firsts[i];
    const std::int64_t left_next_row = left_first + static_cast<std::int64_t>(left.row_count());

    if (row < left_next_row) {
      return status::Stored{&left, left.row(static_cast<std::size_t>(row - left_first)),
                            Position{left_first, left_estimated}};
    }
    if (left.next_byte() >= byte_length) return status::BeyondEOF{left_estimated};

    if (row == left_next_row)
      return status::Missing{&left, right, Position{left.next_byte(), false}};

    if (!right || row < firsts[i + 1]) {
      if (avg <= 0.0) return status::Unknown{};
      const std::int64_t gap_end = right ? right->first_byte() : byte_length;
      const double guess = static_cast<double>(left.next_byte()) +
                           static_cast<double>(row - left_next_row) * avg;
      // rows the estimate still counts are aimed at the last byte
      if (!right && guess >= static_cast<double>(byte_length) && row >= num_rows())
        return status::BeyondEOF{true};
      const std::int64_t offset = guess >= static_cast<double>(gap_end)
          ? gap_end - 1
          : static_cast<std::int64_t>(std::llround(guess));
      return status::Missing{&left, right, Position{offset, true}};
    }
  }
  throw InconsistentState("row " + std::to_string(row) + " fell through the coverage walk");
}

std::optional<std::string> Estimator::cell(std::int64_t row, std::size_t column) const {
  if (row < 0) throw InvalidArgument("row index must be non-negative");
  if (column >= cache_.column_count())
    throw ColumnOutOfRange("column " + std::to_string(column) + " out of range (" +
                           std::to_string(cache_.column_count()) + " columns)");
  const RowStatus s = status(row, true);
  const auto* stored = std::get_if<status::Stored>(&s);
  if (!stored || !stored->cells) return std::nullopt;
  return column < stored->cells->size() ? (*stored->cells)[column] : std::string();
}

std::optional<std::int64_t> Estimator::row_number(std::int64_t row) const {
  if (row < 0) throw InvalidArgument("row index must be non-negative");
  const RowStatus s = status(row, true);
  if (std::holds_alternative<status::Stored>(s)) return row;
  if (row < num_rows()) return row;
  return std::nullopt;
}

MissingRowGuess Estimator::guess_first_missing_row(std::int64_t min_row) const {
  if (min_row < 0) throw InvalidArgument("row index must be non-negative");
  std::int64_t row = min_row;
  for (std::size_t guard = 0; guard <= cache_.random().size() + 1; ++guard) {
    RowStatus s = status(row, true);
    const auto* stored = std::get_if<status::Stored>(&s);
    if (!stored) return MissingRowGuess{row, std::move(s)};
    row = stored->first_row.value + static_cast<std::int64_t>(stored->range->row_count());
  }
  throw InconsistentState("no missing row found after row " + std::to_string(min_row));
}

std::optional<MissingRowGuess> Estimator::guess_last_missing_row(std::int64_t max_row) const {
  std::int64_t row = max_row;
  while (row >= 0) {
    RowStatus s = status(row, true);
    const auto* stored = std::get_if<status::Stored>(&s);
    if (!stored) return MissingRowGuess{row, std::move(s)};
    row = stored->first_row.value - 1;
  }
  return std::nullopt;
}

Position Estimator::row_at_byte(std::int64_t byte_offset) const {
  const std::int64_t byte_length = cache_.byte_length();
  if (byte_offset < 0 || byte_offset > byte_length)
    throw OutOfBounds("byte " + std::to_string(byte_offset) + " is outside the file");

  const auto ranges = cache_.ranges();
  const double avg = usable_average();
  const auto firsts = effective_first_rows(ranges, byte_length, avg > 0.0 ? num_rows() : 0, avg > 0.0);
  auto rows_in = [avg](std::int64_t bytes) -> std::int64_t {
    return avg > 0.0 ? static_cast<std::int64_t>(std::llround(static_cast<double>(bytes) / avg)) : 0;
  };

  for (std::size_t i = 0; i < ranges.size(); ++i) {
    const CoverageRange& left = *ranges[i];
    const CoverageRange* right = (i + 1 < ranges.size()) ? ranges[i + 1] : nullptr;
    const bool left_estimated = i > 0;
    const std::int64_t left_first = firsts[i];
    const std::int64_t left_next_row = left_first + static_cast<std::int64_t>(left.row_count());

    if (left.contains_byte(byte_offset)) {
      const std::int64_t v = left_first + rows_in(byte_offset - left.first_byte());
      return Position{std::min(v, std::max(left_first, left_next_row - 1)), true};
    }
    const std::int64_t gap_end = right ? right->first_byte() : byte_length;
    if (byte_offset == left.next_byte()) return Position{left_next_row, left_estimated};
    if (byte_offset > left.next_byte() && (byte_offset < gap_end || !right)) {
      std::int64_t v = left_next_row + std::max<std::int64_t>(1, rows_in(byte_offset - left.next_byte()));
      if (right) v = std::max(left_next_row, std::min(v, firsts[i + 1] - 1));
      return Position{v, true};
    }
  }
  throw InconsistentState("byte " + std::to_string(byte_offset) + " fell through the coverage walk");
}

std::optional<std::int64_t> Estimator::stored_row_at_byte(std::int64_t byte_offset) const {
  const auto ranges = cache_.ranges();
  const double avg = usable_average();
  const auto firsts = effective_first_rows(ranges, cache_.byte_length(),
                                           avg > 0.0 ? num_rows() : 0, avg > 0.0);
  for (std::size_t i = 0; i < ranges.size(); ++i) {
    if (!ranges[i]->contains_byte(byte_offset)) continue;
    const auto local = ranges[i]->local_index_of(byte_offset);
    if (!local) return std::nullopt;
    return firsts[i] + static_cast<std::int64_t>(*local);
  }
  return std::nullopt;
}

}
