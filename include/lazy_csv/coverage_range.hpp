#pragma once
#include <cstdint>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace lc {

using Cells = std::vector<std::string>;

// A contiguous byte span of the file that has been parsed, with the rows
// found in it. Ignored rows (header, blank lines) extend the span but are
// not stored.
class CoverageRange {
public:
  CoverageRange(std::int64_t first_byte, std::int64_t first_row);

  // Grow forward. `byte_offset` must equal next_byte().
  void append(std::int64_t byte_offset, std::int64_t byte_count,
              std::optional<Cells> cells = std::nullopt);

  // Grow backward. `byte_offset + byte_count` must equal first_byte().
  // A stored row moves first_row() one step back.
  void prepend(std::int64_t byte_offset, std::int64_t byte_count,
               std::optional<Cells> cells = std::nullopt);

  // Absorb the range that starts exactly at next_byte(). The caller removes
  // `following` from its own list.
  void merge(CoverageRange&& following);

  // Stored cells at a position local to this range, nullptr if out of bounds.
  const Cells* row(std::size_t local_index) const noexcept;

  // Local index of the stored row starting at `byte_offset`; nothing for
  // ignored rows and offsets that do not start a row.
  std::optional<std::size_t> local_index_of(std::int64_t byte_offset) const;

  std::int64_t first_byte() const noexcept { return first_byte_; }
  std::int64_t byte_count() const noexcept { return byte_count_; }
  std::int64_t next_byte() const noexcept { return first_byte_ + byte_count_; }
  std::int64_t first_row() const noexcept { return first_row_; }
  std::int64_t next_row() const noexcept {
    return first_row_ + static_cast<std::int64_t>(rows_.size());
  }
  std::size_t row_count() const noexcept { return rows_.size(); }
  std::int64_t row_byte_count() const noexcept { return row_byte_count_; }

  bool contains_byte(std::int64_t byte_offset) const noexcept {
    return byte_offset >= first_byte_ && byte_offset < next_byte();
  }

private:
  std::int64_t first_byte_;
  std::int64_t byte_count_{0};
  std::int64_t first_row_;
  std::int64_t row_byte_count_{0};
  std::deque<Cells> rows_;
  std::deque<std::int64_t> offsets_;  // byte offset of each stored row
};

}
