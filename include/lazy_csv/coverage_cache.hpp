#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "lazy_csv/coverage_range.hpp"
#include "lazy_csv/parsed_row.hpp"

namespace lc {

// Exact bookkeeping of which bytes of a remote CSV file have been parsed.
//
// One range is anchored at byte 0 (the serial range: header plus everything
// parsed in order from the start). Out-of-order fetches open random ranges,
// kept sorted by byte and never touching each other: any contiguity merges
// them on the spot. No estimation happens here; see Estimator.
class CoverageCache {
public:
  CoverageCache(std::vector<std::string> column_names,
                std::int64_t byte_length,
                std::int64_t header_byte_count,
                CsvDialect dialect = {});

  // The header occupies [0, header.byte_offset + header.byte_count), which
  // also swallows blank lines before it.
  static CoverageCache from_header(const ParsedRow& header, std::int64_t byte_length);

  // Record one parsed row. `cells` empty-optional marks an ignored row.
  // `first_row` is only consulted when the row opens a new random range.
  // Returns false when the span is already covered (no-op).
  bool store(std::int64_t byte_offset, std::int64_t byte_count,
             std::optional<Cells> cells = std::nullopt,
             std::optional<std::int64_t> first_row = std::nullopt);

  bool complete() const;
  bool is_stored(std::int64_t byte_offset) const noexcept;

  // Exact lookups. Missing trailing cells of a ragged row read as "".
  std::optional<std::string> cell(std::int64_t row, std::size_t column) const;
  std::optional<std::int64_t> row_number(std::int64_t row) const;

  // Serial range first, then random ranges in byte order.
  std::vector<const CoverageRange*> ranges() const;
  const CoverageRange& serial() const noexcept { return serial_; }
  const std::vector<CoverageRange>& random() const noexcept { return random_; }

  std::int64_t byte_length() const noexcept { return byte_length_; }
  std::int64_t header_byte_count() const noexcept { return header_byte_count_; }
  const std::vector<std::string>& column_names() const noexcept { return column_names_; }
  std::size_t column_count() const noexcept { return column_names_.size(); }
  const CsvDialect& dialect() const noexcept { return dialect_; }

  std::size_t row_count() const noexcept;
  std::size_t range_count() const noexcept { return random_.size() + 1; }  // serial included
  std::int64_t row_byte_count() const noexcept;
  std::int64_t covered_byte_count() const noexcept;

private:
  const Cells* find_cells(std::int64_t row) const noexcept;
  void merge_into(CoverageRange& left, std::size_t following_index);

  std::vector<std::string> column_names_;
  std::int64_t byte_length_;
  std::int64_t header_byte_count_;
  CsvDialect dialect_;
  CoverageRange serial_;
  std::vector<CoverageRange> random_;
};

}
