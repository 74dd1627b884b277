#include "lazy_csv/coverage_range.hpp"
#include "lazy_csv/errors.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace lc {

CoverageRange::CoverageRange(std::int64_t first_byte, std::int64_t first_row)
  : first_byte_(first_byte), first_row_(first_row) {}

void CoverageRange::append(std::int64_t byte_offset, std::int64_t byte_count,
                           std::optional<Cells> cells) {
  if (byte_offset != next_byte()) {
    throw NonContiguous("cannot append row at byte " + std::to_string(byte_offset) +
                        ": range ends at byte " + std::to_string(next_byte()));
  }
  byte_count_ += byte_count;
  if (cells) {
    rows_.push_back(std::move(*cells));
    offsets_.push_back(byte_offset);
    row_byte_count_ += byte_count;
  }
}

void CoverageRange::prepend(std::int64_t byte_offset, std::int64_t byte_count,
                            std::optional<Cells> cells) {
  if (byte_offset + byte_count != first_byte_) {
    throw NonContiguous("cannot prepend row ending at byte " +
                        std::to_string(byte_offset + byte_count) +
                        ": range starts at byte " + std::to_string(first_byte_));
  }
  first_byte_ = byte_offset;
  byte_count_ += byte_count;
  if (cells) {
    rows_.push_front(std::move(*cells));
    offsets_.push_front(byte_offset);
    row_byte_count_ += byte_count;
    --first_row_;
  }
}

void CoverageRange::merge(CoverageRange&& following) {
  if (following.first_byte_ != next_byte()) {
    throw NonContiguous("cannot merge range starting at byte " +
                        std::to_string(following.first_byte_) +
                        ": range ends at byte " + std::to_string(next_byte()));
  }
  byte_count_ += following.byte_count_;
  row_byte_count_ += following.row_byte_count_;
  for (auto& r : following.rows_) rows_.push_back(std::move(r));
  offsets_.insert(offsets_.end(), following.offsets_.begin(), following.offsets_.end());
  following.rows_.clear();
  following.offsets_.clear();
  following.byte_count_ = 0;
  following.row_byte_count_ = 0;
}

const Cells* CoverageRange::row(std::size_t local_index) const noexcept {
  return local_index < rows_.size() ? &rows_[local_index] : nullptr;
}

std::optional<std::size_t> CoverageRange::local_index_of(std::int64_t byte_offset) const {
  auto it = std::lower_bound(offsets_.begin(), offsets_.end(), byte_offset);
  if (it == offsets_.end() || *it != byte_offset) return std::nullopt;
  return static_cast<std::size_t>(it - offsets_.begin());
}

}
