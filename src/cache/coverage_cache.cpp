#include "lazy_csv/coverage_cache.hpp"
#include "lazy_csv/errors.hpp"

#include <string>
#include <utility>

namespace lc {

static std::string span_str(std::int64_t first, std::int64_t end) {
  return "[" + std::to_string(first) + ", " + std::to_string(end) + ")";
}

CoverageCache::CoverageCache(std::vector<std::string> column_names,
                             std::int64_t byte_length,
                             std::int64_t header_byte_count,
                             CsvDialect dialect)
  : column_names_(std::move(column_names)),
    byte_length_(byte_length),
    header_byte_count_(header_byte_count),
    dialect_(dialect),
    serial_(0, 0) {
  if (column_names_.empty()) throw InvalidArgument("no column names in header row");
  if (byte_length_ < 0 || header_byte_count_ < 0)
    throw InvalidArgument("byte length and header byte count must be non-negative");
  if (header_byte_count_ > byte_length_)
    throw OutOfBounds("header (" + std::to_string(header_byte_count_) +
                      " bytes) exceeds the file length (" + std::to_string(byte_length_) + " bytes)");
  // header and any blank lines before it: covered, not stored
  serial_.append(0, header_byte_count_);
}

CoverageCache CoverageCache::from_header(const ParsedRow& header, std::int64_t byte_length) {
  CsvDialect d;
  d.delimiter = header.delimiter;
  d.newline = header.newline;
  return CoverageCache(header.cells, byte_length, header.byte_offset + header.byte_count, d);
}

bool CoverageCache::store(std::int64_t byte_offset, std::int64_t byte_count,
                          std::optional<Cells> cells,
                          std::optional<std::int64_t> first_row) {
  if (byte_offset < 0) throw InvalidArgument("byte offset must be non-negative");
  if (byte_count < 0) throw InvalidArgument("byte count must be non-negative");
  const std::int64_t end = byte_offset + byte_count;
  if (end > byte_length_)
    throw OutOfBounds("row " + span_str(byte_offset, end) + " exceeds the file length (" +
                      std::to_string(byte_length_) + " bytes)");

  CoverageRange* left = &serial_;
  for (std::size_t i = 0; i <= random_.size(); ++i) {
    CoverageRange* right = i < random_.size() ? &random_[i] : nullptr;
    const std::int64_t gap_end = right ? right->first_byte() : byte_length_;

    if (byte_offset < left->next_byte()) {
      if (byte_offset >= left->first_byte() && end <= left->next_byte()) return false;
      throw InconsistentOverlap("row " + span_str(byte_offset, end) +
                                " overlaps the previous range " +
                                span_str(left->first_byte(), left->next_byte()));
    }

    if (byte_offset < gap_end) {
      if (end > gap_end)
        throw InconsistentOverlap("row " + span_str(byte_offset, end) +
                                  " overlaps the next range starting at byte " +
                                  std::to_string(gap_end));
      if (byte_offset == left->next_byte()) {
        left->append(byte_offset, byte_count, std::move(cells));
        if (right && left->next_byte() == right->first_byte()) merge_into(*left, i);
        return true;
      }
      if (right && end == right->first_byte()) {
        right->prepend(byte_offset, byte_count, std::move(cells));
        return true;
      }
      // isolated; an empty span cannot seed a range
      if (byte_count == 0) return false;
      CoverageRange fresh(byte_offset, first_row ? *first_row : left->next_row() + 1);
      fresh.append(byte_offset, byte_count, std::move(cells));
      random_.insert(random_.begin() + static_cast<std::ptrdiff_t>(i), std::move(fresh));
      return true;
    }

    if (!right) break;
    left = right;
  }
  // zero-length span at the very end of the file
  return false;
}

void CoverageCache::merge_into(CoverageRange& left, std::size_t following_index) {
  if (following_index >= random_.size())
    throw InconsistentState("merge target " + std::to_string(following_index) + " not in cache");
  left.merge(std::move(random_[following_index]));
  random_.erase(random_.begin() + static_cast<std::ptrdiff_t>(following_index));
}

bool CoverageCache::complete() const {
  if (serial_.next_byte() > byte_length_)
    throw InconsistentState("serial range ends at byte " + std::to_string(serial_.next_byte()) +
                            ", beyond the file length " + std::to_string(byte_length_));
  const bool done = serial_.next_byte() == byte_length_;
  if (done && !random_.empty())
    throw InconsistentState("serial range reached the end of file but " +
                            std::to_string(random_.size()) + " random range(s) remain");
  return done;
}

bool CoverageCache::is_stored(std::int64_t byte_offset) const noexcept {
  if (serial_.contains_byte(byte_offset)) return true;
  for (const auto& r : random_) {
    if (r.contains_byte(byte_offset)) return true;
    if (r.first_byte() > byte_offset) break;
  }
  return false;
}

const Cells* CoverageCache::find_cells(std::int64_t row) const noexcept {
  if (row >= serial_.first_row() && row < serial_.next_row())
    return serial_.row(static_cast<std::size_t>(row - serial_.first_row()));
  for (const auto& r : random_) {
    if (row >= r.first_row() && row < r.next_row())
      return r.row(static_cast<std::size_t>(row - r.first_row()));
  }
  return nullptr;
}

std::optional<std::string> CoverageCache::cell(std::int64_t row, std::size_t column) const {
  if (row < 0) throw InvalidArgument("row index must be non-negative");
  if (column >= column_names_.size())
    throw ColumnOutOfRange("column " + std::to_string(column) + " out of range (" +
                           std::to_string(column_names_.size()) + " columns)");
  const Cells* cells = find_cells(row);
  if (!cells) return std::nullopt;
  return column < cells->size() ? (*cells)[column] : std::string();
}

std::optional<std::int64_t> CoverageCache::row_number(std::int64_t row) const {
  if (row < 0) throw InvalidArgument("row index must be non-negative");
  if (!find_cells(row)) return std::nullopt;
  return row;
}

std::vector<const CoverageRange*> CoverageCache::ranges() const {
  std::vector<const CoverageRange*> out;
  out.reserve(random_.size() + 1);
  out.push_back(&serial_);
  for (const auto& r : random_) out.push_back(&r);
  return out;
}

std::size_t CoverageCache::row_count() const noexcept {
  std::size_t n = serial_.row_count();
  for (const auto& r : random_) n += r.row_count();
  return n;
}

std::int64_t CoverageCache::row_byte_count() const noexcept {
  std::int64_t n = serial_.row_byte_count();
  for (const auto& r : random_) n += r.row_byte_count();
  return n;
}

std::int64_t CoverageCache::covered_byte_count() const noexcept {
  std::int64_t n = serial_.byte_count();
  for (const auto& r : random_) n += r.byte_count();
  return n;
}

}
