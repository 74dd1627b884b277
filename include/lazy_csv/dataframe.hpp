#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lazy_csv/config.hpp"
#include "lazy_csv/events.hpp"
#include "lazy_csv/metrics.hpp"

namespace lc {

class ByteSource;
class CancelToken;
class CoverageCache;
class Estimator;
class RowSource;

struct ColumnDescriptor {
  std::string name;
};

struct DataFrameMetadata {
  bool is_num_rows_estimated = true;
};

struct SortColumn {
  std::string column;
  bool descending = false;
};
// Accepted for interface compatibility; any non-empty value is rejected.
using OrderBy = std::vector<SortColumn>;

struct FetchRequest {
  std::int64_t row_start = 0;
  std::int64_t row_end = 0;
  std::vector<std::string> columns;  // validated, all columns are fetched anyway
  OrderBy order_by;
  const CancelToken* cancel = nullptr;
};

// Viewer-facing table over a remote CSV file. Reads answer from what has
// been parsed so far; fetch() parses more. Not thread-safe: callers
// serialize.
class CsvDataFrame {
public:
  // Probe the start of the file: header plus about cfg.initial_row_count
  // rows. Throws InvalidArgument (config), InputError (no header / no data
  // row), TransportError.
  static std::unique_ptr<CsvDataFrame> open(std::string url, std::shared_ptr<RowSource> source,
                                            std::int64_t byte_length, const Config& cfg = {});

  // Same, over a ByteSource read in cfg.chunk_size pieces. The length is
  // asked from the source.
  static std::unique_ptr<CsvDataFrame> open_bytes(std::string url, std::shared_ptr<ByteSource> bytes,
                                                  const Config& cfg = {});

  ~CsvDataFrame();
  CsvDataFrame(const CsvDataFrame&) = delete;
  CsvDataFrame& operator=(const CsvDataFrame&) = delete;

  std::int64_t num_rows() const;
  DataFrameMetadata metadata() const;
  const std::vector<ColumnDescriptor>& column_descriptors() const noexcept;

  // Absent until the row is stored (cells) or positioned (row numbers).
  std::optional<std::string> get_cell(std::int64_t row, const std::string& column,
                                      const OrderBy& order_by = {}) const;
  std::optional<std::int64_t> get_row_number(std::int64_t row, const OrderBy& order_by = {}) const;

  void fetch(const FetchRequest& req);

  EventTarget& events() noexcept;

  const std::string& url() const noexcept;
  std::int64_t byte_length() const noexcept;
  const Config& config() const noexcept;
  const CoverageCache& cache() const noexcept;
  const Estimator& estimator() const noexcept;
  FetchStats stats() const;

private:
  struct Impl;
  explicit CsvDataFrame(Impl* p);
  Impl* p_;
};

}
