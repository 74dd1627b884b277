#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "lazy_csv/metrics.hpp"

namespace lc {

class CsvDataFrame;

struct MetaPayload {
  std::string url;
  std::vector<std::string> columns;
  std::int64_t num_rows = 0;
  bool is_num_rows_estimated = true;
  std::int64_t byte_length = 0;
  FetchStats stats;
};

struct RowPayload {
  std::int64_t row = 0;
  std::optional<std::int64_t> row_number;
  std::vector<std::optional<std::string>> cells;  // nullopt: not resolved yet
};

struct RowsPayload {
  std::int64_t start = 0;
  std::int64_t end = 0;
  std::int64_t num_rows = 0;
  bool is_num_rows_estimated = true;
  std::vector<RowPayload> rows;
};

class JsonWriter {
public:
  static std::string to_json(const MetaPayload& p);
  static std::string to_json(const RowsPayload& p);

  // {"error": msg}
  static std::string error(const std::string& msg);

  // Snapshot of a data frame: metadata, or rows [start, end) as currently known.
  static MetaPayload meta_of(const CsvDataFrame& df);
  static RowsPayload rows_of(const CsvDataFrame& df, std::int64_t start, std::int64_t end);
};

}
