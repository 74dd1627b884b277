#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "lazy_csv/parsed_row.hpp"

namespace lc {

// Guess the dialect from the first bytes of a probe. Explicit values win.
CsvDialect detect_dialect(std::string_view sample,
                          std::optional<char> delimiter = std::nullopt,
                          std::optional<Newline> newline = std::nullopt);

// Streaming, quote-aware CSV state machine. Bytes are fed chunk by chunk;
// every completed row is reported with its absolute byte span (terminator
// included). A row split across chunks is carried until it completes.
class CsvTokenizer {
public:
  // Return false to stop tokenizing.
  using RowCallback = std::function<bool(const ParsedRow&)>;

  CsvTokenizer(const CsvDialect& dialect, std::int64_t first_byte);
  ~CsvTokenizer();
  CsvTokenizer(const CsvTokenizer&) = delete;
  CsvTokenizer& operator=(const CsvTokenizer&) = delete;

  // Returns false once the callback asked to stop.
  bool feed(std::string_view chunk, const RowCallback& on_row);

  // End of file: flush the unterminated trailing row, if any bytes remain.
  bool finish(const RowCallback& on_row);

  // Absolute offset of the first byte not yet part of a reported row.
  std::int64_t row_start() const noexcept;
  const CsvDialect& dialect() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
