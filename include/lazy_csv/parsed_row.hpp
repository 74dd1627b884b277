#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lc {

enum class Newline { Lf, CrLf, Cr };

std::string_view newline_name(Newline nl) noexcept;  // "LF" | "CRLF" | "CR"

struct CsvDialect {
  char    delimiter = ',';
  char    quote     = '"';
  Newline newline   = Newline::Lf;
};

// One tokenized row and the exact bytes it occupied in the file, terminator
// included. `delimiter`/`newline` echo the dialect the row was parsed with so
// the first probe can learn what was auto-detected.
struct ParsedRow {
  std::vector<std::string> cells;
  std::int64_t byte_offset = 0;
  std::int64_t byte_count  = 0;
  char    delimiter = ',';
  Newline newline   = Newline::Lf;
};

// True when no cell has content. `greedy` also treats whitespace-only cells
// as empty (used to skip blank lines before the header).
bool is_empty_row(const std::vector<std::string>& cells, bool greedy = false) noexcept;

}
