#include "lazy_csv/csv_tokenizer.hpp"

#include <cctype>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lc {

std::string_view newline_name(Newline nl) noexcept {
  switch (nl) {
    case Newline::Lf:   return "LF";
    case Newline::CrLf: return "CRLF";
    case Newline::Cr:   return "CR";
  }
  return "LF";
}

bool is_empty_row(const std::vector<std::string>& cells, bool greedy) noexcept {
  for (const auto& c : cells) {
    if (c.empty()) continue;
    if (!greedy) return false;
    for (unsigned char ch : c) if (!std::isspace(ch)) return false;
  }
  return true;
}

// --------------------------- dialect detection ---------------------------

static Newline detect_newline(std::string_view s, char quote) {
  bool in_quotes = false;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == quote) { in_quotes = !in_quotes; continue; }
    if (in_quotes) continue;
    if (c == '\n') return Newline::Lf;
    if (c == '\r') {
      if (i + 1 == s.size()) return Newline::CrLf;  // cut by the sample, assume the common case
      return s[i + 1] == '\n' ? Newline::CrLf : Newline::Cr;
    }
  }
  return Newline::Lf;
}

// Delimiter count per complete line (quote-aware), at most `max_lines`.
static std::vector<int> delimiter_counts(std::string_view s, char delim, char quote,
                                         char terminator, std::size_t max_lines) {
  std::vector<int> out;
  bool in_quotes = false;
  bool has_content = false;
  int count = 0;
  for (char c : s) {
    if (out.size() >= max_lines) break;
    if (c == quote) { in_quotes = !in_quotes; has_content = true; continue; }
    if (in_quotes) continue;
    if (c == terminator) {
      if (has_content) out.push_back(count);
      count = 0; has_content = false;
      continue;
    }
    if (c == '\r' || c == '\n') continue;
    has_content = true;
    if (c == delim) ++count;
  }
  // sample without any terminator: a single (possibly partial) line
  if (out.empty() && has_content) out.push_back(count);
  return out;
}

CsvDialect detect_dialect(std::string_view sample,
                          std::optional<char> delimiter,
                          std::optional<Newline> newline) {
  CsvDialect d;
  d.newline = newline ? *newline : detect_newline(sample, d.quote);
  if (delimiter) { d.delimiter = *delimiter; return d; }

  static constexpr char kCandidates[] = {',', '\t', ';', '|'};
  const char terminator = (d.newline == Newline::Cr) ? '\r' : '\n';

  bool found = false;
  long best_delta = 0;
  double best_avg = 0.0;
  for (char cand : kCandidates) {
    auto counts = delimiter_counts(sample, cand, d.quote, terminator, 10);
    if (counts.empty()) continue;
    long total = 0, delta = 0;
    for (int n : counts) { total += n; delta += std::labs(static_cast<long>(n - counts.front())); }
    const double avg = static_cast<double>(total) / static_cast<double>(counts.size());
    if (avg <= 0.0) continue;
    if (!found || delta < best_delta || (delta == best_delta && avg > best_avg)) {
      found = true; best_delta = delta; best_avg = avg; d.delimiter = cand;
    }
  }
  return d;
}

// ------------------------------ tokenizer -------------------------------

struct CsvTokenizer::Impl {
  enum class Mode { FieldStart, Unquoted, Quoted, QuoteEscape };

  CsvDialect d;
  std::int64_t pos;        // absolute offset of the next byte to feed
  std::int64_t row_start;  // absolute offset where the current row began
  Mode mode{Mode::FieldStart};
  bool pending_cr{false};  // CRLF dialect: '\r' seen outside quotes
  std::string field;
  std::vector<std::string> fields;

  Impl(const CsvDialect& dialect, std::int64_t first)
    : d(dialect), pos(first), row_start(first) {}

  void push_field() {
    fields.push_back(std::move(field));
    field.clear();
  }

  // A byte that does not terminate the row.
  void data(char c) {
    switch (mode) {
      case Mode::FieldStart:
        if (c == d.quote)          { mode = Mode::Quoted; }
        else if (c == d.delimiter) { push_field(); }
        else                       { field.push_back(c); mode = Mode::Unquoted; }
        break;
      case Mode::Unquoted:
        if (c == d.delimiter) { push_field(); mode = Mode::FieldStart; }
        else                  { field.push_back(c); }
        break;
      case Mode::Quoted:
        if (c == d.quote) mode = Mode::QuoteEscape;
        else              field.push_back(c);
        break;
      case Mode::QuoteEscape:
        if (c == d.quote)          { field.push_back(c); mode = Mode::Quoted; }   // escaped quote
        else if (c == d.delimiter) { push_field(); mode = Mode::FieldStart; }
        else                       { field.push_back(c); mode = Mode::Unquoted; } // lenient
        break;
    }
  }

  bool end_row(const RowCallback& on_row) {
    push_field();
    ParsedRow r;
    r.cells = std::move(fields);
    r.byte_offset = row_start;
    r.byte_count = pos - row_start;
    r.delimiter = d.delimiter;
    r.newline = d.newline;
    fields.clear();
    mode = Mode::FieldStart;
    row_start = pos;
    return on_row(r);
  }

  bool step(char c, const RowCallback& on_row) {
    if (pending_cr) {
      pending_cr = false;
      if (c == '\n') { ++pos; return end_row(on_row); }
      data('\r');
    }
    if (mode != Mode::Quoted) {
      switch (d.newline) {
        case Newline::Lf:
          if (c == '\n') { ++pos; return end_row(on_row); }
          break;
        case Newline::Cr:
          if (c == '\r') { ++pos; return end_row(on_row); }
          break;
        case Newline::CrLf:
          if (c == '\r') { pending_cr = true; ++pos; return true; }
          break;
      }
    }
    data(c);
    ++pos;
    return true;
  }
};

CsvTokenizer::CsvTokenizer(const CsvDialect& dialect, std::int64_t first_byte)
  : p_(new Impl(dialect, first_byte)) {}

CsvTokenizer::~CsvTokenizer() { delete p_; }

bool CsvTokenizer::feed(std::string_view chunk, const RowCallback& on_row) {
  for (char c : chunk) {
    if (!p_->step(c, on_row)) return false;
  }
  return true;
}

bool CsvTokenizer::finish(const RowCallback& on_row) {
  if (p_->pending_cr) {
    p_->pending_cr = false;
    p_->data('\r');
  }
  if (p_->pos > p_->row_start) return p_->end_row(on_row);
  return true;
}

std::int64_t CsvTokenizer::row_start() const noexcept { return p_->row_start; }
const CsvDialect& CsvTokenizer::dialect() const noexcept { return p_->d; }

}
