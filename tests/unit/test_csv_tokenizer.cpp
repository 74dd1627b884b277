#include "lazy_csv/csv_tokenizer.hpp"
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

// Tokenize `text` fed in pieces of `step` bytes.
static std::vector<lc::ParsedRow> tokenize(const std::string& text, std::size_t step,
                                           lc::CsvDialect d = {}, bool at_eof = true) {
  std::vector<lc::ParsedRow> rows;
  auto keep = [&](const lc::ParsedRow& r){ rows.push_back(r); return true; };
  lc::CsvTokenizer tok(d, 0);
  for (std::size_t i = 0; i < text.size(); i += step)
    tok.feed(std::string_view(text).substr(i, step), keep);
  if (at_eof) tok.finish(keep);
  return rows;
}

int main(){
  // quoted delimiters, newlines and escaped quotes; spans include terminators
  const std::string text = "a,b\n\"x,1\",\"line\nbreak\"\n\"say \"\"hi\"\"\",3\nlast,4";
  for (std::size_t step : {std::size_t(1), std::size_t(3), std::size_t(7), text.size()}) {
    auto rows = tokenize(text, step);
    const std::string tag = " (step " + std::to_string(step) + ")";
    expect(rows.size() == 4, "four rows" + tag);
    if (rows.size() != 4) continue;
    expect(rows[1].cells.size() == 2 && rows[1].cells[0] == "x,1", "quoted delimiter" + tag);
    expect(rows[1].cells[1] == "line\nbreak", "quoted newline" + tag);
    expect(rows[2].cells[0] == "say \"hi\"", "escaped quotes" + tag);
    expect(rows[0].byte_offset == 0 && rows[0].byte_count == 4, "header span" + tag);
    expect(rows[1].byte_offset == 4 && rows[1].byte_count == 19, "multi-line row span" + tag);
    expect(rows[3].cells[0] == "last" && rows[3].byte_offset + rows[3].byte_count ==
           static_cast<std::int64_t>(text.size()), "unterminated last row flushed at EOF" + tag);
  }

  // the trailing fragment is held back unless finish() is called
  {
    auto rows = tokenize("a,b\n1,2", 2, {}, false);
    expect(rows.size() == 1, "partial row is not reported before EOF");
  }

  // CRLF split across chunks
  {
    lc::CsvDialect d;
    d.newline = lc::Newline::CrLf;
    auto rows = tokenize("a,b\r\n1,2\r\n", 4, d);
    expect(rows.size() == 2, "CRLF: two rows");
    expect(rows.size() == 2 && rows[0].byte_count == 5 && rows[1].byte_offset == 5, "CRLF: spans");
    expect(rows.size() == 2 && rows[1].cells[1] == "2", "CRLF: no stray CR in cells");
  }

  // blank lines become empty rows
  {
    auto rows = tokenize("a\n\n \nb\n", 1);
    expect(rows.size() == 4, "blank lines are rows");
    expect(rows.size() == 4 && lc::is_empty_row(rows[1].cells), "blank line is empty");
    expect(rows.size() == 4 && !lc::is_empty_row(rows[2].cells) && lc::is_empty_row(rows[2].cells, true),
           "whitespace line is empty only when greedy");
  }

  // absolute offsets
  {
    lc::CsvTokenizer tok(lc::CsvDialect{}, 1000);
    std::int64_t off = -1;
    tok.feed("x,y\n", [&](const lc::ParsedRow& r){ off = r.byte_offset; return true; });
    expect(off == 1000 && tok.row_start() == 1004, "offsets are absolute");
  }

  // early stop
  {
    lc::CsvTokenizer tok(lc::CsvDialect{}, 0);
    int seen = 0;
    bool go_on = tok.feed("1\n2\n3\n", [&](const lc::ParsedRow&){ return ++seen < 2; });
    expect(!go_on && seen == 2, "callback can stop the tokenizer");
  }

  // dialect detection
  {
    auto d = lc::detect_dialect("a;b;c\r\n1;2;3\r\n4;5;6\r\n");
    expect(d.delimiter == ';' && d.newline == lc::Newline::CrLf, "semicolon + CRLF detected");
    auto t = lc::detect_dialect("a\tb\n\"x,y\"\t2\n");
    expect(t.delimiter == '\t' && t.newline == lc::Newline::Lf, "tab wins over a quoted comma");
    auto r = lc::detect_dialect("a|b\r1|2\r");
    expect(r.delimiter == '|' && r.newline == lc::Newline::Cr, "pipe + CR detected");
    auto forced = lc::detect_dialect("a;b\n", ',', lc::Newline::CrLf);
    expect(forced.delimiter == ',' && forced.newline == lc::Newline::CrLf, "explicit dialect wins");
    auto single = lc::detect_dialect("onlyone\n");
    expect(single.delimiter == ',', "default delimiter without candidates");
  }

  if (failures) { std::cerr << "[FAIL] " << failures << " tokenizer check(s)\n"; return 1; }
  std::cout << "[PASS] csv tokenizer quotes/CRLF/detection\n";
  return 0;
}
