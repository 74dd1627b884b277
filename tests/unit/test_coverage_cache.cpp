#include "lazy_csv/coverage_cache.hpp"
#include "lazy_csv/errors.hpp"
#include <iostream>
#include <string>

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

template <class E, class F>
static bool throws(F&& f) {
  try { f(); } catch (const E&) { return true; } catch (...) { return false; }
  return false;
}

int main(){
  // "a,b\n1,2\n3,4\n\n5,6\n"
  //  [0,4) header  [4,8)  [8,12)  [12,13) blank  [13,17)
  lc::CoverageCache c({"a", "b"}, 17, 4);
  expect(c.serial().next_byte() == 4 && c.row_count() == 0, "header seeds the serial range");
  expect(!c.complete(), "fresh cache is not complete");

  expect(c.store(4, 4, lc::Cells{"1", "2"}), "first data row stored");
  expect(!c.store(4, 4, lc::Cells{"1", "2"}), "storing the same span twice is a no-op");
  expect(c.row_count() == 1, "duplicate store leaves the count alone");

  expect(c.store(13, 4, lc::Cells{"5", "6"}), "isolated row opens a random range");
  expect(c.random().size() == 1 && c.range_count() == 2, "one random range");
  expect(c.random()[0].first_row() == 2, "default first row is one past the left neighbour");
  expect(c.is_stored(14) && !c.is_stored(9), "is_stored answers per byte");

  expect(throws<lc::InconsistentOverlap>([&]{ c.store(10, 4, lc::Cells{"x"}); }),
         "span crossing into the next range throws");
  expect(throws<lc::InconsistentOverlap>([&]{ c.store(6, 4, lc::Cells{"x"}); }),
         "span straddling the serial end throws");
  expect(throws<lc::OutOfBounds>([&]{ c.store(16, 4, lc::Cells{"x"}); }), "span past EOF throws");
  expect(throws<lc::InvalidArgument>([&]{ c.store(-1, 1); }), "negative offset throws");

  expect(c.store(12, 1), "blank line prepends to the random range");
  expect(c.random()[0].first_byte() == 12 && c.random()[0].first_row() == 2,
         "ignored prepend keeps the row index");

  expect(c.store(8, 4, lc::Cells{"3", "4"}), "closing the gap");
  expect(c.random().empty() && c.range_count() == 1, "contiguous ranges merged");
  expect(c.complete(), "serial reaches EOF");
  expect(c.row_count() == 3 && c.covered_byte_count() == 17, "all rows and bytes covered");
  expect(c.row_byte_count() == 12, "row bytes exclude header and blank line");
  expect(c.cell(2, 0) == std::optional<std::string>("5"), "merged row readable at its exact index");
  expect(c.cell(1, 1) == std::optional<std::string>("4"), "cell(1, 1)");
  expect(c.row_number(2) == std::optional<std::int64_t>(2), "row_number confirms stored rows");
  expect(!c.row_number(3), "row_number is absent past the stored rows");
  expect(throws<lc::ColumnOutOfRange>([&]{ (void)c.cell(0, 2); }), "column out of range throws");

  // ragged rows read as empty strings
  lc::CoverageCache r({"a", "b", "c"}, 100, 6);
  r.store(6, 2, lc::Cells{"1"});
  expect(r.cell(0, 2) == std::optional<std::string>(""), "missing trailing cell is empty");
  expect(!r.cell(1, 0), "unstored row is absent");

  // explicit row hint for an isolated span
  r.store(50, 5, lc::Cells{"x", "y", "z"}, 9);
  expect(r.random().size() == 1 && r.random()[0].first_row() == 9, "row hint used for a new range");
  r.store(55, 5, lc::Cells{"u"}, 42);
  expect(r.random()[0].next_row() == 11, "hint ignored when appending");
  expect(!r.store(70, 0), "zero-byte isolated span is a no-op");

  // construction
  expect(throws<lc::InvalidArgument>([]{ lc::CoverageCache({}, 10, 2); }), "no columns throws");
  expect(throws<lc::OutOfBounds>([]{ lc::CoverageCache({"a"}, 3, 4); }), "header longer than file throws");

  lc::ParsedRow header;
  header.cells = {"x", "y"};
  header.byte_offset = 2;   // two blank lines first
  header.byte_count = 5;
  header.delimiter = ';';
  header.newline = lc::Newline::CrLf;
  auto h = lc::CoverageCache::from_header(header, 30);
  expect(h.header_byte_count() == 7 && h.serial().next_byte() == 7, "header span includes leading blanks");
  expect(h.dialect().delimiter == ';' && h.dialect().newline == lc::Newline::CrLf, "dialect from header row");
  expect(h.column_count() == 2 && h.column_names()[1] == "y", "column names from header row");

  lc::CoverageCache only_header({"a"}, 2, 2);
  expect(only_header.complete() && only_header.row_count() == 0, "header-only file is complete");

  if (failures) { std::cerr << "[FAIL] " << failures << " coverage cache check(s)\n"; return 1; }
  std::cout << "[PASS] coverage cache store/merge/lookup\n";
  return 0;
}
