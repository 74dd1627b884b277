#include "lazy_csv/config.hpp"
#include "lazy_csv/errors.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

template <class E, class F>
static bool throws(F&& f) {
  try { f(); } catch (const E&) { return true; } catch (...) { return false; }
  return false;
}

static std::string write_tmp(const std::string& name, const std::string& body) {
  const fs::path p = fs::temp_directory_path() / ("lazy_csv_" + name + ".json");
  std::ofstream out(p, std::ios::binary);
  out << body;
  return p.string();
}

int main(){
  const fs::path ok = "tests/data/config_ok.json";
  if (!fs::exists(ok)) { std::cerr << "[ERR] missing: " << ok << "\n"; return 2; }

  const lc::Config defaults;
  expect(defaults.chunk_size == 100 * 1024 && defaults.initial_row_count == 50, "defaults");
  expect(!throws<lc::InvalidArgument>([&]{ lc::validate_config(defaults); }), "defaults are valid");

  auto cfg = lc::load_config(ok.string());
  expect(cfg.chunk_size == 4096, "chunk_size from file");
  expect(cfg.initial_row_count == 10, "initial_row_count from file");
  expect(cfg.max_cached_bytes == 1048576, "max_cached_bytes from file");
  expect(cfg.verbose, "verbose from file");

  auto partial = lc::load_config(write_tmp("partial", "{\"initial_row_count\": 0}"));
  expect(partial.initial_row_count == 0 && partial.chunk_size == defaults.chunk_size,
         "missing keys keep their defaults");

  expect(throws<lc::InvalidArgument>([&]{ lc::load_config(write_tmp("neg", "{\"chunk_size\": -1}")); }),
         "negative value rejected");
  expect(throws<lc::InvalidArgument>([&]{ lc::load_config(write_tmp("frac", "{\"chunk_size\": 1.5}")); }),
         "fractional value rejected");
  expect(throws<lc::InvalidArgument>([&]{ lc::load_config(write_tmp("str", "{\"initial_row_count\": \"5\"}")); }),
         "string value rejected");
  expect(throws<lc::InvalidArgument>([&]{ lc::load_config(write_tmp("bool", "{\"verbose\": 1}")); }),
         "non-boolean verbose rejected");
  expect(throws<lc::InvalidArgument>([&]{ lc::load_config(write_tmp("bad", "{\"chunk_size\": }")); }),
         "malformed JSON rejected");
  expect(throws<lc::InvalidArgument>([&]{ lc::load_config(write_tmp("arr", "[1, 2]")); }),
         "non-object rejected");
  expect(throws<lc::InvalidArgument>([&]{ lc::load_config("tests/data/no_such_config.json"); }),
         "missing file rejected");

  lc::Config zero;
  zero.chunk_size = 0;
  expect(throws<lc::InvalidArgument>([&]{ lc::validate_config(zero); }), "zero chunk size rejected");
  lc::Config big;
  big.chunk_size = 2048;
  big.max_cached_bytes = 1024;
  expect(throws<lc::InvalidArgument>([&]{ lc::validate_config(big); }), "chunk larger than the cache rejected");
  lc::Config neg;
  neg.initial_row_count = -1;
  expect(throws<lc::InvalidArgument>([&]{ lc::validate_config(neg); }), "negative initial rows rejected");

  if (failures) { std::cerr << "[FAIL] " << failures << " config check(s)\n"; return 1; }
  std::cout << "[PASS] config load/validate\n";
  return 0;
}
