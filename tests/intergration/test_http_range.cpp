#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <httplib.h>
#include <simdjson.h>

#include "lazy_csv/dataframe.hpp"
#include "lazy_csv/errors.hpp"
#include "lazy_csv/http_byte_source.hpp"
#include "lazy_csv/viewer_server.hpp"

using namespace std::chrono_literals;

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static std::string synthetic(int rows) {
  std::string s = "id,name,score\n";
  for (int i = 0; i < rows; ++i)
    s += std::to_string(i) + ",\"name " + std::to_string(i) + "\"," + std::to_string(i * 7 % 100) + "\n";
  return s;
}

static bool wait_up(int port, const char* path) {
  httplib::Client cli("127.0.0.1", port);
  for (int i = 0; i < 50; i++) {
    if (auto res = cli.Get(path)) return true;
    std::this_thread::sleep_for(100ms);
  }
  return false;
}

int main() {
  const std::string body = synthetic(2000);
  std::atomic<int> range_requests{0};
  std::atomic<int> version{1};

  // upstream file server; httplib answers Range requests with 206 on its own
  httplib::Server upstream;
  upstream.Get("/data.csv", [&](const httplib::Request& req, httplib::Response& res) {
    if (req.has_header("Range")) ++range_requests;
    res.set_header("ETag", "\"v1\"");
    res.set_content(body, "text/csv");
  });
  upstream.Get("/changing.csv", [&](const httplib::Request&, httplib::Response& res) {
    res.set_header("ETag", "\"v" + std::to_string(version++) + "\"");
    res.set_content(body, "text/csv");
  });
  const int up_port = upstream.bind_to_any_port("127.0.0.1");
  if (up_port <= 0) { std::cerr << "[FAIL] could not bind upstream\n"; return 1; }
  std::thread up_thread([&]{ upstream.listen_after_bind(); });
  if (!wait_up(up_port, "/data.csv")) {
    upstream.stop(); up_thread.join();
    std::cerr << "[FAIL] upstream did not come up\n";
    return 1;
  }
  const std::string base = "http://127.0.0.1:" + std::to_string(up_port);

  // direct byte source
  auto http = std::make_shared<lc::HttpByteSource>();
  expect(http->length(base + "/data.csv") == static_cast<std::int64_t>(body.size()), "length via HEAD");
  expect(http->read(base + "/data.csv", 0, 14) == "id,name,score\n", "range read of the header");
  expect(http->read(base + "/data.csv", 14, 8) == body.substr(14, 8), "range read mid-file");

  lc::Config cfg;
  cfg.chunk_size = 1024;
  cfg.initial_row_count = 20;
  auto df = lc::CsvDataFrame::open_bytes(base + "/data.csv", http, cfg);
  expect(df->column_descriptors().size() == 3, "columns over http");
  expect(df->metadata().is_num_rows_estimated, "estimated after the probe");
  const int probe_ranges = range_requests.load();
  expect(probe_ranges >= 1, "probe used range requests");

  df->fetch(lc::FetchRequest{1500, 1510});
  bool window = true;
  for (std::int64_t r = 1500; r < 1510; ++r) window &= static_cast<bool>(df->get_cell(r, "name"));
  expect(window, "far window resolved over http");
  expect(df->stats().bytes < body.size() / 2, "far window did not download the file");

  // a changed ETag mid-session is a transport error
  auto fresh = std::make_shared<lc::HttpByteSource>();
  bool changed = false;
  try {
    lc::CsvDataFrame::open_bytes(base + "/changing.csv", fresh, cfg);
  } catch (const lc::TransportError&) {
    changed = true;
  }
  expect(changed, "ETag change detected");

  // viewer endpoint over the same data frame
  lc::ViewerServer::Config vcfg;
  vcfg.host = "127.0.0.1";
  vcfg.port = 0;
  lc::ViewerServer viewer(*df, vcfg);
  if (!viewer.start()) {
    upstream.stop(); up_thread.join();
    std::cerr << "[FAIL] could not bind viewer\n";
    return 1;
  }
  std::thread viewer_thread([&]{ viewer.listen(); });
  expect(wait_up(viewer.port(), "/meta"), "viewer is up");

  httplib::Client cli("127.0.0.1", viewer.port());
  simdjson::dom::parser parser;
  if (auto res = cli.Get("/meta")) {
    expect(res->status == 200, "GET /meta 200");
    simdjson::dom::element doc = parser.parse(res->body);
    std::string_view first_col = doc["columns"].at(0).get_string();
    expect(first_col == "id", "meta columns");
    expect(doc["byte_length"].get_uint64().value() == body.size(), "meta byte_length");
    expect(doc["is_num_rows_estimated"].get_bool().value(), "meta estimate flag");
  } else {
    expect(false, "GET /meta answered");
  }

  if (auto res = cli.Get("/rows?start=1500&end=1502")) {
    expect(res->status == 200, "GET /rows 200");
    simdjson::dom::element doc = parser.parse(res->body);
    std::size_t n = 0;
    bool cells_ok = true;
    for (simdjson::dom::element row : doc["rows"].get_array()) {
      for (simdjson::dom::element cell : row["cells"].get_array()) cells_ok &= !cell.is_null();
      ++n;
    }
    expect(n == 2 && cells_ok, "rows payload has two resolved rows");
  } else {
    expect(false, "GET /rows answered");
  }

  if (auto res = cli.Get("/rows?start=abc&end=2")) expect(res->status == 400, "bad query is a 400");
  else expect(false, "GET /rows with a bad query answered");

  viewer.stop();
  viewer_thread.join();
  upstream.stop();
  up_thread.join();

  if (failures) { std::cerr << "[FAIL] " << failures << " http check(s)\n"; return 1; }
  std::cout << "[PASS] http range source, ETag check, viewer endpoint\n";
  return 0;
}
