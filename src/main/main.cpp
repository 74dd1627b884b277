#include "lazy_csv/byte_source.hpp"
#include "lazy_csv/config.hpp"
#include "lazy_csv/dataframe.hpp"
#include "lazy_csv/errors.hpp"
#include "lazy_csv/events.hpp"
#include "lazy_csv/http_byte_source.hpp"
#include "lazy_csv/viewer_server.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

struct Cli {
  std::string url;
  std::string config_path;
  std::optional<std::size_t> chunk_size;
  std::optional<std::int64_t> initial_rows;
  std::int64_t row_start = 0;
  std::int64_t row_end = 20;
  bool serve = false;
  int port = 8080;
  bool verbose = false;
};

void usage() {
  std::cout <<
    "Usage: lazy-csv --url=<http(s)://...|file://...|path> [--config=<file.json>]\n"
    "                [--chunk-size=N] [--initial-rows=N] [--rows=A:B]\n"
    "                [--serve] [--port=N] [--verbose]\n";
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    if (eat("--url=", &c.url)) continue;
    if (eat("--config=", &c.config_path)) continue;
    if (eat("--chunk-size=", &v))   { c.chunk_size = static_cast<std::size_t>(std::stoull(v)); continue; }
    if (eat("--initial-rows=", &v)) { c.initial_rows = std::stoll(v); continue; }
    if (eat("--port=", &v))         { c.port = std::stoi(v); continue; }
    if (eat("--rows=", &v)) {
      const auto colon = v.find(':');
      if (colon == std::string::npos) throw lc::InvalidArgument("--rows expects A:B");
      c.row_start = std::stoll(v.substr(0, colon));
      c.row_end = std::stoll(v.substr(colon + 1));
      continue;
    }
    if (a == "--serve")   { c.serve = true; continue; }
    if (a == "--verbose") { c.verbose = true; continue; }
    if (a == "-h" || a == "--help") { usage(); std::exit(0); }
    std::cerr << "[cli] ignoring unknown argument: " << a << "\n";
  }
  return c;
}

std::shared_ptr<lc::ByteSource> byte_source_for(const std::string& url) {
  if (url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0)
    return std::make_shared<lc::HttpByteSource>();
  return std::make_shared<lc::FileByteSource>();
}

int print_rows(lc::CsvDataFrame& df, std::int64_t start, std::int64_t end) {
  std::uint64_t resolved = 0;
  auto id = df.events().add_listener([&](const lc::DataFrameEvent& ev) {
    if (ev.kind == lc::EventKind::Resolve) ++resolved;
  });

  if (!df.metadata().is_num_rows_estimated && end > df.num_rows()) end = df.num_rows();
  lc::FetchRequest req;
  req.row_start = start;
  req.row_end = end;
  df.fetch(req);
  df.events().remove_listener(id);

  std::cout << "#";
  for (const auto& c : df.column_descriptors()) std::cout << "\t" << c.name;
  std::cout << "\n";
  for (std::int64_t row = start; row < end; ++row) {
    auto n = df.get_row_number(row);
    std::cout << (n ? std::to_string(*n) : std::string("?"));
    for (const auto& c : df.column_descriptors()) {
      auto v = df.get_cell(row, c.name);
      std::cout << "\t" << (v ? *v : std::string());
    }
    std::cout << "\n";
  }

  const auto s = df.stats();
  std::cerr << "[cli] rows=" << df.num_rows()
            << (df.metadata().is_num_rows_estimated ? " (estimated)" : "")
            << " resolved=" << resolved << " requests=" << s.requests
            << " bytes=" << s.bytes << " passes=" << s.passes << "\n";
  return 0;
}

}

int main(int argc, char** argv) {
  try {
    auto cli = parse_cli(argc, argv);
    if (cli.url.empty()) { usage(); return 2; }

    lc::Config cfg = cli.config_path.empty() ? lc::Config{} : lc::load_config(cli.config_path);
    if (cli.chunk_size) cfg.chunk_size = *cli.chunk_size;
    if (cli.initial_rows) cfg.initial_row_count = *cli.initial_rows;
    if (cli.verbose) cfg.verbose = true;

    auto df = lc::CsvDataFrame::open_bytes(cli.url, byte_source_for(cli.url), cfg);

    if (!cli.serve) return print_rows(*df, cli.row_start, cli.row_end);

    lc::ViewerServer::Config scfg;
    scfg.port = cli.port;
    lc::ViewerServer server(*df, scfg);
    if (!server.start()) {
      std::cerr << "Server failed to start on port " << cli.port << "\n";
      return 1;
    }
    std::cerr << "[serve] " << cli.url << " on port " << server.port() << "\n";
    return server.listen() ? 0 : 1;
  } catch (const lc::InputError& e) {
    std::cerr << "[cli] " << e.what() << "\n";
    return 3;
  } catch (const lc::Error& e) {
    std::cerr << "[cli] " << e.what() << "\n";
    return 1;
  } catch (const std::logic_error& e) {
    // std::stoi and friends on a malformed flag value
    std::cerr << "[cli] bad argument: " << e.what() << "\n";
    return 2;
  }
}
