#pragma once
#include <cstdint>
#include <string>

namespace lc {

class CsvDataFrame;

// Tiny wrapper around cpp-httplib exposing one data frame as JSON:
//   GET /meta                 columns, row count, estimate flag, fetch stats
//   GET /rows?start=A&end=B   fetch then return rows [A, B)
// Requests are serialized; the data frame must outlive the server.
class ViewerServer {
public:
  struct Config {
    std::string host = "0.0.0.0";
    int port = 8080;                           // 0: any free port
    std::int64_t max_rows_per_request = 1000;
  };

  ViewerServer(CsvDataFrame& df, Config cfg);
  ~ViewerServer();
  ViewerServer(const ViewerServer&) = delete;
  ViewerServer& operator=(const ViewerServer&) = delete;

  // Bind only; returns false on bind error.
  bool start();

  // Port bound by start(), or -1.
  int port() const noexcept;

  // Blocking accept loop after start(); returns when stopped.
  bool listen();

  // start() + listen().
  int run();

  void stop();

private:
  struct Impl;
  Impl* p_;
};

}
