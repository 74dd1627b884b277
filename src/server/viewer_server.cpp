#include "lazy_csv/viewer_server.hpp"
#include "lazy_csv/dataframe.hpp"
#include "lazy_csv/errors.hpp"
#include "lazy_csv/json_writer.hpp"

#include <httplib.h>

#include <algorithm>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

namespace lc {

static constexpr const char* kJson = "application/json; charset=utf-8";

static bool param_i64(const httplib::Request& req, const char* key, std::int64_t* out) {
  if (!req.has_param(key)) return false;
  const std::string v = req.get_param_value(key);
  try {
    std::size_t used = 0;
    *out = std::stoll(v, &used);
    return used == v.size();
  } catch (const std::exception&) {
    return false;
  }
}

struct ViewerServer::Impl {
  CsvDataFrame& df;
  Config cfg;
  httplib::Server svr;
  std::mutex mu;  // one fetch at a time per data frame
  int bound_port = -1;

  Impl(CsvDataFrame& d, Config c) : df(d), cfg(std::move(c)) {}

  void fail(httplib::Response& res, int status, const std::string& msg) const {
    res.status = status;
    res.set_content(JsonWriter::error(msg), kJson);
  }

  void routes() {
    svr.Get("/meta", [this](const httplib::Request&, httplib::Response& res) {
      std::lock_guard<std::mutex> lk(mu);
      res.set_content(JsonWriter::to_json(JsonWriter::meta_of(df)), kJson);
    });

    svr.Get("/rows", [this](const httplib::Request& req, httplib::Response& res) {
      std::int64_t start = 0, end = 0;
      if (!param_i64(req, "start", &start) || !param_i64(req, "end", &end)) {
        fail(res, 400, "start and end must be integers");
        return;
      }
      if (end - start > cfg.max_rows_per_request) {
        fail(res, 400, "at most " + std::to_string(cfg.max_rows_per_request) + " rows per request");
        return;
      }

      std::lock_guard<std::mutex> lk(mu);
      try {
        if (!df.metadata().is_num_rows_estimated) end = std::min(end, df.num_rows());
        if (start > end) start = end;
        FetchRequest fr;
        fr.row_start = start;
        fr.row_end = end;
        df.fetch(fr);
        res.set_content(JsonWriter::to_json(JsonWriter::rows_of(df, start, end)), kJson);
      } catch (const InvalidArgument& e) {
        fail(res, 400, e.what());
      } catch (const OutOfBounds& e) {
        fail(res, 416, e.what());
      } catch (const TransportError& e) {
        std::cerr << "[serve] upstream error on /rows: " << e.what() << "\n";
        fail(res, 502, e.what());
      } catch (const Error& e) {
        std::cerr << "[serve] /rows failed: " << e.what() << "\n";
        fail(res, 500, e.what());
      }
    });
  }
};

ViewerServer::ViewerServer(CsvDataFrame& df, Config cfg) : p_(new Impl(df, std::move(cfg))) { p_->routes(); }
ViewerServer::~ViewerServer() { delete p_; }

bool ViewerServer::start() {
  if (p_->cfg.port == 0) {
    const int port = p_->svr.bind_to_any_port(p_->cfg.host);
    if (port <= 0) return false;
    p_->bound_port = port;
    return true;
  }
  if (!p_->svr.bind_to_port(p_->cfg.host, p_->cfg.port)) return false;
  p_->bound_port = p_->cfg.port;
  return true;
}

int ViewerServer::port() const noexcept { return p_->bound_port; }

bool ViewerServer::listen() { return p_->svr.listen_after_bind(); }

int ViewerServer::run() {
  if (!start()) return -1;
  return listen() ? 0 : -1;
}

void ViewerServer::stop() { p_->svr.stop(); }

}
