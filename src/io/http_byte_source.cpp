#include "lazy_csv/http_byte_source.hpp"
#include "lazy_csv/errors.hpp"

#include <httplib.h>

#include <algorithm>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

namespace lc {

namespace {

struct Target {
  std::string origin;  // scheme://host[:port]
  std::string path;
};

Target split_url(const std::string& url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || (url.rfind("http", 0) != 0))
    throw InvalidArgument("not an http(s) URL: " + url);
  const auto path_start = url.find('/', scheme_end + 3);
  Target t;
  t.origin = url.substr(0, path_start);
  t.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);
  return t;
}

std::string slice(const std::string& s, std::int64_t offset, std::int64_t count) {
  const auto size = static_cast<std::int64_t>(s.size());
  if (offset >= size) return {};
  return s.substr(static_cast<std::size_t>(offset),
                  static_cast<std::size_t>(std::min(count, size - offset)));
}

// "bytes 0-0/1234" -> 1234
std::int64_t total_from_content_range(const std::string& v) {
  const auto slash = v.rfind('/');
  if (slash == std::string::npos || slash + 1 >= v.size() || v[slash + 1] == '*') return -1;
  try {
    return std::stoll(v.substr(slash + 1));
  } catch (const std::exception&) {
    return -1;
  }
}

}

struct HttpByteSource::Impl {
  Config cfg;
  std::unordered_map<std::string, std::unique_ptr<httplib::Client>> clients;  // by origin
  std::unordered_map<std::string, std::string> etags;     // url -> first ETag seen
  std::unordered_map<std::string, std::int64_t> lengths;  // url -> byte length
  std::unordered_map<std::string, std::string> whole;     // url -> body, when Range is ignored

  explicit Impl(Config c) : cfg(c) {}

  httplib::Client& client(const std::string& origin) {
    auto it = clients.find(origin);
    if (it != clients.end()) return *it->second;
    auto c = std::make_unique<httplib::Client>(origin);
    c->set_connection_timeout(cfg.connect_timeout_sec, 0);
    c->set_read_timeout(cfg.read_timeout_sec, 0);
    c->set_follow_location(cfg.follow_redirects);
    return *clients.emplace(origin, std::move(c)).first->second;
  }

  void check_etag(const std::string& url, const httplib::Response& res) {
    if (!res.has_header("ETag")) return;
    auto tag = res.get_header_value("ETag");
    auto [it, inserted] = etags.emplace(url, tag);
    if (!inserted && it->second != tag)
      throw TransportError("remote file changed during the session (ETag " + it->second +
                           " -> " + tag + "): " + url);
  }

  std::int64_t length(const std::string& url) {
    auto cached = lengths.find(url);
    if (cached != lengths.end()) return cached->second;

    const Target t = split_url(url);
    auto& cli = client(t.origin);
    std::int64_t len = -1;

    if (auto res = cli.Head(t.path)) {
      if (res->status >= 200 && res->status < 300) {
        check_etag(url, *res);
        if (res->has_header("Content-Length")) {
          try {
            len = std::stoll(res->get_header_value("Content-Length"));
          } catch (const std::exception&) {
            len = -1;
          }
        }
      }
    }

    if (len < 0) {
      httplib::Headers h{{"Range", "bytes=0-0"}};
      auto res = cli.Get(t.path, h);
      if (!res) throw TransportError("GET " + url + " failed: " + httplib::to_string(res.error()));
      check_etag(url, *res);
      if (res->status == 206 && res->has_header("Content-Range")) {
        len = total_from_content_range(res->get_header_value("Content-Range"));
      } else if (res->status == 200) {
        len = static_cast<std::int64_t>(res->body.size());
        whole[url] = std::move(res->body);
      } else {
        throw TransportError("GET " + url + " returned HTTP " + std::to_string(res->status));
      }
      if (len < 0) throw TransportError("cannot determine the length of " + url);
    }

    lengths[url] = len;
    return len;
  }

  std::string read(const std::string& url, std::int64_t offset, std::int64_t count) {
    if (offset < 0 || count < 0) throw InvalidArgument("negative read window");
    if (count == 0) return {};
    auto w = whole.find(url);
    if (w != whole.end()) return slice(w->second, offset, count);

    const Target t = split_url(url);
    httplib::Headers h{{"Range", "bytes=" + std::to_string(offset) + "-" +
                                 std::to_string(offset + count - 1)}};
    auto res = client(t.origin).Get(t.path, h);
    if (!res) throw TransportError("GET " + url + " failed: " + httplib::to_string(res.error()));
    check_etag(url, *res);

    switch (res->status) {
      case 206:
        return std::move(res->body);
      case 200: {
        // no range support: keep the whole body, serve later reads from it
        auto& body = whole[url] = std::move(res->body);
        return slice(body, offset, count);
      }
      case 416:
        return {};
      default:
        throw TransportError("GET " + url + " returned HTTP " + std::to_string(res->status));
    }
  }
};

HttpByteSource::HttpByteSource() : HttpByteSource(Config{}) {}
HttpByteSource::HttpByteSource(Config cfg) : p_(new Impl(cfg)) {}
HttpByteSource::~HttpByteSource() { delete p_; }

std::int64_t HttpByteSource::length(const std::string& url) { return p_->length(url); }

std::string HttpByteSource::read(const std::string& url, std::int64_t offset, std::int64_t count) {
  return p_->read(url, offset, count);
}

}
