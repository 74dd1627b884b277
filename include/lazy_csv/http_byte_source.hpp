#pragma once
#include <cstdint>
#include <string>

#include "lazy_csv/byte_source.hpp"

namespace lc {

// Byte-range access over HTTP(S), on top of cpp-httplib.
// Length comes from HEAD (Content-Length), falling back to a one-byte range
// request. A server that ignores Range is downloaded once and sliced. An ETag
// that changes between requests means the file changed under us: the read
// fails rather than mixing two versions.
class HttpByteSource : public ByteSource {
public:
  struct Config {
    int  connect_timeout_sec = 10;
    int  read_timeout_sec    = 30;
    bool follow_redirects    = true;
  };

  HttpByteSource();                    // uses default Config{}
  explicit HttpByteSource(Config cfg);
  ~HttpByteSource() override;
  HttpByteSource(const HttpByteSource&) = delete;
  HttpByteSource& operator=(const HttpByteSource&) = delete;

  std::int64_t length(const std::string& url) override;
  std::string read(const std::string& url, std::int64_t offset, std::int64_t count) override;

private:
  struct Impl; Impl* p_;
};

}
