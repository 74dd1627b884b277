#include "lazy_csv/byte_source.hpp"
#include "lazy_csv/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

namespace lc {

void MemoryByteSource::put(std::string url, std::string content) {
  files_[std::move(url)] = std::move(content);
}

const std::string& MemoryByteSource::find(const std::string& url) const {
  auto it = files_.find(url);
  if (it == files_.end()) throw TransportError("not found: " + url);
  return it->second;
}

std::int64_t MemoryByteSource::length(const std::string& url) {
  return static_cast<std::int64_t>(find(url).size());
}

std::string MemoryByteSource::read(const std::string& url, std::int64_t offset, std::int64_t count) {
  const std::string& s = find(url);
  ++reads_;
  if (offset < 0 || count < 0) throw InvalidArgument("negative read window");
  const auto size = static_cast<std::int64_t>(s.size());
  if (offset >= size) return {};
  return s.substr(static_cast<std::size_t>(offset),
                  static_cast<std::size_t>(std::min(count, size - offset)));
}

static std::string local_path(const std::string& url) {
  static constexpr const char* kScheme = "file://";
  if (url.rfind(kScheme, 0) == 0) return url.substr(std::strlen(kScheme));
  return url;
}

std::int64_t FileByteSource::length(const std::string& url) {
  std::error_code ec;
  auto n = std::filesystem::file_size(local_path(url), ec);
  if (ec) throw TransportError("cannot stat " + url + ": " + ec.message());
  return static_cast<std::int64_t>(n);
}

std::string FileByteSource::read(const std::string& url, std::int64_t offset, std::int64_t count) {
  if (offset < 0 || count < 0) throw InvalidArgument("negative read window");
  const std::string path = local_path(url);
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) throw TransportError("cannot open " + url + ": " + std::strerror(errno));

  std::string out;
  if (std::fseek(f, static_cast<long>(offset), SEEK_SET) != 0) {
    const int err = errno;
    std::fclose(f);
    throw TransportError("cannot seek " + url + ": " + std::strerror(err));
  }
  out.resize(static_cast<std::size_t>(count));
  const std::size_t n = std::fread(out.data(), 1, out.size(), f);
  if (n < out.size() && std::ferror(f)) {
    const int err = errno;
    std::fclose(f);
    throw TransportError("cannot read " + url + ": " + std::strerror(err));
  }
  std::fclose(f);
  out.resize(n);
  return out;
}

}
