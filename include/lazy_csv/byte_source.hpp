#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>

namespace lc {

// Random access to the bytes of a remote (or local) file.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Total size in bytes.
  virtual std::int64_t length(const std::string& url) = 0;

  // Bytes [offset, offset + count), clipped at EOF. Throws TransportError.
  virtual std::string read(const std::string& url, std::int64_t offset, std::int64_t count) = 0;
};

// Named in-memory buffers.
class MemoryByteSource : public ByteSource {
public:
  void put(std::string url, std::string content);

  std::int64_t length(const std::string& url) override;
  std::string read(const std::string& url, std::int64_t offset, std::int64_t count) override;

  // Number of read() calls served so far.
  std::uint64_t reads() const noexcept { return reads_; }

private:
  const std::string& find(const std::string& url) const;

  std::unordered_map<std::string, std::string> files_;
  std::uint64_t reads_{0};
};

// Local files: "file:///abs/path" or a plain path.
class FileByteSource : public ByteSource {
public:
  std::int64_t length(const std::string& url) override;
  std::string read(const std::string& url, std::int64_t offset, std::int64_t count) override;
};

}
