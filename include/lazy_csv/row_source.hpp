#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "lazy_csv/parsed_row.hpp"

namespace lc {

class ByteSource;
class FetchMetrics;

// Bytes [first_byte, end_byte) of a file of `byte_length` bytes.
struct ByteWindow {
  std::int64_t first_byte = 0;
  std::int64_t end_byte = 0;
};

struct ParseRequest {
  std::string url;
  ByteWindow window;
  std::int64_t byte_length = 0;
  std::optional<char> delimiter;    // unset: detect on the first chunk
  std::optional<Newline> newline;   // unset: detect on the first chunk
  std::size_t chunk_size = 100 * 1024;
};

// Produces parsed rows for a byte window, lazily: the callback is invoked
// once per complete row, in byte order, and returns false to stop early.
class RowSource {
public:
  using RowCallback = std::function<bool(const ParsedRow&)>;

  virtual ~RowSource() = default;
  virtual void parse(const ParseRequest& req, const RowCallback& on_row) = 0;
};

// RowSource over a ByteSource: reads chunk_size bytes at a time and feeds
// the CSV tokenizer. A row cut by the window end is only reported when the
// window reaches EOF.
class ChunkedRowSource : public RowSource {
public:
  explicit ChunkedRowSource(std::shared_ptr<ByteSource> bytes, FetchMetrics* metrics = nullptr);

  void parse(const ParseRequest& req, const RowCallback& on_row) override;

  ByteSource& bytes() noexcept { return *bytes_; }

private:
  std::shared_ptr<ByteSource> bytes_;
  FetchMetrics* metrics_;
};

}
