#include "lazy_csv/row_source.hpp"
#include "lazy_csv/byte_source.hpp"
#include "lazy_csv/csv_tokenizer.hpp"
#include "lazy_csv/errors.hpp"
#include "lazy_csv/metrics.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

namespace lc {

ChunkedRowSource::ChunkedRowSource(std::shared_ptr<ByteSource> bytes, FetchMetrics* metrics)
  : bytes_(std::move(bytes)), metrics_(metrics) {
  if (!bytes_) throw InvalidArgument("ChunkedRowSource needs a byte source");
}

void ChunkedRowSource::parse(const ParseRequest& req, const RowCallback& on_row) {
  if (req.chunk_size == 0) throw InvalidArgument("chunk_size must be positive");
  if (req.window.first_byte < 0 || req.window.end_byte < req.window.first_byte)
    throw InvalidArgument("invalid byte window [" + std::to_string(req.window.first_byte) + ", " +
                          std::to_string(req.window.end_byte) + ")");

  const std::int64_t end = std::min(req.window.end_byte, req.byte_length);
  const auto chunk = static_cast<std::int64_t>(req.chunk_size);
  std::int64_t offset = req.window.first_byte;
  std::unique_ptr<CsvTokenizer> tok;

  while (offset < end) {
    const std::int64_t want = std::min(chunk, end - offset);
    std::string block;
    {
      ScopedStage stage(metrics_, "read");
      block = bytes_->read(req.url, offset, want);
    }
    if (metrics_) metrics_->add_request(block.size());
    if (block.empty())
      throw TransportError("short read at byte " + std::to_string(offset) + " of " + req.url +
                           " (expected " + std::to_string(end) + ")");

    if (!tok) {
      CsvDialect d = detect_dialect(block, req.delimiter, req.newline);
      tok = std::make_unique<CsvTokenizer>(d, offset);
    }
    offset += static_cast<std::int64_t>(block.size());

    bool go_on = true;
    {
      ScopedStage stage(metrics_, "tokenize");
      go_on = tok->feed(block, on_row);
    }
    if (!go_on) return;
  }

  // a trailing row without terminator only exists at EOF
  if (tok && end == req.byte_length) tok->finish(on_row);
}

}
