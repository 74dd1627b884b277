#include "lazy_csv/dataframe.hpp"
#include "lazy_csv/byte_source.hpp"
#include "lazy_csv/cancel.hpp"
#include "lazy_csv/coverage_cache.hpp"
#include "lazy_csv/errors.hpp"
#include "lazy_csv/estimator.hpp"
#include "lazy_csv/fetcher.hpp"
#include "lazy_csv/row_source.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace lc {

struct CsvDataFrame::Impl {
  std::string url;
  std::int64_t byte_length = 0;
  Config cfg;
  std::shared_ptr<FetchMetrics> metrics;
  std::shared_ptr<RowSource> source;
  std::unique_ptr<CoverageCache> cache;
  std::unique_ptr<Estimator> estimator;
  std::unique_ptr<RowFetcher> fetcher;
  EventTarget events;
  std::vector<ColumnDescriptor> columns;

  Impl(std::string u, std::int64_t length, const Config& c)
    : url(std::move(u)), byte_length(length), cfg(c), metrics(std::make_shared<FetchMetrics>()) {
    validate_config(cfg);
    if (byte_length < 0) throw InvalidArgument("byte length must be non-negative");
  }

  std::size_t column_index(const std::string& name) const {
    for (std::size_t i = 0; i < columns.size(); ++i)
      if (columns[i].name == name) return i;
    throw InvalidArgument("unknown column: " + name);
  }

  // Header (first non-blank row) plus data rows until initial_row_count rows
  // are stored and the probe is past most of the first chunk.
  void probe() {
    ParseRequest req;
    req.url = url;
    req.window = ByteWindow{0, byte_length};
    req.byte_length = byte_length;
    req.chunk_size = cfg.chunk_size;

    const double stop_byte = 0.9 * static_cast<double>(cfg.chunk_size);
    ScopedStage stage(metrics.get(), "probe");
    source->parse(req, [&](const ParsedRow& r) {
      if (r.byte_count == 0) return false;
      if (!cache) {
        if (is_empty_row(r.cells, true)) return true;  // blank lines before the header
        cache = std::make_unique<CoverageCache>(CoverageCache::from_header(r, byte_length));
        return true;
      }
      if (static_cast<std::int64_t>(cache->row_count()) >= cfg.initial_row_count &&
          static_cast<double>(r.byte_offset) > stop_byte)
        return false;
      const bool ignored = is_empty_row(r.cells);
      std::optional<Cells> cells;
      if (!ignored) cells = r.cells;
      if (cache->store(r.byte_offset, r.byte_count, std::move(cells)) && !ignored)
        metrics->add_row_stored();
      return true;
    });

    if (!cache) throw InputError("no header row found in " + url);
    if (cfg.initial_row_count > 0 && cache->row_count() == 0 && !cache->complete())
      throw InputError("no data row found in " + url);

    for (const auto& name : cache->column_names()) columns.push_back(ColumnDescriptor{name});
    estimator = std::make_unique<Estimator>(*cache);
    estimator->refresh();
    fetcher = std::make_unique<RowFetcher>(url, *cache, *estimator, *source, events, cfg,
                                           metrics.get());

    if (cfg.verbose)
      std::cerr << "[probe] " << url << ": " << columns.size() << " columns, "
                << cache->row_count() << " rows in " << cache->serial().byte_count() << " of "
                << byte_length << " bytes, delimiter '" << cache->dialect().delimiter
                << "', newline " << newline_name(cache->dialect().newline) << "\n";
  }
};

CsvDataFrame::CsvDataFrame(Impl* p) : p_(p) {}
CsvDataFrame::~CsvDataFrame() { delete p_; }

std::unique_ptr<CsvDataFrame> CsvDataFrame::open(std::string url, std::shared_ptr<RowSource> source,
                                                 std::int64_t byte_length, const Config& cfg) {
  if (!source) throw InvalidArgument("a row source is required");
  auto impl = std::make_unique<Impl>(std::move(url), byte_length, cfg);
  impl->source = std::move(source);
  impl->probe();
  return std::unique_ptr<CsvDataFrame>(new CsvDataFrame(impl.release()));
}

std::unique_ptr<CsvDataFrame> CsvDataFrame::open_bytes(std::string url, std::shared_ptr<ByteSource> bytes,
                                                       const Config& cfg) {
  if (!bytes) throw InvalidArgument("a byte source is required");
  const std::int64_t length = bytes->length(url);
  auto impl = std::make_unique<Impl>(std::move(url), length, cfg);
  impl->source = std::make_shared<ChunkedRowSource>(std::move(bytes), impl->metrics.get());
  impl->probe();
  return std::unique_ptr<CsvDataFrame>(new CsvDataFrame(impl.release()));
}

std::int64_t CsvDataFrame::num_rows() const { return p_->estimator->num_rows(); }

DataFrameMetadata CsvDataFrame::metadata() const {
  return DataFrameMetadata{p_->estimator->is_num_rows_estimated()};
}

const std::vector<ColumnDescriptor>& CsvDataFrame::column_descriptors() const noexcept {
  return p_->columns;
}

static void reject_order_by(const OrderBy& order_by) {
  if (!order_by.empty()) throw InvalidArgument("sorting is not supported");
}

std::optional<std::string> CsvDataFrame::get_cell(std::int64_t row, const std::string& column,
                                                  const OrderBy& order_by) const {
  if (row < 0) throw InvalidArgument("row index must be non-negative");
  reject_order_by(order_by);
  const std::size_t col = p_->column_index(column);
  if (row >= p_->estimator->max_num_rows()) return std::nullopt;
  return p_->estimator->cell(row, col);
}

std::optional<std::int64_t> CsvDataFrame::get_row_number(std::int64_t row, const OrderBy& order_by) const {
  if (row < 0) throw InvalidArgument("row index must be non-negative");
  reject_order_by(order_by);
  if (row >= p_->estimator->max_num_rows()) return std::nullopt;
  return p_->estimator->row_number(row);
}

void CsvDataFrame::fetch(const FetchRequest& req) {
  if (req.cancel) req.cancel->check();
  if (req.row_start < 0 || req.row_end < req.row_start)
    throw InvalidArgument("invalid row window [" + std::to_string(req.row_start) + ", " +
                          std::to_string(req.row_end) + ")");
  for (const auto& c : req.columns) (void)p_->column_index(c);
  reject_order_by(req.order_by);

  if (req.row_end > p_->estimator->max_num_rows())
    throw OutOfBounds("requested rows are beyond the end of the file: " +
                      std::to_string(req.row_end) + " > " + std::to_string(p_->estimator->num_rows()));
  p_->fetcher->fetch(req.row_start, req.row_end, req.cancel);
}

EventTarget& CsvDataFrame::events() noexcept { return p_->events; }
const std::string& CsvDataFrame::url() const noexcept { return p_->url; }
std::int64_t CsvDataFrame::byte_length() const noexcept { return p_->byte_length; }
const Config& CsvDataFrame::config() const noexcept { return p_->cfg; }
const CoverageCache& CsvDataFrame::cache() const noexcept { return *p_->cache; }
const Estimator& CsvDataFrame::estimator() const noexcept { return *p_->estimator; }
FetchStats CsvDataFrame::stats() const { return p_->metrics->snapshot(); }

}
