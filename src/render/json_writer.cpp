#include "lazy_csv/json_writer.hpp"
#include "lazy_csv/dataframe.hpp"

#include <cstdio>
#include <sstream>
#include <utility>

namespace lc {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static const char* boolean(bool b){ return b ? "true" : "false"; }

static void stats_json(std::ostringstream& o, const FetchStats& s){
  o << "{";
  o << "\"requests\":" << s.requests << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"rows_stored\":" << s.rows_stored << ",";
  o << "\"passes\":" << s.passes << ",";
  o << "\"resolved\":" << s.resolved << ",";
  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, s.stages[i].name);
    o << ",\"duration_ms\":" << s.stages[i].duration_ms << "}";
  }
  o << "]}";
}

std::string JsonWriter::to_json(const MetaPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"url\":"; esc(o, p.url); o << ",";
  o << "\"columns\":[";
  for (size_t i=0;i<p.columns.size();++i){
    if (i) o << ",";
    esc(o, p.columns[i]);
  }
  o << "],";
  o << "\"num_rows\":" << p.num_rows << ",";
  o << "\"is_num_rows_estimated\":" << boolean(p.is_num_rows_estimated) << ",";
  o << "\"byte_length\":" << p.byte_length << ",";
  o << "\"stats\":"; stats_json(o, p.stats);
  o << "}";
  return o.str();
}

std::string JsonWriter::to_json(const RowsPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"start\":" << p.start << ",";
  o << "\"end\":" << p.end << ",";
  o << "\"num_rows\":" << p.num_rows << ",";
  o << "\"is_num_rows_estimated\":" << boolean(p.is_num_rows_estimated) << ",";
  o << "\"rows\":[";
  for (size_t i=0;i<p.rows.size();++i){
    if (i) o << ",";
    const auto& r = p.rows[i];
    o << "{\"row\":" << r.row << ",\"row_number\":";
    if (r.row_number) o << *r.row_number; else o << "null";
    o << ",\"cells\":[";
    for (size_t j=0;j<r.cells.size();++j){
      if (j) o << ",";
      if (r.cells[j]) esc(o, *r.cells[j]); else o << "null";
    }
    o << "]}";
  }
  o << "]}";
  return o.str();
}

std::string JsonWriter::error(const std::string& msg) {
  std::ostringstream o;
  o << "{\"error\":"; esc(o, msg); o << "}";
  return o.str();
}

MetaPayload JsonWriter::meta_of(const CsvDataFrame& df) {
  MetaPayload p;
  p.url = df.url();
  for (const auto& c : df.column_descriptors()) p.columns.push_back(c.name);
  p.num_rows = df.num_rows();
  p.is_num_rows_estimated = df.metadata().is_num_rows_estimated;
  p.byte_length = df.byte_length();
  p.stats = df.stats();
  return p;
}

RowsPayload JsonWriter::rows_of(const CsvDataFrame& df, std::int64_t start, std::int64_t end) {
  RowsPayload p;
  p.start = start;
  p.end = end;
  p.num_rows = df.num_rows();
  p.is_num_rows_estimated = df.metadata().is_num_rows_estimated;
  const auto& cols = df.column_descriptors();
  for (std::int64_t row = start; row < end; ++row) {
    RowPayload r;
    r.row = row;
    r.row_number = df.get_row_number(row);
    r.cells.reserve(cols.size());
    for (const auto& c : cols) r.cells.push_back(df.get_cell(row, c.name));
    p.rows.push_back(std::move(r));
  }
  return p;
}

}
