#include "lazy_csv/config.hpp"
#include "lazy_csv/errors.hpp"

#include <simdjson.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace lc {

static std::uint64_t as_count(simdjson::ondemand::value v, std::string_view key) {
  const auto t = v.type().value();
  if (t != simdjson::ondemand::json_type::number)
    throw InvalidArgument("config: \"" + std::string(key) + "\" must be a non-negative integer");
  // negative and fractional values fail here
  std::uint64_t out = 0;
  if (v.get_uint64().get(out) != simdjson::SUCCESS)
    throw InvalidArgument("config: \"" + std::string(key) + "\" must be a non-negative integer");
  return out;
}

Config load_config(const std::string& path) {
  Config cfg;
  simdjson::padded_string json;
  if (simdjson::padded_string::load(path).get(json) != simdjson::SUCCESS)
    throw InvalidArgument("config: cannot read " + path);

  simdjson::ondemand::parser parser;
  try {
    auto doc = parser.iterate(json);
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      std::string_view key = field.unescaped_key().value();
      simdjson::ondemand::value v = field.value();
      if (key == "chunk_size") {
        cfg.chunk_size = static_cast<std::size_t>(as_count(v, key));
      } else if (key == "initial_row_count") {
        const std::uint64_t n = as_count(v, key);
        if (n > static_cast<std::uint64_t>(INT64_MAX))
          throw InvalidArgument("config: \"initial_row_count\" is too large");
        cfg.initial_row_count = static_cast<std::int64_t>(n);
      } else if (key == "max_cached_bytes") {
        cfg.max_cached_bytes = as_count(v, key);
      } else if (key == "verbose") {
        bool b = false;
        if (v.get_bool().get(b) != simdjson::SUCCESS)
          throw InvalidArgument("config: \"verbose\" must be a boolean");
        cfg.verbose = b;
      }
      // anything else: ignored
    }
  } catch (const simdjson::simdjson_error& e) {
    throw InvalidArgument(std::string("config: malformed JSON in ") + path + ": " + e.what());
  }
  return cfg;
}

void validate_config(const Config& cfg) {
  if (cfg.initial_row_count < 0)
    throw InvalidArgument("initial_row_count must be a non-negative integer");
  if (cfg.chunk_size == 0)
    throw InvalidArgument("chunk_size must be a positive integer");
  if (cfg.chunk_size > cfg.max_cached_bytes)
    throw InvalidArgument("chunk_size (" + std::to_string(cfg.chunk_size) +
                          ") exceeds max_cached_bytes (" + std::to_string(cfg.max_cached_bytes) + ")");
}

}
