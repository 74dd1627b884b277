#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace lc {

struct Config {
  std::size_t   chunk_size        = 100 * 1024;          // bytes per row-source read
  std::int64_t  initial_row_count = 50;                  // rows the first probe aims for
  std::uint64_t max_cached_bytes  = 256ull * 1024 * 1024;  // validated only, no eviction
  bool          verbose           = false;               // one log line per fetch pass
};

// Read a JSON object ({"chunk_size": 65536, ...}) on top of the defaults.
// Unknown keys are ignored. Throws InvalidArgument on a malformed file or a
// value that is not a non-negative integer (or a bool for "verbose").
Config load_config(const std::string& path);

// Throws InvalidArgument.
void validate_config(const Config& cfg);

}
