#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace lc {

enum class EventKind {
  Resolve,          // a row in the requested window became available
  RowCountChanged,  // num_rows() or is_num_rows_estimated() changed
};

const char* event_name(EventKind k) noexcept;  // "resolve" | "row-count-changed"

struct DataFrameEvent {
  EventKind kind = EventKind::Resolve;
  std::int64_t row = -1;  // Resolve only
};

// Listener registry. emit() runs listeners synchronously on the emitting
// thread, in registration order.
class EventTarget {
public:
  using Listener = std::function<void(const DataFrameEvent&)>;
  using ListenerId = std::uint64_t;

  ListenerId add_listener(Listener fn);
  bool remove_listener(ListenerId id);
  void emit(const DataFrameEvent& ev) const;
  std::size_t listener_count() const;

private:
  struct Entry {
    ListenerId id;
    Listener fn;
  };
  mutable std::mutex mu_;
  std::vector<Entry> listeners_;
  ListenerId next_id_{1};
};

}
