#include "lazy_csv/events.hpp"
#include <algorithm>
#include <utility>

namespace lc {

const char* event_name(EventKind k) noexcept {
  switch (k) {
    case EventKind::Resolve:         return "resolve";
    case EventKind::RowCountChanged: return "row-count-changed";
  }
  return "unknown";
}

EventTarget::ListenerId EventTarget::add_listener(Listener fn) {
  std::lock_guard<std::mutex> lk(mu_);
  const ListenerId id = next_id_++;
  listeners_.push_back(Entry{id, std::move(fn)});
  return id;
}

bool EventTarget::remove_listener(ListenerId id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = std::find_if(listeners_.begin(), listeners_.end(),
                         [id](const Entry& e) { return e.id == id; });
  if (it == listeners_.end()) return false;
  listeners_.erase(it);
  return true;
}

void EventTarget::emit(const DataFrameEvent& ev) const {
  // copy so a listener may remove itself
  std::vector<Listener> fns;
  {
    std::lock_guard<std::mutex> lk(mu_);
    fns.reserve(listeners_.size());
    for (const auto& e : listeners_) fns.push_back(e.fn);
  }
  for (const auto& fn : fns) fn(ev);
}

std::size_t EventTarget::listener_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return listeners_.size();
}

}
