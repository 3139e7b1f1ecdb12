#include <algorithm>

#include "waypoint/history.hpp"
#include "waypoint/logging.hpp"

namespace waypoint {

MemoryHistory::MemoryHistory(std::string initial) {
  entries_.push_back(Entry{std::move(initial), nullptr});
}

std::string MemoryHistory::current() const { return entries_[position_].location; }

const nlohmann::json& MemoryHistory::state() const { return entries_[position_].state; }

void MemoryHistory::push(const std::string& location, const nlohmann::json& state) {
  entries_.resize(position_ + 1);
  entries_.push_back(Entry{location, state});
  position_ = entries_.size() - 1;
}

void MemoryHistory::replace(const std::string& location, const nlohmann::json& state) {
  entries_[position_] = Entry{location, state};
}

void MemoryHistory::go(int delta) {
  auto last = static_cast<long>(entries_.size()) - 1;
  auto target = std::clamp(static_cast<long>(position_) + delta, 0L, last);
  int travelled = static_cast<int>(target - static_cast<long>(position_));
  if (travelled == 0) {
    WPT_LOG_TRACE("history.go({}) clamped to no movement", delta);
    return;
  }

  std::string from = current();
  position_ = static_cast<size_t>(target);
  std::string to = current();

  PopInfo info{travelled, travelled < 0 ? PopDirection::Back : PopDirection::Forward};
  for (const auto& listener : listeners_.snapshot()) {
    listener(to, from, info);
  }
}

Unregister MemoryHistory::listen(HistoryListener listener) {
  return listeners_.add(std::move(listener));
}

std::vector<std::string> MemoryHistory::locations() const {
  std::vector<std::string> result;
  result.reserve(entries_.size());
  for (const auto& entry : entries_) {
    result.push_back(entry.location);
  }
  return result;
}

}  // namespace waypoint
