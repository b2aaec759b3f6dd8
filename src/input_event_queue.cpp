#include "input_event_queue.hpp"
#include <cstddef>
#include <iterator>
#include <utility>
#include <spdlog/spdlog.h>

void InputEventQueue::push(InputEvent ev) {
  if (std::holds_alternative<KeyEvent>(ev)) totals_.keys++;
  else if (std::holds_alternative<MouseEvent>(ev)) totals_.mouse++;
  else if (std::holds_alternative<FocusEvent>(ev)) totals_.focus++;
  else totals_.paste++;
  events_.push_back(std::move(ev));
  if (max_size_ == 0 || events_.size() <= max_size_) return;
  std::size_t over = events_.size() - max_size_;
  events_.erase(events_.begin(), events_.begin() + static_cast<std::ptrdiff_t>(over));
  totals_.dropped += over;
  spdlog::warn("input queue full ({}), dropped {} oldest event(s), {} total", max_size_, over, totals_.dropped);
}

std::vector<InputEvent> InputEventQueue::drain() {
  std::vector<InputEvent> out(std::make_move_iterator(events_.begin()), std::make_move_iterator(events_.end()));
  events_.clear();
  return out;
}

// Removes events of one kind; the others keep their relative order.
template <typename T>
std::vector<T> InputEventQueue::drain_kind() {
  std::vector<T> out;
  std::deque<InputEvent> rest;
  for (auto& ev : events_) {
    if (auto* p = std::get_if<T>(&ev)) out.push_back(std::move(*p));
    else rest.push_back(std::move(ev));
  }
  events_.swap(rest);
  return out;
}

std::vector<KeyEvent> InputEventQueue::drain_keys() { return drain_kind<KeyEvent>(); }
std::vector<MouseEvent> InputEventQueue::drain_mouse() { return drain_kind<MouseEvent>(); }

std::optional<InputEvent> InputEventQueue::peek() const {
  if (events_.empty()) return std::nullopt;
  return events_.front();
}

QueueStats InputEventQueue::stats() const {
  QueueStats s = totals_;
  s.pending = events_.size();
  return s;
}
