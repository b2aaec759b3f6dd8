#pragma once
/*
 * InputEventQueue
 *
 * Purpose: bounded FIFO of decoded input events, drained once per tick.
 * Invariant: arrival order is preserved; on overflow the oldest events go.
 */
#include <cstddef>
#include <deque>
#include <optional>
#include <vector>
#include "types.hpp"

struct QueueStats {
  std::size_t keys = 0;
  std::size_t mouse = 0;
  std::size_t focus = 0;
  std::size_t paste = 0;
  std::size_t pending = 0;
  std::size_t dropped = 0;
};

class InputEventQueue {
public:
  static constexpr std::size_t kDefaultMaxSize = 1000;

  // max_size 0 means unbounded.
  explicit InputEventQueue(std::size_t max_size = kDefaultMaxSize) : max_size_(max_size) {}

  void push(InputEvent ev);
  std::vector<InputEvent> drain();
  std::vector<KeyEvent> drain_keys();
  std::vector<MouseEvent> drain_mouse();
  std::optional<InputEvent> peek() const;

  std::size_t size() const { return events_.size(); }
  bool empty() const { return events_.empty(); }
  void clear() { events_.clear(); }
  std::size_t max_size() const { return max_size_; }
  QueueStats stats() const;

private:
  template <typename T>
  std::vector<T> drain_kind();

  std::deque<InputEvent> events_;
  std::size_t max_size_;
  QueueStats totals_;
};
