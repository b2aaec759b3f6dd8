#pragma once
/*
 * InputDecoder
 *
 * Purpose: stream front end for stdin. Routes each ESC [ sequence to the
 *          mouse decoder, focus or bracketed-paste recognisers, and all other
 *          bytes to the KeyDecoder, pushing events in byte order.
 * Constraint: partial sequences are carried to the next feed(); flush() is
 *             the caller's escape timeout.
 */
#include <cstddef>
#include <string>
#include <string_view>
#include "input_event_queue.hpp"
#include "key_decoder.hpp"
#include "mouse_decoder.hpp"

class InputDecoder {
public:
  static constexpr std::size_t kMaxPaste = 1u << 20;
  static constexpr std::size_t kMaxReport = 64;

  void feed(std::string_view bytes, InputEventQueue& q);
  void flush(InputEventQueue& q);
  void reset();

  // True while a timeout should resolve held bytes (not during a paste).
  bool has_pending() const { return !in_paste_ && (!pending_.empty() || keys_.has_pending()); }
  bool escape_pending() const { return !in_paste_ && (pending_ == "\x1b" || pending_ == "\x1b\x1b"); }
  bool in_paste() const { return in_paste_; }

private:
  std::size_t route_escape(std::string_view rest, InputEventQueue& q);
  std::size_t feed_keys(std::string_view rest, InputEventQueue& q);
  std::size_t feed_paste(std::string_view rest, InputEventQueue& q);

  KeyDecoder keys_;
  MouseDecoder mouse_;
  std::string pending_;
  bool in_paste_ = false;
  bool paste_truncated_ = false;
  std::string paste_;
};
