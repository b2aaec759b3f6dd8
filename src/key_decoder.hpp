#pragma once
/*
 * KeyDecoder
 *
 * Purpose: resumable byte-stream state machine turning raw stdin bytes into
 *          KeyEvents (control keys, UTF-8 text, CSI/SS3 function keys).
 * Constraint: no timers. A lone trailing ESC stays pending until more bytes
 *             arrive or the caller decides it timed out and calls flush().
 * Invariant: never throws; complete but unmatched sequences become "unknown".
 *            A doubled ESC prefix folds into one event with meta set.
 */
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "types.hpp"

class KeyDecoder {
public:
  static constexpr std::size_t kMaxPending = 4096;

  std::vector<KeyEvent> decode(std::string_view bytes);
  void decode(std::string_view bytes, std::vector<KeyEvent>& out);
  std::vector<KeyEvent> flush();
  void reset();

  bool has_pending() const { return !pending_.empty(); }
  bool escape_pending() const { return state_ == State::Escape && (pending_ == "\x1b" || pending_ == "\x1b\x1b"); }
  const std::string& pending() const { return pending_; }

private:
  enum class State { Ground, Escape, Csi, Ss3, Utf8 };

  void step(unsigned char c, std::vector<KeyEvent>& out);
  void ground(unsigned char c, std::vector<KeyEvent>& out);
  void escape(unsigned char c, std::vector<KeyEvent>& out);
  void csi(unsigned char c, std::vector<KeyEvent>& out);
  void ss3(unsigned char c, std::vector<KeyEvent>& out);
  void utf8_continue(unsigned char c, std::vector<KeyEvent>& out);
  void finish_csi(std::vector<KeyEvent>& out);
  void finish_ss3(std::vector<KeyEvent>& out);
  void emit_unknown(std::vector<KeyEvent>& out);
  void clear_pending();
  std::size_t body_start() const { return esc_count_ + 1 + (double_bracket_ ? 1 : 0); }

  State state_ = State::Ground;
  std::string pending_;
  std::size_t utf8_need_ = 0;
  std::size_t esc_count_ = 1;
  bool double_bracket_ = false;
};

// Single byte (no ESC prefix) to its key event.
KeyEvent key_from_byte(unsigned char c);
