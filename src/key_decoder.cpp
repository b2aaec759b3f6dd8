#include "key_decoder.hpp"
#include <utility>
#include <spdlog/spdlog.h>
#include "utf8.hpp"

namespace {

constexpr unsigned char ESC = 0x1b;

struct Mods { bool shift = false; bool meta = false; bool ctrl = false; };

// xterm modifier parameter: value-1 carries shift/alt/ctrl/meta bits.
Mods decode_modifier(int m) {
  Mods r;
  if (m <= 1) return r;
  int bits = m - 1;
  r.shift = (bits & 1) != 0;
  r.meta = (bits & 2) != 0 || (bits & 8) != 0;
  r.ctrl = (bits & 4) != 0;
  return r;
}

// ESC [ <n> ~ (and rxvt $ / ^ finals)
const char* tilde_key(int n) {
  switch (n) {
    case 1: return "home";
    case 2: return "insert";
    case 3: return "delete";
    case 4: return "end";
    case 5: return "pageup";
    case 6: return "pagedown";
    case 7: return "home";
    case 8: return "end";
    case 11: return "f1";
    case 12: return "f2";
    case 13: return "f3";
    case 14: return "f4";
    case 15: return "f5";
    case 17: return "f6";
    case 18: return "f7";
    case 19: return "f8";
    case 20: return "f9";
    case 21: return "f10";
    case 23: return "f11";
    case 24: return "f12";
    default: return nullptr;
  }
}

// ESC [ ... <letter> and ESC O <letter>
const char* letter_key(char final) {
  switch (final) {
    case 'A': return "up";
    case 'B': return "down";
    case 'C': return "right";
    case 'D': return "left";
    case 'E': return "clear";
    case 'F': return "end";
    case 'H': return "home";
    case 'P': return "f1";
    case 'Q': return "f2";
    case 'R': return "f3";
    case 'S': return "f4";
    default: return nullptr;
  }
}

// rxvt lowercase arrows: shift after CSI, ctrl after SS3.
const char* rxvt_key(char final) {
  switch (final) {
    case 'a': return "up";
    case 'b': return "down";
    case 'c': return "right";
    case 'd': return "left";
    case 'e': return "clear";
    default: return nullptr;
  }
}

// Cygwin/libuv ESC [ [ <letter>
const char* double_bracket_key(char final) {
  switch (final) {
    case 'A': return "f1";
    case 'B': return "f2";
    case 'C': return "f3";
    case 'D': return "f4";
    case 'E': return "f5";
    default: return nullptr;
  }
}

// Splits "1;5" into numbers; false when a private marker or garbage is present.
bool parse_params(std::string_view s, std::vector<int>& out) {
  out.clear();
  if (s.empty()) return true;
  int cur = 0; bool any = false;
  for (char ch : s) {
    if (ch >= '0' && ch <= '9') {
      if (cur < 100000) cur = cur * 10 + (ch - '0');
      any = true;
    } else if (ch == ';') {
      out.push_back(any ? cur : 1);
      cur = 0; any = false;
    } else {
      return false;
    }
  }
  out.push_back(any ? cur : 1);
  return true;
}

bool all_digits(std::string_view s) {
  if (s.empty()) return false;
  for (char ch : s) if (ch < '0' || ch > '9') return false;
  return true;
}

KeyEvent make_event(const std::string& name, const std::string& seq, Mods m = {}) {
  KeyEvent ev;
  ev.name = name;
  ev.sequence = seq;
  ev.raw = seq;
  ev.shift = m.shift; ev.meta = m.meta; ev.ctrl = m.ctrl;
  return ev;
}

} // namespace

KeyEvent key_from_byte(unsigned char c) {
  std::string s(1, static_cast<char>(c));
  KeyEvent ev = make_event(s, s);
  switch (c) {
    case 0x00: ev.name = "space"; ev.ctrl = true; return ev;
    case 0x08: case 0x7f: ev.name = "backspace"; return ev;
    case 0x09: ev.name = "tab"; return ev;
    case 0x0a: case 0x0d: ev.name = "enter"; return ev;
    case 0x1b: ev.name = "escape"; return ev;
    case 0x20: ev.name = "space"; return ev;
    default: break;
  }
  if (c >= 0x01 && c <= 0x1a) {
    ev.name = std::string(1, static_cast<char>('a' + c - 1));
    ev.ctrl = true;
  } else if (c >= 0x1c && c <= 0x1f) {
    ev.name = std::string(1, static_cast<char>('\\' + (c - 0x1c)));
    ev.ctrl = true;
  } else if (c >= 'A' && c <= 'Z') {
    ev.name = std::string(1, static_cast<char>(c - 'A' + 'a'));
    ev.shift = true;
  } else if (c >= 0x80) {
    ev.name = "unknown";
  }
  return ev;
}

std::vector<KeyEvent> KeyDecoder::decode(std::string_view bytes) {
  std::vector<KeyEvent> out;
  decode(bytes, out);
  return out;
}

void KeyDecoder::decode(std::string_view bytes, std::vector<KeyEvent>& out) {
  for (char ch : bytes) {
    step(static_cast<unsigned char>(ch), out);
    if (pending_.size() > kMaxPending) {
      spdlog::warn("key decoder: dropping {} pending bytes", pending_.size());
      emit_unknown(out);
    }
  }
}

std::vector<KeyEvent> KeyDecoder::flush() {
  std::vector<KeyEvent> out;
  if (pending_.empty()) return out;
  if (escape_pending()) {
    Mods m;
    m.meta = pending_.size() == 2;
    out.push_back(make_event("escape", pending_, m));
    clear_pending();
  } else {
    emit_unknown(out);
  }
  return out;
}

void KeyDecoder::reset() { clear_pending(); }

void KeyDecoder::clear_pending() {
  pending_.clear();
  state_ = State::Ground;
  utf8_need_ = 0;
  esc_count_ = 1;
  double_bracket_ = false;
}

void KeyDecoder::emit_unknown(std::vector<KeyEvent>& out) {
  out.push_back(make_event("unknown", pending_));
  clear_pending();
}

void KeyDecoder::step(unsigned char c, std::vector<KeyEvent>& out) {
  switch (state_) {
    case State::Ground: ground(c, out); break;
    case State::Escape: escape(c, out); break;
    case State::Csi: csi(c, out); break;
    case State::Ss3: ss3(c, out); break;
    case State::Utf8: utf8_continue(c, out); break;
  }
}

void KeyDecoder::ground(unsigned char c, std::vector<KeyEvent>& out) {
  if (c == ESC) {
    pending_.assign(1, static_cast<char>(c));
    state_ = State::Escape;
    return;
  }
  if (c < 0x80) { out.push_back(key_from_byte(c)); return; }
  std::size_t n = utf8::sequence_length(c);
  if (n < 2) { out.push_back(key_from_byte(c)); return; }
  pending_.assign(1, static_cast<char>(c));
  utf8_need_ = n - 1;
  state_ = State::Utf8;
}

void KeyDecoder::utf8_continue(unsigned char c, std::vector<KeyEvent>& out) {
  if (!utf8::is_continuation(c)) {
    emit_unknown(out);
    ground(c, out);
    return;
  }
  pending_.push_back(static_cast<char>(c));
  if (--utf8_need_ > 0) return;
  out.push_back(make_event(pending_, pending_));
  clear_pending();
}

void KeyDecoder::escape(unsigned char c, std::vector<KeyEvent>& out) {
  if (c == '[') { pending_.push_back('['); state_ = State::Csi; return; }
  if (c == 'O') { pending_.push_back('O'); state_ = State::Ss3; return; }
  if (c == ESC && esc_count_ == 1) {
    pending_.push_back(static_cast<char>(ESC));
    esc_count_ = 2;
    return;
  }
  if (c >= 0x80 || esc_count_ == 2) {
    // ESC ESC followed by anything but a sequence introducer is alt+escape.
    Mods m;
    m.meta = esc_count_ == 2;
    out.push_back(make_event("escape", pending_, m));
    clear_pending();
    ground(c, out);
    return;
  }
  KeyEvent ev = key_from_byte(c);
  ev.meta = true;
  ev.sequence = pending_ + ev.sequence;
  ev.raw = ev.sequence;
  out.push_back(std::move(ev));
  clear_pending();
}

void KeyDecoder::csi(unsigned char c, std::vector<KeyEvent>& out) {
  if (c == '[' && pending_.size() == esc_count_ + 1 && !double_bracket_) {
    pending_.push_back('[');
    double_bracket_ = true;
    return;
  }
  if (c >= 0x20 && c <= 0x3f) {
    bool rxvt_shift = c == '$' && all_digits(std::string_view(pending_).substr(body_start()));
    pending_.push_back(static_cast<char>(c));
    if (rxvt_shift) finish_csi(out);
    return;
  }
  if (c >= 0x40 && c <= 0x7e) {
    pending_.push_back(static_cast<char>(c));
    finish_csi(out);
    return;
  }
  // Control or high byte inside a sequence: abandon it and reprocess the byte.
  emit_unknown(out);
  ground(c, out);
}

void KeyDecoder::ss3(unsigned char c, std::vector<KeyEvent>& out) {
  if ((c >= '0' && c <= '9') || c == ';') { pending_.push_back(static_cast<char>(c)); return; }
  if (c >= 0x40 && c <= 0x7e) {
    pending_.push_back(static_cast<char>(c));
    finish_ss3(out);
    return;
  }
  emit_unknown(out);
  ground(c, out);
}

void KeyDecoder::finish_csi(std::vector<KeyEvent>& out) {
  const char final = pending_.back();
  std::string_view body = std::string_view(pending_).substr(body_start());
  body.remove_suffix(1);
  std::vector<int> params;
  const char* name = nullptr;
  Mods mods;
  if (parse_params(body, params)) {
    if (double_bracket_) {
      if (params.empty()) name = double_bracket_key(final);
      else if (final == '~' && params.size() == 1 && (params[0] == 5 || params[0] == 6))
        name = params[0] == 5 ? "pageup" : "pagedown";
    } else if (final == '~' || final == '$' || final == '^') {
      if (!params.empty()) name = tilde_key(params[0]);
      if (params.size() >= 2) mods = decode_modifier(params[1]);
      if (final == '$') mods.shift = true;
      if (final == '^') mods.ctrl = true;
    } else if (final == 'Z' && params.empty()) {
      name = "tab";
      mods.shift = true;
    } else if (params.empty() && rxvt_key(final)) {
      name = rxvt_key(final);
      mods.shift = true;
    } else if ((name = letter_key(final)) != nullptr) {
      if (params.size() >= 2) mods = decode_modifier(params[1]);
      else if (params.size() == 1 && params[0] != 1) mods = decode_modifier(params[0]);
    }
  }
  if (!name) {
    spdlog::debug("key decoder: unrecognized CSI sequence ({} bytes)", pending_.size());
    emit_unknown(out);
    return;
  }
  if (esc_count_ == 2) mods.meta = true;
  out.push_back(make_event(name, pending_, mods));
  clear_pending();
}

void KeyDecoder::finish_ss3(std::vector<KeyEvent>& out) {
  const char final = pending_.back();
  std::string_view body = std::string_view(pending_).substr(body_start());
  body.remove_suffix(1);
  std::vector<int> params;
  const char* name = nullptr;
  Mods mods;
  if (parse_params(body, params)) {
    if (final == 'M') {
      name = "enter";
    } else if (rxvt_key(final)) {
      name = rxvt_key(final);
      mods.ctrl = true;
    } else {
      name = letter_key(final);
      if (!params.empty()) mods = decode_modifier(params.back());
    }
  }
  if (!name) { emit_unknown(out); return; }
  if (esc_count_ == 2) mods.meta = true;
  out.push_back(make_event(name, pending_, mods));
  clear_pending();
}
