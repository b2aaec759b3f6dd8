#include "mouse_decoder.hpp"
#include <algorithm>
#include "utf8.hpp"

namespace {

using Status = MouseDecoder::Status;
using Result = MouseDecoder::Result;

Result no_match() { return Result{}; }
Result incomplete() { Result r; r.status = Status::Incomplete; return r; }

// Shared button-byte semantics; value is already offset-free.
void apply_button(int b, bool release, MouseEvent& ev) {
  ev.shift = (b & 0x04) != 0;
  ev.meta = (b & 0x08) != 0;
  ev.ctrl = (b & 0x10) != 0;
  int low = b & 0x03;
  if (b & 0x40) {
    ev.button = (low & 1) ? MouseButton::WheelDown : MouseButton::WheelUp;
    ev.action = MouseAction::Wheel;
    return;
  }
  if (b & 0x80) { ev.button = MouseButton::Unknown; ev.action = MouseAction::Press; return; }
  switch (low) {
    case 0: ev.button = MouseButton::Left; break;
    case 1: ev.button = MouseButton::Middle; break;
    case 2: ev.button = MouseButton::Right; break;
    default: ev.button = MouseButton::None; break;
  }
  if (b & 0x20) ev.action = MouseAction::Move;
  else if (release || low == 3) ev.action = MouseAction::Release;
  else ev.action = MouseAction::Press;
}

// Reads up to three ';'-separated decimals ending at a byte in finals.
// Returns the index of the final byte, npos when more bytes are needed,
// or 0 when a foreign byte shows up.
std::size_t scan_decimal_triplet(std::string_view s, std::size_t start, std::string_view finals, int (&vals)[3]) {
  int idx = 0; int cur = 0; bool any = false;
  for (std::size_t i = start; i < s.size(); ++i) {
    char c = s[i];
    if (c >= '0' && c <= '9') {
      if (cur < 100000) cur = cur * 10 + (c - '0');
      any = true;
    } else if (c == ';') {
      if (!any || idx >= 2) return 0;
      vals[idx++] = cur; cur = 0; any = false;
    } else if (finals.find(c) != std::string_view::npos) {
      if (!any || idx != 2) return 0;
      vals[idx] = cur;
      return i;
    } else {
      return 0;
    }
  }
  return std::string_view::npos;
}

} // namespace

const char* to_string(MouseButton b) {
  switch (b) {
    case MouseButton::Left: return "left";
    case MouseButton::Right: return "right";
    case MouseButton::Middle: return "middle";
    case MouseButton::WheelUp: return "wheelUp";
    case MouseButton::WheelDown: return "wheelDown";
    case MouseButton::None: return "none";
    case MouseButton::Unknown: return "unknown";
  }
  return "unknown";
}

const char* to_string(MouseAction a) {
  switch (a) {
    case MouseAction::Press: return "press";
    case MouseAction::Release: return "release";
    case MouseAction::Move: return "move";
    case MouseAction::Wheel: return "wheel";
  }
  return "press";
}

const char* to_string(MouseProtocol p) {
  switch (p) {
    case MouseProtocol::X10: return "x10";
    case MouseProtocol::Utf8: return "utf8";
    case MouseProtocol::Sgr: return "sgr";
    case MouseProtocol::Urxvt: return "urxvt";
  }
  return "sgr";
}

MouseDecoder::Result MouseDecoder::decode(std::string_view bytes) const {
  if (bytes.empty() || bytes[0] != '\x1b') return no_match();
  if (bytes.size() < 3) {
    if (bytes.size() == 2 && bytes[1] != '[') return no_match();
    return incomplete();
  }
  if (bytes[1] != '[') return no_match();
  char c = bytes[2];
  if (c == '<') return decode_sgr(bytes);
  if (c == 'M') return decode_x10(bytes);
  if (c >= '0' && c <= '9') return decode_urxvt(bytes);
  return no_match();
}

std::optional<MouseEvent> MouseDecoder::parse(std::string_view bytes) const {
  Result r = decode(bytes);
  if (r.status != Status::Complete) return std::nullopt;
  return r.event;
}

MouseDecoder::Result MouseDecoder::decode_sgr(std::string_view bytes) const {
  int v[3] = {0, 0, 0};
  std::size_t end = scan_decimal_triplet(bytes, 3, "Mm", v);
  if (end == std::string_view::npos) return incomplete();
  if (end == 0) return no_match();
  Result r;
  r.status = Status::Complete;
  r.consumed = end + 1;
  apply_button(v[0], bytes[end] == 'm', r.event);
  r.event.x = std::max(0, v[1] - 1);
  r.event.y = std::max(0, v[2] - 1);
  r.event.protocol = MouseProtocol::Sgr;
  r.event.raw = std::string(bytes.substr(0, r.consumed));
  return r;
}

// ESC [ b ; x ; y M with the X10 offsets still applied to b.
// Keyboard CSIs such as ESC[1;5A end in another final and stay no_match.
MouseDecoder::Result MouseDecoder::decode_urxvt(std::string_view bytes) const {
  int v[3] = {0, 0, 0};
  std::size_t end = scan_decimal_triplet(bytes, 2, "M", v);
  if (end == std::string_view::npos) return incomplete();
  if (end == 0 || v[0] < 32) return no_match();
  Result r;
  r.status = Status::Complete;
  r.consumed = end + 1;
  apply_button(v[0] - 32, false, r.event);
  r.event.x = std::max(0, v[1] - 1);
  r.event.y = std::max(0, v[2] - 1);
  r.event.protocol = MouseProtocol::Urxvt;
  r.event.raw = std::string(bytes.substr(0, r.consumed));
  return r;
}

// ESC [ M b x y, each value a single byte (X10) or a UTF-8 encoded
// code point (1005 extended mode).
MouseDecoder::Result MouseDecoder::decode_x10(std::string_view bytes) const {
  std::size_t pos = 3;
  int vals[3];
  bool extended = false;
  for (int i = 0; i < 3; ++i) {
    if (pos >= bytes.size()) return incomplete();
    unsigned char lead = static_cast<unsigned char>(bytes[pos]);
    std::size_t n = utf8::sequence_length(lead);
    if (lead >= 0x80 && n >= 2 && pos + n > bytes.size()) {
      bool continuation = true;
      for (std::size_t k = pos + 1; k < bytes.size(); ++k)
        continuation = continuation && utf8::is_continuation(static_cast<unsigned char>(bytes[k]));
      // A full six-byte report already present is plain X10 with high bytes.
      if (continuation && (extended || bytes.size() < 6)) return incomplete();
    }
    char32_t cp = 0;
    if (lead >= 0x80 && n >= 2 && pos + n <= bytes.size() && utf8::decode(bytes.substr(pos, n), cp)) {
      vals[i] = static_cast<int>(cp);
      extended = true;
      pos += n;
    } else {
      if (lead < 32) return no_match();
      vals[i] = lead;
      pos += 1;
    }
  }
  Result r;
  r.status = Status::Complete;
  r.consumed = pos;
  apply_button(vals[0] - 32, false, r.event);
  int x = vals[1] - 33;
  int y = vals[2] - 33;
  if (!extended) {
    x = std::clamp(x, 0, kX10MaxCoord);
    y = std::clamp(y, 0, kX10MaxCoord);
  } else {
    x = std::max(0, x);
    y = std::max(0, y);
  }
  r.event.x = x;
  r.event.y = y;
  r.event.protocol = extended ? MouseProtocol::Utf8 : MouseProtocol::X10;
  r.event.raw = std::string(bytes.substr(0, r.consumed));
  return r;
}
