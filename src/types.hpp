#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Color/Cell/RenderCell/events).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 * Color: packed 0xAARRGGBB, alpha 0 means "terminal default color".
 */
#include <cstdint>
#include <string>
#include <variant>

using Color = std::uint32_t;

constexpr Color kDefaultColor = 0;

constexpr Color pack_argb(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a = 255) {
  return (static_cast<Color>(a) << 24) | (static_cast<Color>(r) << 16) |
         (static_cast<Color>(g) << 8) | static_cast<Color>(b);
}
constexpr Color rgb(std::uint8_t r, std::uint8_t g, std::uint8_t b) { return pack_argb(r, g, b, 255); }
constexpr std::uint8_t color_a(Color c) { return static_cast<std::uint8_t>(c >> 24); }
constexpr std::uint8_t color_r(Color c) { return static_cast<std::uint8_t>(c >> 16); }
constexpr std::uint8_t color_g(Color c) { return static_cast<std::uint8_t>(c >> 8); }
constexpr std::uint8_t color_b(Color c) { return static_cast<std::uint8_t>(c); }
constexpr bool is_default_color(Color c) { return color_a(c) == 0; }

namespace Attr {
constexpr std::uint8_t None = 0;
constexpr std::uint8_t Bold = 1 << 0;
constexpr std::uint8_t Dim = 1 << 1;
constexpr std::uint8_t Italic = 1 << 2;
constexpr std::uint8_t Underline = 1 << 3;
constexpr std::uint8_t Blink = 1 << 4;
constexpr std::uint8_t Inverse = 1 << 5;
constexpr std::uint8_t Hidden = 1 << 6;
constexpr std::uint8_t Strikethrough = 1 << 7;
}

struct Cell {
  std::string ch = " "; // one grapheme, UTF-8
  Color fg = kDefaultColor;
  Color bg = kDefaultColor;
  std::uint8_t attrs = Attr::None;

  bool operator==(const Cell& o) const { return attrs == o.attrs && fg == o.fg && bg == o.bg && ch == o.ch; }
  bool operator!=(const Cell& o) const { return !(*this == o); }
};

struct RenderCell {
  int x = 0;
  int y = 0;
  Cell cell;
};

struct KeyEvent {
  std::string name;     // canonical key identifier, "unknown" when unmatched
  std::string sequence; // decoded text
  bool ctrl = false;
  bool meta = false;
  bool shift = false;
  std::string raw;      // original bytes
};

enum class MouseButton { Left, Right, Middle, WheelUp, WheelDown, None, Unknown };
enum class MouseAction { Press, Release, Move, Wheel };
enum class MouseProtocol { X10, Utf8, Sgr, Urxvt };

struct MouseEvent {
  int x = 0;
  int y = 0;
  MouseButton button = MouseButton::Unknown;
  MouseAction action = MouseAction::Press;
  bool ctrl = false;
  bool meta = false;
  bool shift = false;
  MouseProtocol protocol = MouseProtocol::Sgr;
  std::string raw;
};

struct FocusEvent {
  bool focused = false;
  std::string raw;
};

struct PasteEvent {
  std::string text;
};

using InputEvent = std::variant<KeyEvent, MouseEvent, FocusEvent, PasteEvent>;

const char* to_string(MouseButton b);
const char* to_string(MouseAction a);
const char* to_string(MouseProtocol p);
