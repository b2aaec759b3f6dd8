#include "ansi.hpp"
#include "types.hpp"
#include <cassert>
#include <cstdint>
#include <initializer_list>
#include <string>

static void test_round_trip_all_channels() {
  for (int r = 0; r < 256; ++r)
    for (int g = 0; g < 256; ++g)
      for (int b = 0; b < 256; ++b) {
        for (int a : {255, 0x5a}) {
          Color c = pack_argb(static_cast<std::uint8_t>(r), static_cast<std::uint8_t>(g),
                              static_cast<std::uint8_t>(b), static_cast<std::uint8_t>(a));
          assert(color_r(c) == r && color_g(c) == g && color_b(c) == b && color_a(c) == a);
          assert(pack_argb(color_r(c), color_g(c), color_b(c), color_a(c)) == c);
        }
      }
}

int main() {
  test_round_trip_all_channels();

  Color c = pack_argb(0x12, 0x34, 0x56);
  assert(c == 0xFF123456u);
  assert(color_r(c) == 0x12 && color_g(c) == 0x34 && color_b(c) == 0x56 && color_a(c) == 0xFF);
  assert(pack_argb(color_r(c), color_g(c), color_b(c), color_a(c)) == c);
  assert(rgb(1, 2, 3) == pack_argb(1, 2, 3, 255));
  assert(is_default_color(kDefaultColor));
  assert(is_default_color(pack_argb(255, 255, 255, 0)));
  assert(!is_default_color(rgb(0, 0, 0)));

  assert(ansi::to_xterm256(rgb(0, 0, 0)) == 16);
  assert(ansi::to_xterm256(rgb(255, 0, 0)) == 196);
  assert(ansi::to_xterm256(rgb(255, 255, 255)) == 231);

  assert(ansi::fg_color(rgb(255, 0, 0), true) == "\x1b[38;2;255;0;0m");
  assert(ansi::bg_color(rgb(0, 128, 255), true) == "\x1b[48;2;0;128;255m");
  assert(ansi::fg_color(rgb(255, 0, 0), false) == "\x1b[38;5;196m");
  assert(ansi::fg_color(kDefaultColor, true) == "\x1b[39m");
  assert(ansi::bg_color(kDefaultColor, false) == "\x1b[49m");

  assert(ansi::attr_codes(Attr::None).empty());
  assert(ansi::attr_codes(Attr::Bold) == "\x1b[1m");
  assert(ansi::attr_codes(Attr::Bold | Attr::Underline) == "\x1b[1;4m");
  assert(ansi::attr_codes(Attr::Dim | Attr::Italic | Attr::Blink | Attr::Inverse | Attr::Hidden | Attr::Strikethrough)
         == "\x1b[2;3;5;7;8;9m");

  assert(ansi::cursor_to(0, 0) == "\x1b[1;1H");
  assert(ansi::cursor_to(4, 9) == "\x1b[5;10H");
  assert(ansi::cursor_column(7) == "\x1b[8G");
  assert(ansi::cursor_forward(1) == "\x1b[C");
  assert(ansi::cursor_forward(3) == "\x1b[3C");
  return 0;
}
