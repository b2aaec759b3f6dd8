#include "ansi.hpp"
#include <algorithm>

namespace ansi {

std::string cursor_to(int row, int col) {
  return std::string(kCsi) + std::to_string(row + 1) + ";" + std::to_string(col + 1) + "H";
}

std::string cursor_column(int col) {
  return std::string(kCsi) + std::to_string(col + 1) + "G";
}

std::string cursor_forward(int n) {
  if (n == 1) return std::string(kCsi) + "C";
  return std::string(kCsi) + std::to_string(n) + "C";
}

std::string attr_codes(std::uint8_t attrs) {
  if (attrs == Attr::None) return {};
  static constexpr struct { std::uint8_t bit; const char* code; } table[] = {
    {Attr::Bold, "1"}, {Attr::Dim, "2"}, {Attr::Italic, "3"}, {Attr::Underline, "4"},
    {Attr::Blink, "5"}, {Attr::Inverse, "7"}, {Attr::Hidden, "8"}, {Attr::Strikethrough, "9"},
  };
  std::string seq = kCsi;
  bool first = true;
  for (const auto& e : table) {
    if (!(attrs & e.bit)) continue;
    if (!first) seq += ';';
    seq += e.code;
    first = false;
  }
  seq += 'm';
  return seq;
}

namespace {
int to_cube(std::uint8_t c) { return c / 51; } // 0-255 -> 0-5

std::string color_seq(Color c, bool truecolor, const char* base, const char* def) {
  if (is_default_color(c)) return def;
  if (truecolor)
    return std::string(kCsi) + base + ";2;" + std::to_string(color_r(c)) + ";" +
           std::to_string(color_g(c)) + ";" + std::to_string(color_b(c)) + "m";
  return std::string(kCsi) + base + ";5;" + std::to_string(to_xterm256(c)) + "m";
}
} // namespace

int to_xterm256(Color c) {
  return 16 + 36 * to_cube(color_r(c)) + 6 * to_cube(color_g(c)) + to_cube(color_b(c));
}

std::string fg_color(Color c, bool truecolor) { return color_seq(c, truecolor, "38", kDefaultFg); }
std::string bg_color(Color c, bool truecolor) { return color_seq(c, truecolor, "48", kDefaultBg); }

std::string mouse_tracking(bool on) {
  return on ? "\x1b[?1000h\x1b[?1002h\x1b[?1006h" : "\x1b[?1006l\x1b[?1002l\x1b[?1000l";
}
std::string bracketed_paste(bool on) { return on ? "\x1b[?2004h" : "\x1b[?2004l"; }
std::string focus_reporting(bool on) { return on ? "\x1b[?1004h" : "\x1b[?1004l"; }

void emit_cursor(std::string& out, RenderState& st, int x, int y) {
  if (y == st.last_y && x == st.last_x) return; // implicit advance
  if (y == st.last_y && st.last_x >= 0) {
    int dx = x - st.last_x;
    if (dx > 0 && dx <= kMaxForwardGap) out += cursor_forward(dx);
    else out += cursor_column(x);
  } else {
    out += cursor_to(y, x);
  }
  st.last_x = x;
  st.last_y = y;
}

void emit_style(std::string& out, RenderState& st, const Cell& c, bool truecolor) {
  if (st.last_attrs != c.attrs) {
    // SGR cannot clear a single attribute: leaving any non-empty set needs a reset.
    if (st.last_attrs != Attr::None) {
      out += kReset;
      st.last_fg = RenderState::kUnknown;
      st.last_bg = RenderState::kUnknown;
    }
    out += attr_codes(c.attrs);
    st.last_attrs = c.attrs;
  }
  if (st.last_fg != static_cast<std::int64_t>(c.fg)) {
    out += fg_color(c.fg, truecolor);
    st.last_fg = c.fg;
  }
  if (st.last_bg != static_cast<std::int64_t>(c.bg)) {
    out += bg_color(c.bg, truecolor);
    st.last_bg = c.bg;
  }
}

std::string render_changes(const std::vector<RenderCell>& changes, int width, int height,
                           RenderState& st, bool truecolor) {
  std::string out;
  if (changes.empty()) return out;
  std::vector<const RenderCell*> order;
  order.reserve(changes.size());
  for (const auto& rc : changes) {
    if (rc.x < 0 || rc.y < 0 || rc.x >= width || rc.y >= height) continue;
    order.push_back(&rc);
  }
  std::stable_sort(order.begin(), order.end(), [](const RenderCell* a, const RenderCell* b) {
    return a->y != b->y ? a->y < b->y : a->x < b->x;
  });
  out.reserve(order.size() * 4);
  for (const RenderCell* rc : order) {
    emit_cursor(out, st, rc->x, rc->y);
    emit_style(out, st, rc->cell, truecolor);
    out += rc->cell.ch.empty() ? std::string(" ") : rc->cell.ch;
    // Writing the last column leaves the terminal in pending-wrap state.
    st.last_x = rc->x + 1 < width ? rc->x + 1 : -1;
  }
  return out;
}

} // namespace ansi
