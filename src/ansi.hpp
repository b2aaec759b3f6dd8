#pragma once
/*
 * ansi
 *
 * Purpose: escape sequence builders and the cursor/style optimizer shared by
 *          every backend (RenderState cache + emit helpers).
 * Invariant: after an emit, RenderState mirrors terminal state exactly, so
 *            redundant sequences are never re-emitted.
 */
#include <cstdint>
#include <string>
#include <vector>
#include "types.hpp"

struct RenderState {
  static constexpr std::int64_t kUnknown = -1;
  int last_x = -1;
  int last_y = -1;
  std::int64_t last_fg = kUnknown;
  std::int64_t last_bg = kUnknown;
  int last_attrs = -1;
  void reset() { *this = RenderState{}; }
};

namespace ansi {

inline constexpr const char* kEsc = "\x1b";
inline constexpr const char* kCsi = "\x1b[";

inline constexpr const char* kReset = "\x1b[0m";
inline constexpr const char* kAltScreenOn = "\x1b[?1049h";
inline constexpr const char* kAltScreenOff = "\x1b[?1049l";
inline constexpr const char* kCursorShow = "\x1b[?25h";
inline constexpr const char* kCursorHide = "\x1b[?25l";
inline constexpr const char* kSyncBegin = "\x1b[?2026h";
inline constexpr const char* kSyncEnd = "\x1b[?2026l";
inline constexpr const char* kDefaultFg = "\x1b[39m";
inline constexpr const char* kDefaultBg = "\x1b[49m";

// row/col are 0-indexed here, 1-indexed on the wire.
std::string cursor_to(int row, int col);
std::string cursor_column(int col);
std::string cursor_forward(int n);

std::string attr_codes(std::uint8_t attrs);
std::string fg_color(Color c, bool truecolor);
std::string bg_color(Color c, bool truecolor);
int to_xterm256(Color c);

std::string mouse_tracking(bool on);
std::string bracketed_paste(bool on);
std::string focus_reporting(bool on);

// Largest same-row forward gap served by a relative move.
inline constexpr int kMaxForwardGap = 3;

void emit_cursor(std::string& out, RenderState& st, int x, int y);
void emit_style(std::string& out, RenderState& st, const Cell& c, bool truecolor);

// Full change-list rendering: sort, clip, move, style, print.
std::string render_changes(const std::vector<RenderCell>& changes, int width, int height,
                           RenderState& st, bool truecolor);

} // namespace ansi
