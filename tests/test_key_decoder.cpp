#include "key_decoder.hpp"
#include <cassert>
#include <string>
#include <vector>

static KeyEvent one(const std::string& bytes) {
  KeyDecoder d;
  auto ev = d.decode(bytes);
  assert(ev.size() == 1);
  assert(!d.has_pending());
  return ev[0];
}

static bool is(const KeyEvent& e, const char* name, bool ctrl = false, bool meta = false, bool shift = false) {
  return e.name == name && e.ctrl == ctrl && e.meta == meta && e.shift == shift;
}

static void test_single_bytes() {
  assert(is(one("a"), "a"));
  assert(one("a").sequence == "a");
  assert(is(one("A"), "a", false, false, true));
  assert(is(one("\x03"), "c", true));
  assert(is(one("\r"), "enter"));
  assert(is(one("\n"), "enter"));
  assert(is(one("\t"), "tab"));
  assert(is(one("\x7f"), "backspace"));
  assert(is(one("\x08"), "backspace"));
  assert(is(one(" "), "space"));
  assert(is(one(std::string(1, '\0')), "space", true));
  assert(is(one("\x1c"), "\\", true));
  assert(is(one("7"), "7"));
}

static void test_split_sequence() {
  KeyDecoder d;
  assert(d.decode("\x1b").empty());
  assert(d.has_pending() && d.escape_pending());
  assert(d.decode("[").empty());
  assert(d.has_pending() && !d.escape_pending());
  auto ev = d.decode("A");
  assert(ev.size() == 1);
  assert(is(ev[0], "up"));
  assert(ev[0].raw == "\x1b[A");
  assert(!d.has_pending());
}

static void test_csi_keys() {
  assert(is(one("\x1b[B"), "down"));
  assert(is(one("\x1b[C"), "right"));
  assert(is(one("\x1b[D"), "left"));
  assert(is(one("\x1b[H"), "home"));
  assert(is(one("\x1b[F"), "end"));
  assert(is(one("\x1b[E"), "clear"));
  assert(is(one("\x1b[1;5C"), "right", true));
  assert(is(one("\x1b[1;2A"), "up", false, false, true));
  assert(is(one("\x1b[1;3D"), "left", false, true));
  assert(is(one("\x1b[1;8B"), "down", true, true, true));
  assert(is(one("\x1b[2~"), "insert"));
  assert(is(one("\x1b[3~"), "delete"));
  assert(is(one("\x1b[5~"), "pageup"));
  assert(is(one("\x1b[6;5~"), "pagedown", true));
  assert(is(one("\x1b[1~"), "home"));
  assert(is(one("\x1b[4~"), "end"));
  assert(is(one("\x1b[11~"), "f1"));
  assert(is(one("\x1b[15~"), "f5"));
  assert(is(one("\x1b[17~"), "f6"));
  assert(is(one("\x1b[21~"), "f10"));
  assert(is(one("\x1b[24~"), "f12"));
  assert(is(one("\x1b[15;2~"), "f5", false, false, true));
  assert(is(one("\x1b[1;5P"), "f1", true));
  assert(is(one("\x1b[Z"), "tab", false, false, true));
}

static void test_variants() {
  assert(is(one("\x1bOP"), "f1"));
  assert(is(one("\x1bOS"), "f4"));
  assert(is(one("\x1bOA"), "up"));
  assert(is(one("\x1bOM"), "enter"));
  assert(is(one("\x1bO" "a"), "up", true));
  assert(is(one("\x1b[[A"), "f1"));
  assert(is(one("\x1b[[E"), "f5"));
  assert(is(one("\x1b[" "a"), "up", false, false, true));
  assert(is(one("\x1b[2$"), "insert", false, false, true));
  assert(is(one("\x1b[3^"), "delete", true));
  assert(is(one("\x1b[7~"), "home"));
}

static void test_meta() {
  assert(is(one("\x1bx"), "x", false, true));
  assert(one("\x1bx").sequence == "\x1bx");
  assert(is(one("\x1b" "A"), "a", false, true, true));
  assert(is(one("\x1b\x7f"), "backspace", false, true));
  assert(is(one("\x1b\x01"), "a", true, true));

  // doubled ESC folds into the following sequence as meta
  KeyEvent up = one("\x1b\x1b[A");
  assert(is(up, "up", false, true));
  assert(up.sequence == "\x1b\x1b[A");
  assert(is(one("\x1b\x1b[1;5C"), "right", true, true));
  assert(is(one("\x1b\x1bOP"), "f1", false, true));
  assert(is(one("\x1b\x1b[3~"), "delete", false, true));
  assert(is(one("\x1b\x1b[[A"), "f1", false, true));

  KeyDecoder d;
  auto ev = d.decode("\x1b\x1bx");
  assert(ev.size() == 2 && is(ev[0], "escape", false, true) && is(ev[1], "x"));
  ev = d.decode("\x1b\x1b\x1b");
  assert(ev.size() == 1 && is(ev[0], "escape", false, true));
  assert(d.escape_pending() && d.pending() == "\x1b");
}

static void test_utf8() {
  KeyEvent e = one("\xc3\xa9");
  assert(e.name == "\xc3\xa9" && e.sequence == "\xc3\xa9");
  assert(one("\xe2\x82\xac").name == "\xe2\x82\xac");

  KeyDecoder d;
  assert(d.decode("\xf0\x9f").empty());
  assert(d.has_pending());
  auto ev = d.decode("\x98\x80");
  assert(ev.size() == 1 && ev[0].name == "\xf0\x9f\x98\x80");

  ev = d.decode("\xff");
  assert(ev.size() == 1 && ev[0].name == "unknown");
  // truncated sequence followed by ASCII: unknown, then the ASCII key
  ev = d.decode("\xc3" "z");
  assert(ev.size() == 2 && ev[0].name == "unknown" && ev[1].name == "z");
}

static void test_unknown_and_flush() {
  KeyEvent e = one("\x1b[99~");
  assert(e.name == "unknown" && e.raw == "\x1b[99~");
  assert(one("\x1b[?25X").name == "unknown");

  KeyDecoder d;
  assert(d.decode("\x1b").empty());
  auto ev = d.flush();
  assert(ev.size() == 1 && is(ev[0], "escape") && ev[0].raw == "\x1b");
  assert(!d.has_pending());
  assert(d.flush().empty());

  ev = d.decode("\x1b\x1b");
  assert(ev.empty());
  assert(d.escape_pending());
  ev = d.flush();
  assert(ev.size() == 1 && is(ev[0], "escape", false, true));
  assert(ev[0].sequence == "\x1b\x1b");

  d.decode("\x1b[1;");
  ev = d.flush();
  assert(ev.size() == 1 && ev[0].name == "unknown" && ev[0].raw == "\x1b[1;");

  d.decode("\x1b[");
  d.reset();
  assert(!d.has_pending());
}

static void test_stream_order() {
  KeyDecoder d;
  auto ev = d.decode("ab\x1b[Bc\x1b[1;5D");
  assert(ev.size() == 5);
  assert(ev[0].name == "a" && ev[1].name == "b" && ev[2].name == "down" && ev[3].name == "c");
  assert(is(ev[4], "left", true));

  // an ESC inside a CSI abandons it and starts over
  ev = d.decode("\x1b[1\x1b[A");
  assert(ev.size() == 2 && ev[0].name == "unknown" && ev[1].name == "up");
}

static void test_pending_bound() {
  KeyDecoder d;
  std::string flood = "\x1b[" + std::string(KeyDecoder::kMaxPending + 100, '1');
  auto ev = d.decode(flood);
  assert(!ev.empty());
  assert(ev[0].name == "unknown");
  assert(d.pending().size() <= KeyDecoder::kMaxPending);
}

int main() {
  test_single_bytes();
  test_split_sequence();
  test_csi_keys();
  test_variants();
  test_meta();
  test_utf8();
  test_unknown_and_flush();
  test_stream_order();
  test_pending_bound();
  return 0;
}
