#include "input_decoder.hpp"
#include <cassert>
#include <string>
#include <vector>

static std::vector<InputEvent> run(InputDecoder& d, std::initializer_list<std::string> chunks) {
  InputEventQueue q(0);
  for (const auto& c : chunks) d.feed(c, q);
  return q.drain();
}

static const KeyEvent& key(const InputEvent& ev) { return std::get<KeyEvent>(ev); }

static void test_mouse_then_key() {
  InputDecoder d;
  auto ev = run(d, {"\x1b[<0;5;6Ma"});
  assert(ev.size() == 2);
  const auto& m = std::get<MouseEvent>(ev[0]);
  assert(m.x == 4 && m.y == 5 && m.button == MouseButton::Left);
  assert(key(ev[1]).name == "a");

  ev = run(d, {"\x1b[<0;5", ";6M"});
  assert(ev.size() == 1 && std::holds_alternative<MouseEvent>(ev[0]));

  ev = run(d, {"x\x1b[<64;1;1My"});
  assert(ev.size() == 3);
  assert(key(ev[0]).name == "x");
  assert(std::get<MouseEvent>(ev[1]).button == MouseButton::WheelUp);
  assert(key(ev[2]).name == "y");
}

static void test_keys_pass_through() {
  InputDecoder d;
  auto ev = run(d, {"\x1b[A"});
  assert(ev.size() == 1 && key(ev[0]).name == "up");

  ev = run(d, {"\x1b[1;5", "A"});
  assert(ev.size() == 1 && key(ev[0]).name == "up" && key(ev[0]).ctrl);

  ev = run(d, {"\x1b", "[", "B"});
  assert(ev.size() == 1 && key(ev[0]).name == "down");

  ev = run(d, {"\x1b\x1b[A"});
  assert(ev.size() == 1 && key(ev[0]).name == "up" && key(ev[0]).meta);
  ev = run(d, {"\x1b", "\x1b", "[", "A"});
  assert(ev.size() == 1 && key(ev[0]).name == "up" && key(ev[0]).meta);

  ev = run(d, {"\x1bx"});
  assert(ev.size() == 1 && key(ev[0]).name == "x" && key(ev[0]).meta);

  ev = run(d, {"\xc3", "\xa9"});
  assert(ev.size() == 1 && key(ev[0]).name == "\xc3\xa9");

  ev = run(d, {"\x1bOP"});
  assert(ev.size() == 1 && key(ev[0]).name == "f1");
}

static void test_focus() {
  InputDecoder d;
  auto ev = run(d, {"\x1b[I\x1b[O"});
  assert(ev.size() == 2);
  assert(std::get<FocusEvent>(ev[0]).focused);
  assert(!std::get<FocusEvent>(ev[1]).focused);
  assert(std::get<FocusEvent>(ev[1]).raw == "\x1b[O");
}

static void test_paste() {
  InputDecoder d;
  auto ev = run(d, {"\x1b[200~hello\x1b[201~"});
  assert(ev.size() == 1 && std::get<PasteEvent>(ev[0]).text == "hello");

  ev = run(d, {"\x1b[20", "0~hel", "lo\x1b[2", "01~x"});
  assert(ev.size() == 2);
  assert(std::get<PasteEvent>(ev[0]).text == "hello");
  assert(key(ev[1]).name == "x");

  // escape sequences inside a paste are text
  ev = run(d, {"\x1b[200~a\x1b[Ab\x1b[<0;1;1M\x1b[201~"});
  assert(ev.size() == 1 && std::get<PasteEvent>(ev[0]).text == "a\x1b[Ab\x1b[<0;1;1M");

  InputEventQueue q(0);
  d.feed("\x1b[200~abc", q);
  assert(d.in_paste());
  assert(!d.has_pending());
  d.flush(q);
  assert(q.empty());
  d.feed("\x1b[201~", q);
  assert(q.size() == 1);

  std::string big(InputDecoder::kMaxPaste + 10, 'p');
  ev = run(d, {"\x1b[200~", big, "\x1b[201~"});
  assert(ev.size() == 1 && std::get<PasteEvent>(ev[0]).text.size() == InputDecoder::kMaxPaste);
}

static void test_escape_timeout() {
  InputDecoder d;
  InputEventQueue q(0);
  d.feed("\x1b", q);
  assert(q.empty());
  assert(d.escape_pending() && d.has_pending());
  d.flush(q);
  assert(q.size() == 1 && key(*q.peek()).name == "escape");
  assert(!d.has_pending());
  q.clear();

  d.feed("\x1b\x1b", q);
  assert(q.empty() && d.escape_pending());
  d.flush(q);
  assert(q.size() == 1 && key(*q.peek()).name == "escape" && key(*q.peek()).meta);
  q.clear();

  d.feed("\x1b[<0;1", q);
  assert(d.has_pending() && !d.escape_pending());
  d.flush(q);
  assert(q.size() == 1 && key(*q.peek()).name == "unknown");
}

int main() {
  test_mouse_then_key();
  test_keys_pass_through();
  test_focus();
  test_paste();
  test_escape_timeout();
  return 0;
}
