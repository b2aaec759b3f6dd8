#include "cell_buffer.hpp"
#include <cassert>
#include <stdexcept>
#include <string>

static bool throws_invalid(int w, int h) {
  try { CellBuffer b(w, h); } catch (const std::invalid_argument&) { return true; }
  return false;
}

int main() {
  assert(throws_invalid(0, 5));
  assert(throws_invalid(5, -1));

  CellBuffer b(10, 5);
  assert(b.width() == 10 && b.height() == 5);
  assert(b.cell(0, 0)->ch == " ");
  assert(b.cell(10, 0) == nullptr);
  assert(b.cell(-1, 0) == nullptr);
  assert(b.needs_full_redraw());

  Cell red{"x", rgb(255, 0, 0), kDefaultColor, Attr::Bold};
  assert(b.set_cell(3, 2, red));
  assert(*b.cell(3, 2) == red);
  assert(!b.set_cell(10, 2, red));
  assert(b.set_char(4, 2, "y"));
  assert(b.cell(4, 2)->ch == "y");
  b.set_char(4, 2, "");
  assert(b.cell(4, 2)->ch == " ");

  // UTF-8 text occupies one cell per code point
  assert(b.write_text(0, 0, "h\xc3\xa9llo") == 5);
  assert(b.cell(1, 0)->ch == "\xc3\xa9");
  assert(b.cell(4, 0)->ch == "o");

  // clipping on both sides
  assert(b.write_text(8, 1, "abcd") == 2);
  assert(b.cell(9, 1)->ch == "b");
  assert(b.write_text(-2, 1, "abcd") == 2);
  assert(b.cell(0, 1)->ch == "c");
  assert(b.write_text(0, 7, "abcd") == 0);

  Cell blue{"#", rgb(0, 0, 255), kDefaultColor, Attr::None};
  b.fill_rect(8, 3, 5, 5, blue);
  assert(*b.cell(9, 4) == blue);
  assert(*b.cell(8, 3) == blue);
  assert(*b.cell(7, 3) != blue);

  b.commit_frame();
  assert(!b.needs_full_redraw());
  assert(*b.previous_cell(3, 2) == red);

  b.resize(4, 3);
  assert(b.width() == 4 && b.height() == 3);
  assert(*b.cell(3, 2) == red);
  assert(b.previous_cell(3, 2)->ch == " ");
  assert(b.needs_full_redraw());
  bool threw = false;
  try { b.resize(0, 3); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  b.clear();
  assert(b.cell(3, 2)->ch == " ");
  return 0;
}
