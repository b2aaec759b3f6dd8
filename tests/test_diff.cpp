#include "cell_buffer.hpp"
#include "diff_engine.hpp"
#include <cassert>

int main() {
  CellBuffer b(8, 3);
  DiffEngine d;

  auto first = d.diff(b);
  assert(first.size() == 8u * 3u);
  assert(d.last_stats().full_redraw);
  assert(first[0].x == 0 && first[0].y == 0);
  assert(first[8].x == 0 && first[8].y == 1);

  // nothing changed since the last diff
  assert(d.diff(b).empty());
  assert(d.last_stats().cells_compared == 24);
  assert(d.last_stats().cells_changed == 0);
  assert(!d.last_stats().full_redraw);

  b.set_char(5, 2, "z");
  b.set_char(1, 0, "a");
  auto ch = d.diff(b);
  assert(ch.size() == 2);
  assert(ch[0].x == 1 && ch[0].y == 0 && ch[0].cell.ch == "a");
  assert(ch[1].x == 5 && ch[1].y == 2 && ch[1].cell.ch == "z");
  assert(d.diff(b).empty());

  // rewriting identical content is not a change
  b.set_char(1, 0, "a");
  assert(d.diff(b).empty());

  // style-only change
  Cell c = *b.cell(1, 0);
  c.fg = rgb(1, 2, 3);
  b.set_cell(1, 0, c);
  assert(d.diff(b).size() == 1);

  b.invalidate();
  assert(d.diff(b).size() == 24);

  b.resize(4, 4);
  assert(d.diff(b).size() == 16);
  assert(d.diff(b).empty());
  return 0;
}
