#pragma once
/*
 * CellBuffer
 *
 * Purpose: width x height grid of Cells (current frame) plus the shadow copy
 *          of the last rendered frame used by DiffEngine.
 * Invariant: both grids always share dimensions; resize/invalidate force a
 *            full redraw on the next diff.
 */
#include <string_view>
#include <vector>
#include "types.hpp"

class CellBuffer {
public:
  CellBuffer(int width, int height);

  int width() const { return width_; }
  int height() const { return height_; }
  bool in_bounds(int x, int y) const { return x >= 0 && y >= 0 && x < width_ && y < height_; }

  const Cell* cell(int x, int y) const;
  const Cell* previous_cell(int x, int y) const;
  bool set_cell(int x, int y, const Cell& c);
  bool set_char(int x, int y, std::string_view ch);
  void fill_rect(int x, int y, int w, int h, const Cell& c);
  int write_text(int x, int y, std::string_view text,
                 Color fg = kDefaultColor, Color bg = kDefaultColor, std::uint8_t attrs = Attr::None);
  void clear(const Cell& c = Cell{});

  void resize(int width, int height);
  void invalidate() { full_redraw_ = true; }
  bool needs_full_redraw() const { return full_redraw_; }
  void commit_frame();

private:
  int index(int x, int y) const { return y * width_ + x; }

  int width_ = 0;
  int height_ = 0;
  std::vector<Cell> current_;
  std::vector<Cell> previous_;
  bool full_redraw_ = true;

  friend class DiffEngine;
};
