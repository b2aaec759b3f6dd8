#include "cell_buffer.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include "utf8.hpp"

CellBuffer::CellBuffer(int width, int height) {
  if (width <= 0 || height <= 0)
    throw std::invalid_argument("cell buffer size must be positive, got " +
                                std::to_string(width) + "x" + std::to_string(height));
  width_ = width;
  height_ = height;
  current_.assign(static_cast<size_t>(width) * height, Cell{});
  previous_.assign(current_.size(), Cell{});
}

const Cell* CellBuffer::cell(int x, int y) const {
  if (!in_bounds(x, y)) return nullptr;
  return &current_[index(x, y)];
}

const Cell* CellBuffer::previous_cell(int x, int y) const {
  if (!in_bounds(x, y)) return nullptr;
  return &previous_[index(x, y)];
}

bool CellBuffer::set_cell(int x, int y, const Cell& c) {
  if (!in_bounds(x, y)) return false;
  current_[index(x, y)] = c;
  return true;
}

bool CellBuffer::set_char(int x, int y, std::string_view ch) {
  if (!in_bounds(x, y)) return false;
  current_[index(x, y)].ch.assign(ch.empty() ? std::string_view(" ") : ch);
  return true;
}

void CellBuffer::fill_rect(int x, int y, int w, int h, const Cell& c) {
  int x0 = std::max(0, x), y0 = std::max(0, y);
  int x1 = std::min(width_, x + w), y1 = std::min(height_, y + h);
  for (int row = y0; row < y1; ++row)
    for (int col = x0; col < x1; ++col) current_[index(col, row)] = c;
}

int CellBuffer::write_text(int x, int y, std::string_view text, Color fg, Color bg, std::uint8_t attrs) {
  if (y < 0 || y >= height_) return 0;
  int written = 0;
  int col = x;
  size_t i = 0;
  while (i < text.size() && col < width_) {
    size_t n = utf8::sequence_length(static_cast<unsigned char>(text[i]));
    if (n == 0 || i + n > text.size()) n = 1; // malformed byte occupies one cell
    if (col >= 0) {
      Cell& c = current_[index(col, y)];
      c.ch.assign(text.substr(i, n));
      c.fg = fg; c.bg = bg; c.attrs = attrs;
      written++;
    }
    col++;
    i += n;
  }
  return written;
}

void CellBuffer::clear(const Cell& c) {
  std::fill(current_.begin(), current_.end(), c);
}

void CellBuffer::resize(int width, int height) {
  if (width <= 0 || height <= 0)
    throw std::invalid_argument("cell buffer size must be positive, got " +
                                std::to_string(width) + "x" + std::to_string(height));
  std::vector<Cell> next(static_cast<size_t>(width) * height, Cell{});
  int copy_w = std::min(width, width_), copy_h = std::min(height, height_);
  for (int row = 0; row < copy_h; ++row)
    for (int col = 0; col < copy_w; ++col)
      next[static_cast<size_t>(row) * width + col] = std::move(current_[index(col, row)]);
  width_ = width;
  height_ = height;
  current_ = std::move(next);
  previous_.assign(current_.size(), Cell{});
  full_redraw_ = true;
}

void CellBuffer::commit_frame() {
  std::copy(current_.begin(), current_.end(), previous_.begin());
  full_redraw_ = false;
}
