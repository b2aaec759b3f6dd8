#pragma once
/*
 * DiffEngine
 *
 * Purpose: compare current vs previous frame of a CellBuffer and emit the
 *          changed cells in row-major order, then commit the frame.
 * Invariant: diffing twice without mutation yields nothing the second time.
 */
#include <cstddef>
#include <vector>
#include "cell_buffer.hpp"
#include "types.hpp"

struct DiffStats {
  std::size_t cells_compared = 0;
  std::size_t cells_changed = 0;
  bool full_redraw = false;
};

class DiffEngine {
public:
  std::vector<RenderCell> diff(CellBuffer& buffer);
  const DiffStats& last_stats() const { return stats_; }
private:
  DiffStats stats_;
};
