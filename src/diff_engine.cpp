#include "diff_engine.hpp"
#include <spdlog/spdlog.h>

std::vector<RenderCell> DiffEngine::diff(CellBuffer& buffer) {
  std::vector<RenderCell> out;
  stats_ = DiffStats{};
  stats_.full_redraw = buffer.needs_full_redraw();
  const int w = buffer.width(), h = buffer.height();
  if (stats_.full_redraw) out.reserve(static_cast<size_t>(w) * h);
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      const Cell& cur = buffer.current_[buffer.index(x, y)];
      stats_.cells_compared++;
      if (stats_.full_redraw || cur != buffer.previous_[buffer.index(x, y)])
        out.push_back(RenderCell{x, y, cur});
    }
  }
  stats_.cells_changed = out.size();
  buffer.commit_frame();
  if (stats_.full_redraw) spdlog::debug("diff: full redraw {}x{}", w, h);
  return out;
}
