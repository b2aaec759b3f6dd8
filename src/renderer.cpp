#include "renderer.hpp"
#include <exception>
#include <spdlog/spdlog.h>

void Renderer::begin() {
  if (active_) return;
  sink_.write(backend_.init());
  sink_.flush();
  active_ = true;
  spdlog::info("renderer started with {} backend", backend_.name());
}

std::size_t Renderer::render_frame(CellBuffer& buffer) {
  auto changes = diff_.diff(buffer);
  if (changes.empty()) return 0;
  std::string out = backend_.render_buffer(changes, buffer.width(), buffer.height());
  std::size_t n = sink_.write(out);
  sink_.flush();
  stats_.frames++;
  stats_.bytes += n;
  stats_.cells += changes.size();
  return n;
}

std::size_t Renderer::write_raw(std::string_view bytes) {
  std::size_t n = sink_.write(bytes);
  sink_.flush();
  return n;
}

void Renderer::end() noexcept {
  if (!active_) return;
  active_ = false;
  try {
    sink_.write(backend_.cleanup());
    sink_.flush();
    spdlog::info("renderer stopped after {} frames, {} bytes", stats_.frames, stats_.bytes);
  } catch (const std::exception& e) {
    spdlog::error("renderer cleanup failed: {}", e.what());
  }
}
