#pragma once
/*
 * Renderer
 *
 * Purpose: one frame = diff the CellBuffer, let the backend encode the
 *          changes, write the bytes to the sink.
 * Dependency: RenderBackend and OutputSink are injected so tests can capture
 *             exact output.
 * Constraint: init is written by begin(); cleanup is written once by end().
 */
#include <cstddef>
#include <string_view>
#include "cell_buffer.hpp"
#include "diff_engine.hpp"
#include "output_sink.hpp"
#include "render_backend.hpp"

struct FrameStats {
  std::size_t frames = 0;
  std::size_t bytes = 0;
  std::size_t cells = 0;
};

class Renderer {
public:
  Renderer(RenderBackend& backend, OutputSink& sink) : backend_(backend), sink_(sink) {}
  ~Renderer() { end(); }

  Renderer(const Renderer&) = delete;
  Renderer& operator=(const Renderer&) = delete;

  void begin();
  std::size_t render_frame(CellBuffer& buffer);
  // Out-of-band bytes (images, mode toggles) between frames.
  std::size_t write_raw(std::string_view bytes);
  void end() noexcept;

  bool active() const { return active_; }
  RenderBackend& backend() { return backend_; }
  const DiffStats& last_diff() const { return diff_.last_stats(); }
  const FrameStats& stats() const { return stats_; }

private:
  RenderBackend& backend_;
  OutputSink& sink_;
  DiffEngine diff_;
  FrameStats stats_;
  bool active_ = false;
};
