#pragma once
/*
 * App
 *
 * Purpose: cooperative frame loop. Owns the terminal session, cell buffer,
 *          input decoder/queue and renderer for the duration of run().
 * Flow: poll stdin + signalfd -> decode -> resize/stop -> tick -> render.
 * Constraint: single-threaded; stop() takes effect after the current tick.
 */
#include <functional>
#include <memory>
#include "cell_buffer.hpp"
#include "config.hpp"
#include "input_event_queue.hpp"
#include "output_sink.hpp"
#include "render_backend.hpp"
#include "terminal.hpp"

class App;
using TickFn = std::function<void(InputEventQueue&, CellBuffer&, App&)>;

class App {
public:
  explicit App(AppConfig cfg);
  // Injected backend/sink/session options, mainly for tests.
  App(AppConfig cfg, std::unique_ptr<RenderBackend> backend, OutputSink& sink, SessionOptions session);

  void run(const TickFn& tick);
  void stop() { running_ = false; }
  bool running() const { return running_; }

  const AppConfig& config() const { return cfg_; }
  RenderBackend& backend() { return *backend_; }
  std::size_t frames() const { return frames_; }

private:
  int poll_timeout(bool escape_pending) const;

  AppConfig cfg_;
  std::unique_ptr<RenderBackend> backend_;
  std::unique_ptr<OutputSink> owned_sink_;
  OutputSink* sink_ = nullptr;
  SessionOptions session_opts_;
  bool running_ = false;
  std::size_t frames_ = 0;
};
