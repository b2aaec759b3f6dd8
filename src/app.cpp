#include "app.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <exception>
#include <utility>
#include <system_error>
#include <poll.h>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include "backend_detector.hpp"
#include "input_decoder.hpp"
#include "renderer.hpp"

static SessionOptions session_options(const AppConfig& cfg) {
  SessionOptions o;
  o.mouse = cfg.mouse;
  o.bracketed_paste = cfg.bracketed_paste;
  o.focus_events = cfg.focus_events;
  return o;
}

App::App(AppConfig cfg)
  : cfg_(std::move(cfg)),
    backend_(BackendDetector().detect(preference(cfg_))),
    owned_sink_(std::make_unique<FdSink>(STDOUT_FILENO)),
    sink_(owned_sink_.get()),
    session_opts_(session_options(cfg_)) {}

App::App(AppConfig cfg, std::unique_ptr<RenderBackend> backend, OutputSink& sink, SessionOptions session)
  : cfg_(std::move(cfg)), backend_(std::move(backend)), sink_(&sink), session_opts_(session) {}

int App::poll_timeout(bool escape_pending) const {
  return escape_pending ? cfg_.escape_timeout_ms : cfg_.frame_interval_ms;
}

void App::run(const TickFn& tick) {
  Renderer renderer(*backend_, *sink_);
  TerminalSession session(session_opts_, renderer);
  TermSize sz = session.size();
  CellBuffer buffer(sz.width, sz.height);
  InputDecoder decoder;
  InputEventQueue queue(cfg_.max_queue);
  spdlog::info("app running: backend={} size={}x{}", backend_->name(), sz.width, sz.height);

  using Clock = std::chrono::steady_clock;
  running_ = true;
  bool input_open = true;
  Clock::time_point escape_deadline{};
  try {
    while (running_) {
      pollfd fds[2];
      nfds_t nfds = 0;
      int in_idx = -1, sig_idx = -1;
      if (input_open) { in_idx = static_cast<int>(nfds); fds[nfds++] = pollfd{session.input_fd(), POLLIN, 0}; }
      if (session.signal_fd() >= 0) { sig_idx = static_cast<int>(nfds); fds[nfds++] = pollfd{session.signal_fd(), POLLIN, 0}; }
      int timeout = poll_timeout(decoder.has_pending());
      if (decoder.has_pending()) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(escape_deadline - Clock::now()).count();
        timeout = static_cast<int>(std::clamp<long long>(left, 0, timeout));
      }
      int rc = ::poll(fds, nfds, timeout);
      if (rc < 0 && errno != EINTR) throw std::system_error(errno, std::generic_category(), "poll");

      bool got_input = false;
      if (rc > 0 && in_idx >= 0 && (fds[in_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
        char buf[4096];
        ssize_t n = ::read(session.input_fd(), buf, sizeof(buf));
        if (n > 0) {
          decoder.feed(std::string_view(buf, static_cast<std::size_t>(n)), queue);
          got_input = true;
          if (decoder.has_pending()) escape_deadline = Clock::now() + std::chrono::milliseconds(cfg_.escape_timeout_ms);
        } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
          spdlog::warn("input closed, stopping");
          input_open = false;
          running_ = false;
        }
      }
      // Held bytes resolve only once the escape timeout has really elapsed;
      // a signal wake-up before then leaves them pending.
      if (!got_input && decoder.has_pending() && (rc == 0 || !input_open || Clock::now() >= escape_deadline))
        decoder.flush(queue);

      if (rc > 0 && sig_idx >= 0 && (fds[sig_idx].revents & POLLIN)) {
        SignalState sig = session.read_signals();
        if (sig.stop) {
          spdlog::info("stop signal received");
          running_ = false;
        }
        if (sig.resized) {
          TermSize ns = session.size();
          spdlog::info("resize to {}x{}", ns.width, ns.height);
          buffer.resize(ns.width, ns.height);
        }
      }

      tick(queue, buffer, *this);
      renderer.render_frame(buffer);
      frames_++;
    }
  } catch (const std::exception& e) {
    spdlog::error("app loop failed: {}", e.what());
    running_ = false;
    session.restore();
    throw;
  }
  running_ = false;
  session.restore();
  spdlog::info("app stopped after {} frames", frames_);
}
