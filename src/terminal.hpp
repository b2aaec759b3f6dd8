#pragma once
/*
 * TerminalSession
 *
 * Purpose: RAII scope for the controlling terminal: raw mode, renderer
 *          init/cleanup, mouse/paste/focus reporting, SIGINT/SIGTERM/SIGWINCH
 *          delivered through a signalfd.
 * Usage: construct once in App::run; destructor restores the terminal.
 * Note: restore() is idempotent and safe on every exit path.
 */
#include <signal.h>
#include <termios.h>
#include <unistd.h>
#include "output_sink.hpp"
#include "posix_fd.hpp"
#include "renderer.hpp"

struct SessionOptions {
  int input_fd = STDIN_FILENO;
  int output_fd = STDOUT_FILENO;
  bool raw_mode = true;
  bool handle_signals = true;
  bool mouse = true;
  bool bracketed_paste = true;
  bool focus_events = false;
};

struct TermSize {
  int width = 80;
  int height = 24;
};

struct SignalState {
  bool stop = false;
  bool resized = false;
};

class TerminalSession {
public:
  TerminalSession(const SessionOptions& opts, Renderer& renderer);
  ~TerminalSession();

  TerminalSession(const TerminalSession&) = delete;
  TerminalSession& operator=(const TerminalSession&) = delete;

  void restore() noexcept;
  TermSize size();
  SignalState read_signals();

  int input_fd() const { return opts_.input_fd; }
  int signal_fd() const { return signal_fd_.get(); }
  bool is_tty() const { return tty_; }

private:
  void enter_raw_mode();
  void block_signals();
  bool terminfo_size(TermSize& out);

  SessionOptions opts_;
  Renderer& renderer_;
  bool tty_ = false;
  bool raw_ = false;
  bool masked_ = false;
  bool restored_ = false;
  termios saved_{};
  sigset_t old_mask_{};
  UniqueFd signal_fd_;
  bool terminfo_tried_ = false;
  TermSize terminfo_{0, 0};
};
