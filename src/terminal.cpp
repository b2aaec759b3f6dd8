#include "terminal.hpp"
#include <cerrno>
#include <exception>
#include <string>
#include <system_error>
#include <sys/ioctl.h>
#include <sys/signalfd.h>
#include <spdlog/spdlog.h>
#include "ansi.hpp"
#define NCURSES_NOMACROS
#include <curses.h>
#include <term.h>

static std::system_error errno_error(const char* what) {
  return std::system_error(errno, std::generic_category(), what);
}

TerminalSession::TerminalSession(const SessionOptions& opts, Renderer& renderer)
  : opts_(opts), renderer_(renderer) {
  tty_ = ::isatty(opts_.input_fd) != 0;
  try {
    if (opts_.raw_mode && tty_) enter_raw_mode();
    if (opts_.handle_signals) block_signals();
    renderer_.begin();
    std::string modes;
    if (opts_.mouse) modes += ansi::mouse_tracking(true);
    if (opts_.bracketed_paste) modes += ansi::bracketed_paste(true);
    if (opts_.focus_events) modes += ansi::focus_reporting(true);
    if (!modes.empty()) renderer_.write_raw(modes);
  } catch (...) {
    restore();
    throw;
  }
  spdlog::info("terminal session started (tty={}, raw={}, signals={})", tty_, raw_, masked_);
}

TerminalSession::~TerminalSession() { restore(); }

void TerminalSession::enter_raw_mode() {
  if (::tcgetattr(opts_.input_fd, &saved_) != 0) throw errno_error("tcgetattr");
  termios raw = saved_;
  raw.c_iflag &= ~static_cast<tcflag_t>(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
  raw.c_cflag |= CS8;
  raw.c_lflag &= ~static_cast<tcflag_t>(ECHO | ICANON | IEXTEN | ISIG);
  raw.c_cc[VMIN] = 0;
  raw.c_cc[VTIME] = 0;
  if (::tcsetattr(opts_.input_fd, TCSAFLUSH, &raw) != 0) throw errno_error("tcsetattr");
  raw_ = true;
}

void TerminalSession::block_signals() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  sigaddset(&set, SIGWINCH);
  int rc = ::pthread_sigmask(SIG_BLOCK, &set, &old_mask_);
  if (rc != 0) throw std::system_error(rc, std::generic_category(), "pthread_sigmask");
  masked_ = true;
  int fd = ::signalfd(-1, &set, SFD_NONBLOCK | SFD_CLOEXEC);
  if (fd < 0) throw errno_error("signalfd");
  signal_fd_.reset(fd);
}

void TerminalSession::restore() noexcept {
  if (restored_) return;
  restored_ = true;
  if (renderer_.active()) {
    std::string modes;
    try {
      if (opts_.focus_events) modes += ansi::focus_reporting(false);
      if (opts_.bracketed_paste) modes += ansi::bracketed_paste(false);
      if (opts_.mouse) modes += ansi::mouse_tracking(false);
      if (!modes.empty()) renderer_.write_raw(modes);
    } catch (const std::exception& e) {
      spdlog::error("disabling input modes failed: {}", e.what());
    }
  }
  renderer_.end();
  if (raw_ && ::tcsetattr(opts_.input_fd, TCSAFLUSH, &saved_) != 0)
    spdlog::error("tcsetattr restore failed: errno {}", errno);
  raw_ = false;
  if (masked_) {
    // Discard queued signals so unblocking does not deliver them.
    if (signal_fd_.valid()) {
      signalfd_siginfo info;
      while (::read(signal_fd_.get(), &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {}
    }
    ::pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    masked_ = false;
  }
  signal_fd_.reset();
  spdlog::info("terminal session restored");
}

bool TerminalSession::terminfo_size(TermSize& out) {
  if (!terminfo_tried_) {
    terminfo_tried_ = true;
    int err = 0;
    if (::setupterm(nullptr, opts_.output_fd, &err) == OK) {
      int c = ::tigetnum(const_cast<char*>("cols"));
      int r = ::tigetnum(const_cast<char*>("lines"));
      if (c > 0 && r > 0) terminfo_ = TermSize{c, r};
      ::del_curterm(cur_term);
    } else {
      spdlog::debug("setupterm failed ({}), no terminfo size", err);
    }
  }
  if (terminfo_.width <= 0 || terminfo_.height <= 0) return false;
  out = terminfo_;
  return true;
}

TermSize TerminalSession::size() {
  winsize ws{};
  if (::ioctl(opts_.output_fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0)
    return TermSize{ws.ws_col, ws.ws_row};
  TermSize ts;
  if (terminfo_size(ts)) return ts;
  return TermSize{};
}

SignalState TerminalSession::read_signals() {
  SignalState st;
  if (!signal_fd_.valid()) return st;
  signalfd_siginfo info;
  for (;;) {
    ssize_t n = ::read(signal_fd_.get(), &info, sizeof(info));
    if (n == static_cast<ssize_t>(sizeof(info))) {
      if (info.ssi_signo == SIGWINCH) st.resized = true;
      else if (info.ssi_signo == SIGINT || info.ssi_signo == SIGTERM) st.stop = true;
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    break;
  }
  return st;
}
