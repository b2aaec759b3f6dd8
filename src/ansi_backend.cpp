#include "ansi_backend.hpp"

BackendCapabilities AnsiBackend::capabilities() const {
  BackendCapabilities caps;
  caps.truecolor = opts_.truecolor;
  return caps;
}

std::string AnsiBackend::init() {
  state_.reset();
  return std::string(ansi::kAltScreenOn) + ansi::kCursorHide;
}

std::string AnsiBackend::render_buffer(const std::vector<RenderCell>& changes, int width, int height) {
  return ansi::render_changes(changes, width, height, state_, opts_.truecolor);
}

std::string AnsiBackend::cleanup() {
  state_.reset();
  return std::string(ansi::kReset) + ansi::kCursorShow + ansi::kAltScreenOff;
}
