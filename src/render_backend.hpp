#pragma once
/*
 * RenderBackend
 *
 * Purpose: abstract output backend turning change lists into terminal bytes.
 * Goal: decouple from concrete impls (ansi/kitty/...), enable testing.
 * Note: backends return strings; writing them is the caller's concern.
 */
#include <string>
#include <string_view>
#include <vector>
#include "types.hpp"

struct BackendCapabilities {
  bool truecolor = false;
  bool images = false;
  bool synchronized_output = false;
  bool styled_underlines = false;
};

struct BackendOptions {
  bool truecolor = true;
  bool images = true;
};

class RenderBackend {
public:
  virtual ~RenderBackend() = default;
  virtual std::string_view name() const = 0;
  virtual BackendCapabilities capabilities() const = 0;
  virtual bool detect() const = 0;
  virtual std::string init() = 0;
  virtual std::string render_buffer(const std::vector<RenderCell>& changes, int width, int height) = 0;
  virtual std::string cleanup() = 0;
};
