#pragma once
/*
 * AnsiBackend
 *
 * Purpose: RenderBackend using universal escape sequences only.
 * Note: always detectable; the fallback for every terminal.
 */
#include "ansi.hpp"
#include "render_backend.hpp"

class AnsiBackend : public RenderBackend {
public:
  explicit AnsiBackend(BackendOptions opts = {}) : opts_(opts) {}
  std::string_view name() const override { return "ansi"; }
  BackendCapabilities capabilities() const override;
  bool detect() const override { return true; }
  std::string init() override;
  std::string render_buffer(const std::vector<RenderCell>& changes, int width, int height) override;
  std::string cleanup() override;
  const RenderState& state() const { return state_; }
private:
  BackendOptions opts_;
  RenderState state_;
};
