#pragma once
/*
 * KittyBackend
 *
 * Purpose: RenderBackend for kitty/wezterm: ANSI cell output wrapped in
 *          synchronized-output updates, plus graphics protocol images.
 * Detection: TERM_PROGRAM kitty|wezterm, TERM contains wezterm, or
 *            KITTY_WINDOW_ID set. Evaluated once, at construction.
 */
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "ansi.hpp"
#include "environment.hpp"
#include "render_backend.hpp"

enum class ImageFormat { Png, Rgb, Rgba };

struct KittyImageOptions {
  std::optional<int> width;        // cells
  std::optional<int> height;       // cells
  ImageFormat format = ImageFormat::Png;
  std::optional<std::uint32_t> image_id;
  std::optional<int> pixel_width;  // source size, raw formats only
  std::optional<int> pixel_height;
};

constexpr std::size_t kKittyMaxChunk = 4096;

int kitty_format_code(ImageFormat f);
std::string encode_kitty_image(std::string_view base64_data, const KittyImageOptions& opts = {});
std::string delete_kitty_images();
std::string base64_encode(std::string_view bytes);

class KittyBackend : public RenderBackend {
public:
  explicit KittyBackend(BackendOptions opts = {});
  KittyBackend(BackendOptions opts, const Environment& env);

  static bool detect_environment(const Environment& env);

  std::string_view name() const override { return "kitty"; }
  BackendCapabilities capabilities() const override;
  bool detect() const override;
  std::string init() override;
  std::string render_buffer(const std::vector<RenderCell>& changes, int width, int height) override;
  std::string cleanup() override;
  const RenderState& state() const { return state_; }
private:
  BackendOptions opts_;
  bool detected_;
  RenderState state_;
};
