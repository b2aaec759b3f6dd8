#include "backend_detector.hpp"
#include <spdlog/spdlog.h>
#include "ansi_backend.hpp"
#include "kitty_backend.hpp"

std::optional<BackendType> parse_backend_type(std::string_view s) {
  if (s == "auto") return BackendType::Auto;
  if (s == "ansi") return BackendType::Ansi;
  if (s == "kitty") return BackendType::Kitty;
  return std::nullopt;
}

const char* backend_type_name(BackendType t) {
  switch (t) {
    case BackendType::Auto: return "auto";
    case BackendType::Ansi: return "ansi";
    case BackendType::Kitty: return "kitty";
  }
  return "auto";
}

std::unique_ptr<RenderBackend> BackendDetector::create(BackendType type, const BackendPreference& pref) const {
  BackendOptions opts{pref.truecolor, pref.images};
  if (type == BackendType::Kitty) return std::make_unique<KittyBackend>(opts, env_);
  return std::make_unique<AnsiBackend>(opts);
}

std::unique_ptr<RenderBackend> BackendDetector::detect(const BackendPreference& pref) const {
  if (pref.preferred != BackendType::Auto) {
    spdlog::debug("backend: using preferred {}", backend_type_name(pref.preferred));
    return create(pref.preferred, pref);
  }
  if (KittyBackend::detect_environment(env_)) {
    spdlog::debug("backend: kitty detected from environment");
    return create(BackendType::Kitty, pref);
  }
  BackendType fb = pref.fallback == BackendType::Auto ? BackendType::Ansi : pref.fallback;
  spdlog::debug("backend: no environment match, falling back to {}", backend_type_name(fb));
  return create(fb, pref);
}
