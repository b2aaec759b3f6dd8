#pragma once
/*
 * BackendDetector
 *
 * Purpose: choose a RenderBackend from an explicit preference or from
 *          environment signals, falling back to a named backend.
 * Constraint: pure selection; only environment variables are consulted.
 *             The Environment must outlive the detector.
 */
#include <memory>
#include <optional>
#include <string_view>
#include "environment.hpp"
#include "render_backend.hpp"

enum class BackendType { Auto, Ansi, Kitty };

std::optional<BackendType> parse_backend_type(std::string_view s);
const char* backend_type_name(BackendType t);

struct BackendPreference {
  BackendType preferred = BackendType::Auto;
  BackendType fallback = BackendType::Ansi;
  bool truecolor = true;
  bool images = true;
};

class BackendDetector {
public:
  BackendDetector() : env_(process_environment()) {}
  explicit BackendDetector(const Environment& env) : env_(env) {}
  explicit BackendDetector(const Environment&&) = delete;
  std::unique_ptr<RenderBackend> detect(const BackendPreference& pref = {}) const;
  std::unique_ptr<RenderBackend> create(BackendType type, const BackendPreference& pref) const;
private:
  const Environment& env_;
};
