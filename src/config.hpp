#pragma once
/*
 * AppConfig
 *
 * Purpose: runtime configuration with an explicit default for every field.
 * Sources: defaults → rc file ($CELLTERM_CONFIG or ~/.celltermrc) → overrides.
 * rc syntax: one "set <name> <value>" (or "set <name>=<value>") per line.
 */
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "backend_detector.hpp"
#include "environment.hpp"

#define CELLTERM_RC_NAME ".celltermrc"
#define CELLTERM_CONFIG_ENV "CELLTERM_CONFIG"

struct AppConfig {
  BackendType preferred = BackendType::Auto;
  BackendType fallback = BackendType::Ansi;
  bool truecolor = true;
  bool images = true;
  bool mouse = true;
  bool bracketed_paste = true;
  bool focus_events = false;
  int escape_timeout_ms = 25;
  int frame_interval_ms = 33;
  std::size_t max_queue = 1000;
  std::string log_file;
  std::string log_level = "info";
};

struct ConfigOverrides {
  std::optional<BackendType> preferred;
  std::optional<BackendType> fallback;
  std::optional<bool> truecolor;
  std::optional<bool> images;
  std::optional<bool> mouse;
  std::optional<bool> bracketed_paste;
  std::optional<bool> focus_events;
  std::optional<int> escape_timeout_ms;
  std::optional<int> frame_interval_ms;
  std::optional<std::size_t> max_queue;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
};

AppConfig with_overrides(AppConfig base, const ConfigOverrides& o);
BackendPreference preference(const AppConfig& cfg);

// Applies one directive line; comments/blank lines are accepted and ignored.
bool apply_config_line(AppConfig& cfg, const std::string& line, std::string& msg);
// Problems are reported as "line N: ..." in messages; never fails hard.
bool load_config_file(const std::filesystem::path& path, AppConfig& cfg, std::vector<std::string>& messages);
std::optional<std::filesystem::path> default_config_path(const Environment& env);
AppConfig load_config(const Environment& env, std::vector<std::string>& messages);
