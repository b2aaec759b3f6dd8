#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <system_error>
#include "cmd_registry.hpp"
#include "file_reader.hpp"

AppConfig with_overrides(AppConfig base, const ConfigOverrides& o) {
  if (o.preferred) base.preferred = *o.preferred;
  if (o.fallback) base.fallback = *o.fallback;
  if (o.truecolor) base.truecolor = *o.truecolor;
  if (o.images) base.images = *o.images;
  if (o.mouse) base.mouse = *o.mouse;
  if (o.bracketed_paste) base.bracketed_paste = *o.bracketed_paste;
  if (o.focus_events) base.focus_events = *o.focus_events;
  if (o.escape_timeout_ms) base.escape_timeout_ms = *o.escape_timeout_ms;
  if (o.frame_interval_ms) base.frame_interval_ms = *o.frame_interval_ms;
  if (o.max_queue) base.max_queue = *o.max_queue;
  if (o.log_file) base.log_file = *o.log_file;
  if (o.log_level) base.log_level = *o.log_level;
  return base;
}

BackendPreference preference(const AppConfig& cfg) {
  return BackendPreference{cfg.preferred, cfg.fallback, cfg.truecolor, cfg.images};
}

static bool is_number(const std::string& s) {
  return !s.empty() && s.size() < 10 &&
         std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
}

static void add_switch(CommandRegistry& reg, const std::string& name, bool& target) {
  reg.register_command("set " + name, [name, &target](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { target = !target; return true; }
    if (args[0] == "on") { target = true; return true; }
    if (args[0] == "off") { target = false; return true; }
    msg = "set " + name + ": use set " + name + " on|off";
    return false;
  });
}

static void add_number(CommandRegistry& reg, const std::string& name, int min, int& target) {
  reg.register_command("set " + name, [name, min, &target](const std::vector<std::string>& args, std::string& msg){
    if (args.empty() || !is_number(args[0])) { msg = "set " + name + ": value must be a number"; return false; }
    int v = std::stoi(args[0]);
    if (v < min) { msg = "set " + name + ": value must be >= " + std::to_string(min); return false; }
    target = v;
    return true;
  });
}

static void add_backend(CommandRegistry& reg, const std::string& name, bool allow_auto, BackendType& target) {
  reg.register_command("set " + name, [name, allow_auto, &target](const std::vector<std::string>& args, std::string& msg){
    std::optional<BackendType> t;
    if (!args.empty()) t = parse_backend_type(args[0]);
    if (!t || (!allow_auto && *t == BackendType::Auto)) {
      msg = allow_auto ? "set " + name + ": use auto|ansi|kitty" : "set " + name + ": use ansi|kitty";
      return false;
    }
    target = *t;
    return true;
  });
}

static CommandRegistry make_registry(AppConfig& cfg) {
  CommandRegistry reg;
  add_backend(reg, "backend", true, cfg.preferred);
  add_backend(reg, "fallback", false, cfg.fallback);
  add_switch(reg, "truecolor", cfg.truecolor);
  add_switch(reg, "images", cfg.images);
  add_switch(reg, "mouse", cfg.mouse);
  add_switch(reg, "paste", cfg.bracketed_paste);
  add_switch(reg, "focus", cfg.focus_events);
  add_number(reg, "escapetimeout", 0, cfg.escape_timeout_ms);
  add_number(reg, "frameinterval", 1, cfg.frame_interval_ms);
  reg.register_command("set maxqueue", [&cfg](const std::vector<std::string>& args, std::string& msg){
    if (args.empty() || !is_number(args[0])) { msg = "set maxqueue: value must be a number"; return false; }
    cfg.max_queue = static_cast<std::size_t>(std::stoul(args[0]));
    return true;
  });
  reg.register_command("set logfile", [&cfg](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set logfile: use set logfile <path>"; return false; }
    cfg.log_file = args[0];
    return true;
  });
  reg.register_command("set loglevel", [&cfg](const std::vector<std::string>& args, std::string& msg){
    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "off"};
    if (!args.empty() && std::find(std::begin(levels), std::end(levels), args[0]) != std::end(levels)) {
      cfg.log_level = args[0];
      return true;
    }
    msg = "set loglevel: use trace|debug|info|warn|error|off";
    return false;
  });
  return reg;
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

static bool execute_line(const CommandRegistry& reg, const std::string& raw, std::string& msg) {
  std::string s = trim(raw);
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());
  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    std::string name = args[0];
    std::string value;
    size_t eq = name.find('=');
    if (eq != std::string::npos) { value = name.substr(eq + 1); name = name.substr(0, eq); }
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    return reg.execute("set " + name, subargs, msg) == CommandRegistry::Result::Ok;
  }
  return reg.execute(cmd, args, msg) == CommandRegistry::Result::Ok;
}

bool apply_config_line(AppConfig& cfg, const std::string& line, std::string& msg) {
  CommandRegistry reg = make_registry(cfg);
  return execute_line(reg, line, msg);
}

bool load_config_file(const std::filesystem::path& path, AppConfig& cfg, std::vector<std::string>& messages) {
  std::vector<std::string> lines; std::string msg;
  if (!mmap_readlines(path, lines, msg)) { messages.push_back(msg); return false; }
  CommandRegistry reg = make_registry(cfg);
  bool ok = true;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string m;
    if (!execute_line(reg, lines[i], m)) {
      messages.push_back("line " + std::to_string(i + 1) + ": " + m);
      ok = false;
    }
  }
  return ok;
}

std::optional<std::filesystem::path> default_config_path(const Environment& env) {
  if (auto p = env.get(CELLTERM_CONFIG_ENV); p && !p->empty()) return std::filesystem::path(*p);
  auto home = env.get("HOME");
  if (!home || home->empty()) return std::nullopt;
  return std::filesystem::path(*home) / CELLTERM_RC_NAME;
}

AppConfig load_config(const Environment& env, std::vector<std::string>& messages) {
  AppConfig cfg;
  auto path = default_config_path(env);
  if (!path) return cfg;
  std::error_code ec;
  if (!std::filesystem::exists(*path, ec)) return cfg;
  load_config_file(*path, cfg, messages);
  return cfg;
}
