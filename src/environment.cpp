#include "environment.hpp"
#include <cstdlib>

std::optional<std::string> ProcessEnvironment::get(const std::string& name) const {
  const char* v = std::getenv(name.c_str());
  if (!v) return std::nullopt;
  return std::string(v);
}

const Environment& process_environment() {
  static const ProcessEnvironment env;
  return env;
}
