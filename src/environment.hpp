#pragma once
/*
 * Environment
 *
 * Purpose: read-only lookup of environment variables.
 * Usage: ProcessEnvironment reads getenv; MapEnvironment is for tests.
 */
#include <map>
#include <optional>
#include <string>
#include <utility>

class Environment {
public:
  virtual ~Environment() = default;
  virtual std::optional<std::string> get(const std::string& name) const = 0;
};

class ProcessEnvironment : public Environment {
public:
  std::optional<std::string> get(const std::string& name) const override;
};

// Stateless reader shared by default-constructed consumers.
const Environment& process_environment();

class MapEnvironment : public Environment {
public:
  MapEnvironment() = default;
  explicit MapEnvironment(std::map<std::string, std::string> vars) : vars_(std::move(vars)) {}
  void set(const std::string& name, const std::string& value) { vars_[name] = value; }
  std::optional<std::string> get(const std::string& name) const override {
    auto it = vars_.find(name);
    if (it == vars_.end()) return std::nullopt;
    return it->second;
  }
private:
  std::map<std::string, std::string> vars_;
};
