#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch config directives ("set mouse", ...).
 * Design: map name → handler (args vector); handlers report problems via msg.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>

class CommandRegistry {
public:
  enum class Result { Ok, Failed, Unknown };
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool contains(const std::string& name) const { return map_.count(name) != 0; }
  Result execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown command: " + name; return Result::Unknown; }
    return it->second(args, msg) ? Result::Ok : Result::Failed;
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
