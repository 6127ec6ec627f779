#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch rc commands ("set <option> <value>").
 * Design: map name → handler (args vector); "set x" is registered as one name.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <sstream>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<void(const std::vector<std::string>&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool execute(const std::string& name, const std::vector<std::string>& args) const {
    auto it = map_.find(name);
    if (it == map_.end()) return false;
    it->second(args);
    return true;
  }
  /*splits one line; returns false with the unknown name in msg*/
  bool dispatch(const std::string& line, std::string& msg) const {
    std::istringstream iss(line);
    std::string cmd; iss >> cmd;
    std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
    if (cmd == "set" && !args.empty()) {
      std::string name = args[0];
      std::vector<std::string> sub;
      size_t eq = name.find('=');
      if (eq != std::string::npos) {
        if (eq + 1 < name.size()) sub.push_back(name.substr(eq + 1));
        name = name.substr(0, eq);
      }
      sub.insert(sub.end(), args.begin() + 1, args.end());
      cmd = "set " + name;
      args = std::move(sub);
    }
    if (!execute(cmd, args)) { msg = "unknown command: " + cmd; return false; }
    return true;
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
