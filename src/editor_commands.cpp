#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>
#include <filesystem>
#include "file_reader.hpp"

static bool parse_on_off(const std::string& v, bool& out) {
  if (v == "on" || v == "1" || v == "true") { out = true; return true; }
  if (v == "off" || v == "0" || v == "false") { out = false; return true; }
  return false;
}

static bool parse_count(const std::string& s, int& out) {
  if (s.empty() || s.size() > 6) return false;
  if (!std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) return false;
  out = std::stoi(s);
  return true;
}

void Editor::register_commands() {
  registry.register_command("set digits", [this](const std::vector<std::string>& args){
    if (args.empty()) {
      render_opts.highlight_digits = !render_opts.highlight_digits;
    } else if (!parse_on_off(args[0], render_opts.highlight_digits)) {
      message.set("set digits: use set digits on|off");
      return;
    }
    message.set(render_opts.highlight_digits ? "digits on" : "digits off");
  });
  registry.register_command("set quittimes", [this](const std::vector<std::string>& args){
    int n = 0;
    if (args.empty() || !parse_count(args[0], n)) { message.set("set quittimes: use set quittimes <count>"); return; }
    quit_times = n;
    quit_times_left_ = n;
    message.set("quittimes=" + std::to_string(n));
  });
  registry.register_command("set messagetimeout", [this](const std::vector<std::string>& args){
    int n = 0;
    if (args.empty() || !parse_count(args[0], n)) { message.set("set messagetimeout: use set messagetimeout <seconds>"); return; }
    message.set_timeout(std::chrono::seconds(n));
    message.set("messagetimeout=" + std::to_string(n));
  });
}

bool Editor::execute_rc_line(const std::string& line) {
  std::string s = line;
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  s = (j > i) ? s.substr(i, j - i) : std::string();
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());
  std::string err;
  if (!registry.dispatch(s, err)) { message.set(err); return false; }
  return true;
}

void Editor::load_rc(const std::filesystem::path& p) {
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) return;
  std::vector<std::string> lines; std::string msg;
  if (!mmap_readlines(p, lines, msg)) { message.set(msg); return; }
  for (const auto& s : lines) execute_rc_line(s);
}
