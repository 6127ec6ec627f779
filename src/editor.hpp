#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "cmd_registry.hpp"
#include "config.hpp"
#include "command.hpp"
#include "input.hpp"
#include "iterminal.hpp"
#include "line_buffer.hpp"
#include "renderer.hpp"
#include "search_engine.hpp"
#include "status_message.hpp"
#include "viewport.hpp"

/*
 * Editor
 *
 * Purpose: the control loop; decodes keys, applies commands to the core and
 *          repaints. Prompts (search, save-as) run their own key loop.
 * Note: rows are reserved at the bottom for the status and message bars.
 */
class Editor {
public:
  static constexpr int kBarRows = 2;

  Editor(ITerminal& term, const std::optional<std::filesystem::path>& file, bool read_rc = true);
  void run();
  /*false once the editor should exit*/
  bool process_key(int ch);
  bool apply(const Command& cmd);
  void refresh_screen();

  void load_rc(const std::filesystem::path& p);
  bool execute_rc_line(const std::string& line);

  const LineBuffer& buffer() const { return buf; }
  const Viewport& viewport() const { return vp; }
  const SearchEngine& search() const { return searcher; }
  StatusMessage& status() { return message; }
  const RenderOptions& render_options() const { return render_opts; }
  int quit_times_left() const { return quit_times_left_; }

private:
  using PromptCallback = std::function<void(const std::string&, int)>;
  std::optional<std::string> prompt(const std::string& before, const std::string& after, const PromptCallback& cb);

  void register_commands();
  void resize_from_terminal();
  void open(const std::filesystem::path& p, bool keep_path_on_failure);
  void find();
  void save();
  bool quit();
  void insert_char(char ch);
  void insert_newline();
  void delete_backward();
  void delete_forward();

  ITerminal& term;
  LineBuffer buf;
  Viewport vp;
  SearchEngine searcher;
  StatusMessage message;
  Renderer renderer;
  RenderOptions render_opts;
  Input input;
  CommandRegistry registry;
  int quit_times = POUND_QUIT_TIMES;
  int quit_times_left_ = POUND_QUIT_TIMES;
};
