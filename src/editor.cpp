#include <ncurses.h>
#include "editor.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <utility>
#include "config.hpp"

Editor::Editor(ITerminal& t, const std::optional<std::filesystem::path>& file, bool read_rc)
    : term(t),
      vp(t.getSize().rows - kBarRows, t.getSize().cols),
      message(std::chrono::seconds(POUND_MESSAGE_TIMEOUT_SEC)) {
  message.set("Help: CTRL + S to Save | CTRL + F to Find | CTRL + Q to Quit.");
  register_commands();
  if (file) open(*file, true);
  if (read_rc) {
    const char* home = std::getenv("HOME");
    if (home) load_rc(std::filesystem::path(home) / POUND_RC_NAME);
  }
}

void Editor::run() {
  while (true) {
    refresh_screen();
    int ch = term.read_key();
    if (!process_key(ch)) break;
  }
}

void Editor::refresh_screen() {
  vp.scroll(buf);
  renderer.render(term, buf, vp, message.message(), render_opts);
}

void Editor::resize_from_terminal() {
  TermSize sz = term.getSize();
  vp.resize(sz.rows - kBarRows, sz.cols);
}

bool Editor::process_key(int ch) {
  if (ch < 0) return true; // poll timeout: just repaint
  if (ch == KEY_RESIZE) { resize_from_terminal(); return true; }
  return apply(input.decode(ch));
}

bool Editor::apply(const Command& cmd) {
  switch (cmd.kind) {
    case CommandKind::None: break;
    case CommandKind::MoveCursor: vp.move_cursor(cmd.direction, buf); break;
    case CommandKind::PageMove: vp.page_move(cmd.page, buf); break;
    case CommandKind::InsertChar: insert_char(cmd.ch); break;
    case CommandKind::InsertNewline: insert_newline(); break;
    case CommandKind::DeleteBackward: delete_backward(); break;
    case CommandKind::DeleteForward: delete_forward(); break;
    case CommandKind::StartSearch: find(); break;
    case CommandKind::SearchKeystroke:
      if (!searcher.active()) searcher.begin(vp);
      searcher.keystroke(cmd.text, cmd.search_key, buf, vp);
      break;
    case CommandKind::Save:
      if (!cmd.text.empty()) buf.set_file_path(cmd.text);
      save();
      break;
    case CommandKind::Load:
      open(cmd.text, false);
      break;
    case CommandKind::Quit:
      return quit();
  }
  // offsets must be valid before the next command reads them
  vp.scroll(buf);
  return true;
}

void Editor::open(const std::filesystem::path& p, bool keep_path_on_failure) {
  std::string msg;
  if (buf.load(p, msg) != IoError::None) {
    if (keep_path_on_failure) buf.set_file_path(p);
    message.set(msg);
    return;
  }
  vp.set_cursor(Cursor{});
  vp.set_offsets(0, 0);
  message.set(msg);
}

std::optional<std::string> Editor::prompt(const std::string& before, const std::string& after, const PromptCallback& cb) {
  std::string text;
  while (true) {
    message.set(before + text + after);
    refresh_screen();
    int ch = term.read_key();
    if (ch < 0) continue;
    if (ch == KEY_RESIZE) { resize_from_terminal(); continue; }
    if (Input::is_enter(ch)) {
      if (text.empty()) continue;
      message.set(std::string());
      if (cb) cb(text, ch);
      break;
    }
    if (Input::is_escape(ch)) {
      message.set(std::string());
      text.clear();
      if (cb) cb(text, ch);
      break;
    }
    if (Input::is_backspace(ch)) {
      if (!text.empty()) text.pop_back();
    } else if (Input::is_text(ch)) {
      text.push_back(static_cast<char>(ch));
    }
    if (cb) cb(text, ch);
  }
  if (text.empty()) return std::nullopt;
  return text;
}

void Editor::find() {
  searcher.begin(vp);
  prompt("Search: ", " (ESC to cancel, Arrows to find next matches, Enter to find)",
         [this](const std::string& query, int ch) {
           searcher.keystroke(query, Input::search_key(ch), buf, vp);
         });
}

void Editor::save() {
  if (!buf.file_path()) {
    auto name = prompt("Save as: ", " (ESC to cancel)", nullptr);
    if (!name) { message.set("Save aborted"); return; }
    buf.set_file_path(*name);
  }
  size_t written = 0;
  std::string msg;
  if (buf.save(written, msg) != IoError::None) {
    message.set("Can't save! " + msg);
    return;
  }
  quit_times_left_ = quit_times;
  message.set(msg);
}

bool Editor::quit() {
  if (buf.dirty() > 0 && quit_times_left_ > 0) {
    message.set("WARNING! File has unsaved changes. Press Ctrl+q " + std::to_string(quit_times_left_)
                + " more times to quit.");
    quit_times_left_--;
    return true;
  }
  return false;
}

void Editor::insert_char(char ch) {
  Cursor c = vp.cursor();
  buf.insert_char(c.row, c.col, ch);
  vp.set_cursor(Cursor{c.row, c.col + 1});
}

void Editor::insert_newline() {
  Cursor c = vp.cursor();
  if (c.col == 0) buf.insert_line(c.row, std::string());
  else buf.split_line(c.row, c.col);
  vp.set_cursor(Cursor{c.row + 1, 0});
}

void Editor::delete_backward() {
  Cursor c = vp.cursor();
  vp.set_cursor(buf.delete_char(c.row, c.col));
}

void Editor::delete_forward() {
  vp.move_cursor(Direction::Right, buf);
  delete_backward();
}
