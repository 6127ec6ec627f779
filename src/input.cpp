#include "input.hpp"
#include <ncurses.h>

static constexpr int ctrl(char c) { return c & 0x1f; }
static constexpr int ESC = 27;
static constexpr int DEL = 127;

bool Input::is_enter(int ch) { return ch == '\n' || ch == '\r' || ch == KEY_ENTER; }
bool Input::is_escape(int ch) { return ch == ESC; }
bool Input::is_backspace(int ch) { return ch == KEY_BACKSPACE || ch == DEL || ch == ctrl('h'); }
bool Input::is_text(int ch) { return ch == '\t' || (ch >= 32 && ch <= 126); }

SearchKey Input::search_key(int ch) {
  switch (ch) {
    case KEY_UP: return SearchKey::Up;
    case KEY_DOWN: return SearchKey::Down;
    case KEY_LEFT: return SearchKey::Left;
    case KEY_RIGHT: return SearchKey::Right;
    default: break;
  }
  if (is_enter(ch)) return SearchKey::Accept;
  if (is_escape(ch)) return SearchKey::Cancel;
  return SearchKey::Char;
}

Command Input::decode(int ch) const {
  switch (ch) {
    case KEY_UP: return Command::move(Direction::Up);
    case KEY_DOWN: return Command::move(Direction::Down);
    case KEY_LEFT: return Command::move(Direction::Left);
    case KEY_RIGHT: return Command::move(Direction::Right);
    case KEY_HOME: return Command::move(Direction::Home);
    case KEY_END: return Command::move(Direction::End);
    case KEY_PPAGE: return Command::page_move(PageDirection::Up);
    case KEY_NPAGE: return Command::page_move(PageDirection::Down);
    case KEY_DC: return Command::of(CommandKind::DeleteForward);
    case ctrl('q'): return Command::of(CommandKind::Quit);
    case ctrl('s'): return Command::of(CommandKind::Save);
    case ctrl('f'):
    case ctrl('g'): return Command::of(CommandKind::StartSearch);
    default: break;
  }
  if (is_backspace(ch)) return Command::of(CommandKind::DeleteBackward);
  if (is_enter(ch)) return Command::of(CommandKind::InsertNewline);
  if (is_text(ch)) return Command::insert(static_cast<char>(ch));
  return Command{};
}
