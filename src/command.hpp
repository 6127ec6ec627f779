#pragma once
/*
 * Command
 *
 * Purpose: the closed set of logical commands the shell feeds the core.
 * Note: fields other than kind are only meaningful for the kinds that use them.
 */
#include <string>
#include "search_engine.hpp"
#include "types.hpp"

enum class CommandKind {
  None,
  MoveCursor,
  PageMove,
  InsertChar,
  InsertNewline,
  DeleteBackward,
  DeleteForward,
  StartSearch,
  SearchKeystroke,
  Save,
  Load,
  Quit,
};

struct Command {
  CommandKind kind = CommandKind::None;
  Direction direction = Direction::Up;
  PageDirection page = PageDirection::Up;
  char ch = 0;
  SearchKey search_key = SearchKey::Char;
  std::string text; // search query, or path for Load/Save

  static Command move(Direction d) { Command c; c.kind = CommandKind::MoveCursor; c.direction = d; return c; }
  static Command page_move(PageDirection d) { Command c; c.kind = CommandKind::PageMove; c.page = d; return c; }
  static Command insert(char ch) { Command c; c.kind = CommandKind::InsertChar; c.ch = ch; return c; }
  static Command search(std::string query, SearchKey key) {
    Command c; c.kind = CommandKind::SearchKeystroke; c.text = std::move(query); c.search_key = key; return c;
  }
  static Command of(CommandKind k) { Command c; c.kind = k; return c; }
};
