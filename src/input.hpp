#pragma once
/*
 * Input
 *
 * Purpose: decode terminal key codes (ncurses KEY_* values) into Commands.
 * Note: modifier combinations outside the command set decode to None.
 */
#include "command.hpp"
#include "search_engine.hpp"

class Input {
public:
  Command decode(int ch) const;
  /*key meaning while a prompt is open*/
  static SearchKey search_key(int ch);
  static bool is_enter(int ch);
  static bool is_escape(int ch);
  static bool is_backspace(int ch);
  /*printable ASCII or tab*/
  static bool is_text(int ch);
};
