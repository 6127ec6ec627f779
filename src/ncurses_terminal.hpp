#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal over stdscr; draws rows, bars and reads keys.
 * Note: Terminal must be alive first (it owns initscr/endwin).
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_reversed(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  int read_key() override;
private:
  void put(int row, int col, const std::string& text, int attrs);
  bool colors_ = false;
};
