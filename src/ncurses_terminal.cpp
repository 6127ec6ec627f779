#include "ncurses_terminal.hpp"

NcursesTerminal::NcursesTerminal() {
  if (!has_colors()) return;
  colors_ = start_color() == OK;
  if (!colors_) return;
  short bg = (use_default_colors() == OK) ? -1 : COLOR_BLACK;
  init_pair(DIGIT_COLOR_PAIR, COLOR_CYAN, bg);
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::put(int row, int col, const std::string& text, int attrs) {
  if (attrs) attron(attrs);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (attrs) attroff(attrs);
}

void NcursesTerminal::draw_text(int row, int col, const std::string& text) { put(row, col, text, 0); }

void NcursesTerminal::draw_reversed(int row, int col, const std::string& text) {
  put(row, col, text, (int)A_REVERSE);
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  put(row, col, text, colors_ ? (int)COLOR_PAIR(color_pair_id) : 0);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

int NcursesTerminal::read_key() { return getch(); }
