#include "terminal.hpp"
#include <locale.h>
#include "config.hpp"

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  // key reads time out so expired status messages get repainted
  timeout(POUND_INPUT_TIMEOUT_MS);
  set_escdelay(25);
  curs_set(1);
}

Terminal::~Terminal() {
  erase();
  ::refresh();
  endwin();
}
