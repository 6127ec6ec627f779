#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main before any NcursesTerminal; destructor restores
 *        the terminal on every exit path, exceptions included.
 * Note: manages terminal modes (raw/noecho/keypad/timeout), not rendering.
 */
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
};
