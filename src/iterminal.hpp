#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh, keys).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 */
#include <string>

struct TermSize { int rows; int cols; };

/*color pair used for digits*/
static constexpr int DIGIT_COLOR_PAIR = 1;

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_reversed(int row, int col, const std::string& text) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  /*next key code, or a negative value when the poll timed out*/
  virtual int read_key() = 0;
};
