#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: ITerminal that records drawn cells in memory and replays scripted
 *          keys, for automated tests of rendering and prompt flows.
 * Note: reads past the end of the script return the exhausted key, Escape by
 *       default, so prompts terminate. Escape is a no-op in the editor loop;
 *       tests that call Editor::run() set it to Ctrl-Q so the loop exits.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  enum Attr : char { Plain = ' ', Reversed = 'r', Colored = 'c' };

  HeadlessTerminal(int rows, int cols);

  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_reversed(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void refresh() override { refreshes_++; }
  void clear_to_eol(int row, int col) override;
  int read_key() override;

  void resize(int rows, int cols);
  void push_key(int ch) { keys_.push_back(ch); }
  void push_keys(const std::string& s) { for (unsigned char c : s) keys_.push_back(c); }
  size_t pending_keys() const { return keys_.size(); }
  void set_exhausted_key(int ch) { exhausted_key_ = ch; }

  /*row text with trailing blanks removed*/
  std::string line(int row) const;
  char attr(int row, int col) const;
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int refreshes() const { return refreshes_; }

private:
  void put(int row, int col, const std::string& text, Attr a);
  int rows_;
  int cols_;
  std::vector<std::string> cells_;
  std::vector<std::string> attrs_;
  std::deque<int> keys_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int refreshes_ = 0;
  int exhausted_key_ = 27;
};
