#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) { resize(rows, cols); }

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  cells_.assign(static_cast<size_t>(rows_), std::string(static_cast<size_t>(cols_), ' '));
  attrs_.assign(static_cast<size_t>(rows_), std::string(static_cast<size_t>(cols_), Plain));
}

void HeadlessTerminal::clear() { resize(rows_, cols_); }

void HeadlessTerminal::put(int row, int col, const std::string& text, Attr a) {
  if (row < 0 || row >= rows_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    cells_[row][c] = text[i];
    attrs_[row][c] = a;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) { put(row, col, text, Plain); }
void HeadlessTerminal::draw_reversed(int row, int col, const std::string& text) { put(row, col, text, Reversed); }
void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int) { put(row, col, text, Colored); }

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  for (int c = std::max(0, col); c < cols_; ++c) {
    cells_[row][c] = ' ';
    attrs_[row][c] = Plain;
  }
}

int HeadlessTerminal::read_key() {
  if (keys_.empty()) return exhausted_key_;
  int ch = keys_.front();
  keys_.pop_front();
  return ch;
}

std::string HeadlessTerminal::line(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  const std::string& s = cells_[row];
  size_t end = s.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

char HeadlessTerminal::attr(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return Plain;
  return attrs_[row][col];
}
