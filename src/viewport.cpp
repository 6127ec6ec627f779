#include "viewport.hpp"
#include <algorithm>
#include "tab_renderer.hpp"

Viewport::Viewport(int screen_rows, int screen_columns) { resize(screen_rows, screen_columns); }

void Viewport::resize(int screen_rows, int screen_columns) {
  screen_rows_ = std::max(1, screen_rows);
  screen_columns_ = std::max(1, screen_columns);
}

void Viewport::move_cursor(Direction d, const LineBuffer& buf) {
  int rows = buf.line_count();
  switch (d) {
    case Direction::Up:
      if (cur_.row > 0) cur_.row--;
      break;
    case Direction::Down:
      if (cur_.row < rows) cur_.row++;
      break;
    case Direction::Left:
      if (cur_.col > 0) {
        cur_.col--;
      } else if (cur_.row > 0) {
        cur_.row--;
        cur_.col = buf.row_length(cur_.row);
      }
      break;
    case Direction::Right:
      if (cur_.row < rows) {
        if (cur_.col < buf.row_length(cur_.row)) {
          cur_.col++;
        } else {
          cur_.row++;
          cur_.col = 0;
        }
      }
      break;
    case Direction::Home:
      cur_.col = 0;
      break;
    case Direction::End:
      if (cur_.row < rows) cur_.col = buf.row_length(cur_.row);
      break;
  }
  cur_.col = std::min(cur_.col, buf.row_length(cur_.row));
}

void Viewport::page_move(PageDirection d, const LineBuffer& buf) {
  if (d == PageDirection::Up) cur_.row = row_offset_;
  else cur_.row = std::min(row_offset_ + screen_rows_ - 1, buf.line_count());
  clamp_cursor(buf);
}

void Viewport::clamp_cursor(const LineBuffer& buf) {
  cur_.row = std::clamp(cur_.row, 0, buf.line_count());
  cur_.col = std::clamp(cur_.col, 0, buf.row_length(cur_.row));
}

void Viewport::scroll(const LineBuffer& buf) {
  rendered_column_ = 0;
  if (cur_.row < buf.line_count()) rendered_column_ = logical_to_rendered(buf.row(cur_.row), cur_.col);

  row_offset_ = std::min(row_offset_, cur_.row);
  if (cur_.row >= row_offset_ + screen_rows_) row_offset_ = cur_.row - screen_rows_ + 1;

  column_offset_ = std::min(column_offset_, rendered_column_);
  if (rendered_column_ >= column_offset_ + screen_columns_) column_offset_ = rendered_column_ - screen_columns_ + 1;
}

std::string_view Viewport::visible_slice(const LineBuffer& buf, int file_row) const {
  if (file_row < 0 || file_row >= buf.line_count()) return {};
  std::string_view r = buf.rendered_row(file_row);
  size_t start = static_cast<size_t>(std::max(0, column_offset_));
  if (start >= r.size()) return {};
  return r.substr(start, static_cast<size_t>(screen_columns_));
}

Cursor Viewport::screen_cursor() const {
  return Cursor{cur_.row - row_offset_, rendered_column_ - column_offset_};
}
