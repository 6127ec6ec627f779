#pragma once
/*
 * Viewport
 *
 * Purpose: own the cursor and the visible window over a LineBuffer.
 * Invariant: after scroll(), row_offset <= cursor.row < row_offset + screen_rows
 *            and column_offset <= rendered_column < column_offset + screen_columns.
 * Note: no sticky column; vertical moves clamp the column to the target line.
 */
#include <string_view>
#include "line_buffer.hpp"
#include "types.hpp"

class Viewport {
public:
  Viewport(int screen_rows, int screen_columns);

  const Cursor& cursor() const { return cur_; }
  void set_cursor(Cursor c) { cur_ = c; }
  int row_offset() const { return row_offset_; }
  int column_offset() const { return column_offset_; }
  int rendered_column() const { return rendered_column_; }
  int screen_rows() const { return screen_rows_; }
  int screen_columns() const { return screen_columns_; }

  void resize(int screen_rows, int screen_columns);
  void move_cursor(Direction d, const LineBuffer& buf);
  void page_move(PageDirection d, const LineBuffer& buf);
  void scroll(const LineBuffer& buf);
  /*next scroll() puts the cursor row at the top of the window*/
  void invalidate_row_offset(const LineBuffer& buf) { row_offset_ = buf.line_count(); }
  void set_offsets(int row_offset, int column_offset) { row_offset_ = row_offset; column_offset_ = column_offset; }
  /*pull the cursor back inside the buffer after a structural change*/
  void clamp_cursor(const LineBuffer& buf);

  std::string_view visible_slice(const LineBuffer& buf, int file_row) const;
  /*{row, col} relative to the top-left of the text area*/
  Cursor screen_cursor() const;

private:
  Cursor cur_{};
  int row_offset_ = 0;
  int column_offset_ = 0;
  int rendered_column_ = 0;
  int screen_rows_ = 1;
  int screen_columns_ = 1;
};
