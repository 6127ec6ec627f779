#pragma once
/*
 * SearchEngine
 *
 * Purpose: incremental search over rendered rows, driven one keystroke at a time.
 * Rules: Up/Down step rows, Left/Right step matches inside the current row,
 *        any other key rescans from the top; the first hit wins and a miss
 *        leaves cursor and state untouched.
 */
#include <string>
#include "line_buffer.hpp"
#include "types.hpp"
#include "viewport.hpp"

enum class SearchKey { Char, Up, Down, Left, Right, Accept, Cancel };

struct SearchState {
  int x_index = 0;
  int y_index = 0;
  SearchDirection x_direction = SearchDirection::None;
  SearchDirection y_direction = SearchDirection::None;
  void reset() { *this = SearchState{}; }
};

class SearchEngine {
public:
  bool active() const { return active_; }
  const SearchState& state() const { return state_; }

  void begin(const Viewport& vp);
  /*returns true when the cursor moved to a new match*/
  bool keystroke(const std::string& query, SearchKey key, const LineBuffer& buf, Viewport& vp);
  void accept();
  void cancel(Viewport& vp);

private:
  bool find(const std::string& query, const LineBuffer& buf, Viewport& vp);

  bool active_ = false;
  SearchState state_;
  Cursor saved_cursor_{};
  int saved_row_offset_ = 0;
  int saved_column_offset_ = 0;
};
