#include "search_engine.hpp"
#include <algorithm>
#include <string_view>
#include "tab_renderer.hpp"

void SearchEngine::begin(const Viewport& vp) {
  active_ = true;
  state_.reset();
  saved_cursor_ = vp.cursor();
  saved_row_offset_ = vp.row_offset();
  saved_column_offset_ = vp.column_offset();
}

void SearchEngine::accept() {
  active_ = false;
  state_.reset();
}

void SearchEngine::cancel(Viewport& vp) {
  if (active_) {
    vp.set_cursor(saved_cursor_);
    vp.set_offsets(saved_row_offset_, saved_column_offset_);
  }
  active_ = false;
  state_.reset();
}

bool SearchEngine::keystroke(const std::string& query, SearchKey key, const LineBuffer& buf, Viewport& vp) {
  if (key == SearchKey::Accept) { accept(); return false; }
  if (key == SearchKey::Cancel) { cancel(vp); return false; }
  state_.x_direction = SearchDirection::None;
  state_.y_direction = SearchDirection::None;
  switch (key) {
    case SearchKey::Down: state_.y_direction = SearchDirection::Forward; break;
    case SearchKey::Up: state_.y_direction = SearchDirection::Backward; break;
    case SearchKey::Right: state_.x_direction = SearchDirection::Forward; break;
    case SearchKey::Left: state_.x_direction = SearchDirection::Backward; break;
    default: break;
  }
  return find(query, buf, vp);
}

bool SearchEngine::find(const std::string& query, const LineBuffer& buf, Viewport& vp) {
  if (query.empty()) return false;
  int rows = buf.line_count();
  for (int i = 0; i < rows; ++i) {
    int row = 0;
    switch (state_.y_direction) {
      case SearchDirection::None:
        // column stepping stays on the current match row
        row = (state_.x_direction == SearchDirection::None) ? i : state_.y_index;
        break;
      case SearchDirection::Forward:
        row = state_.y_index + i + 1;
        break;
      case SearchDirection::Backward:
        row = state_.y_index - i - 1;
        break;
    }
    if (row < 0 || row >= rows) break;

    std::string_view text = buf.rendered_row(row);
    size_t pos = std::string_view::npos;
    switch (state_.x_direction) {
      case SearchDirection::None:
        pos = text.find(query);
        break;
      case SearchDirection::Forward: {
        size_t start = std::min(text.size(), static_cast<size_t>(state_.x_index) + 1);
        pos = text.find(query, start);
        break;
      }
      case SearchDirection::Backward: {
        size_t end = std::min(text.size(), static_cast<size_t>(state_.x_index));
        pos = text.substr(0, end).rfind(query);
        break;
      }
    }
    if (pos == std::string_view::npos) {
      if (state_.x_direction != SearchDirection::None) break;
      continue;
    }
    state_.y_index = row;
    state_.x_index = static_cast<int>(pos);
    vp.set_cursor(Cursor{row, rendered_to_logical(buf.row(row), static_cast<int>(pos))});
    vp.invalidate_row_offset(buf);
    return true;
  }
  return false;
}
