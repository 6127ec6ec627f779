#include "tab_renderer.hpp"
#include <algorithm>
#include "config.hpp"

static inline int advance(int rx, char c) {
  if (c == '\t') return rx + (POUND_TAB_STOP - rx % POUND_TAB_STOP);
  return rx + 1;
}

std::string render_tabs(std::string_view content) {
  size_t tabs = static_cast<size_t>(std::count(content.begin(), content.end(), '\t'));
  std::string out;
  out.reserve(content.size() + tabs * (POUND_TAB_STOP - 1));
  for (char c : content) {
    if (c == '\t') {
      out.push_back(' ');
      while (out.size() % POUND_TAB_STOP != 0) out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

int logical_to_rendered(std::string_view content, int logical_col) {
  int n = std::clamp(logical_col, 0, static_cast<int>(content.size()));
  int rx = 0;
  for (int i = 0; i < n; ++i) rx = advance(rx, content[i]);
  return rx;
}

int rendered_to_logical(std::string_view content, int rendered_col) {
  int rx = 0;
  int n = static_cast<int>(content.size());
  for (int i = 0; i < n; ++i) {
    rx = advance(rx, content[i]);
    if (rx > rendered_col) return i;
  }
  return n;
}
