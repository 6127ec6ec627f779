#include "renderer.hpp"
#include <algorithm>
#include <cctype>
#include <string_view>
#include "config.hpp"

static void draw_welcome(ITerminal& term, int row, int cols) {
  std::string welcome = std::string("Pound editor --- Version ") + POUND_VERSION;
  if ((int)welcome.size() > cols) welcome.resize(static_cast<size_t>(cols));
  int padding = (cols - (int)welcome.size()) / 2;
  std::string line;
  if (padding != 0) { line.push_back('~'); padding--; }
  line.append(static_cast<size_t>(padding), ' ');
  line += welcome;
  term.draw_text(row, 0, line);
}

/*digits in one color, everything else plain*/
static void draw_classified(ITerminal& term, int row, std::string_view vis) {
  size_t p = 0;
  while (p < vis.size()) {
    size_t start = p;
    bool digit = std::isdigit(static_cast<unsigned char>(vis[p])) != 0;
    while (p < vis.size() && (std::isdigit(static_cast<unsigned char>(vis[p])) != 0) == digit) p++;
    std::string run(vis.substr(start, p - start));
    if (digit) term.draw_colored(row, (int)start, run, DIGIT_COLOR_PAIR);
    else term.draw_text(row, (int)start, run);
  }
}

void Renderer::render(ITerminal& term,
                      const LineBuffer& buf,
                      const Viewport& vp,
                      const std::optional<std::string>& message,
                      const RenderOptions& opts) {
  TermSize sz = term.getSize();
  term.clear();
  draw_rows(term, buf, vp, opts);
  draw_status_bar(term, buf, vp, vp.screen_rows(), sz.cols);
  draw_message_bar(term, message, vp.screen_rows() + 1, sz.cols);
  Cursor sc = vp.screen_cursor();
  term.move_cursor(sc.row, std::min(sc.col, std::max(0, sz.cols - 1)));
  term.refresh();
}

void Renderer::draw_rows(ITerminal& term, const LineBuffer& buf, const Viewport& vp, const RenderOptions& opts) {
  int rows = vp.screen_rows();
  int cols = vp.screen_columns();
  for (int i = 0; i < rows; ++i) {
    int file_row = i + vp.row_offset();
    if (file_row >= buf.line_count()) {
      if (buf.line_count() == 0 && i == rows / 3) draw_welcome(term, i, cols);
      else term.draw_text(i, 0, "~");
    } else {
      std::string_view vis = vp.visible_slice(buf, file_row);
      if (opts.highlight_digits) draw_classified(term, i, vis);
      else term.draw_text(i, 0, std::string(vis));
      term.clear_to_eol(i, (int)vis.size());
    }
  }
}

void Renderer::draw_status_bar(ITerminal& term, const LineBuffer& buf, const Viewport& vp, int row, int cols) {
  std::string info = buf.file_name() + " " + (buf.dirty() > 0 ? "(modified)" : "")
                   + " -- " + std::to_string(buf.line_count()) + " lines";
  std::string line_info = std::to_string(vp.cursor().row + 1) + "/" + std::to_string(buf.line_count());
  if ((int)info.size() > cols) info.resize(static_cast<size_t>(std::max(0, cols)));
  std::string bar = info;
  int gap = cols - (int)info.size() - (int)line_info.size();
  if (gap >= 0) {
    bar.append(static_cast<size_t>(gap), ' ');
    bar += line_info;
  } else {
    bar.append(static_cast<size_t>(cols - (int)info.size()), ' ');
  }
  term.draw_reversed(row, 0, bar);
}

void Renderer::draw_message_bar(ITerminal& term, const std::optional<std::string>& message, int row, int cols) {
  term.clear_to_eol(row, 0);
  if (!message) return;
  term.draw_text(row, 0, message->substr(0, static_cast<size_t>(std::max(0, cols))));
}
