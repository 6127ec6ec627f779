#include "renderer.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <string>

int main() {
  Renderer r;
  RenderOptions opts;

  // empty buffer: filler rows and the welcome banner a third of the way down
  {
    HeadlessTerminal term(6, 40);
    LineBuffer b;
    Viewport vp(4, 40);
    vp.scroll(b);
    r.render(term, b, vp, std::string("hi there"), opts);
    assert(term.line(0) == "~");
    assert(term.line(1) == "~     Pound editor --- Version 1.0");
    assert(term.line(2) == "~");
    assert(term.line(3) == "~");
    std::string info = "[No Name]  -- 0 lines";
    assert(term.line(4) == info + std::string(40 - info.size() - 3, ' ') + "1/0");
    assert(term.attr(4, 0) == HeadlessTerminal::Reversed);
    assert(term.attr(4, 39) == HeadlessTerminal::Reversed);
    assert(term.line(5) == "hi there");
    assert(term.cursor_row() == 0 && term.cursor_col() == 0);
    assert(term.refreshes() == 1);
  }

  // content rows, digit classification, dirty marker
  {
    HeadlessTerminal term(6, 40);
    LineBuffer b;
    b.insert_line(0, "abc 123");
    b.insert_line(1, "\tx");
    Viewport vp(4, 40);
    vp.set_cursor(Cursor{1, 1});
    vp.scroll(b);
    r.render(term, b, vp, std::nullopt, opts);
    assert(term.line(0) == "abc 123");
    assert(term.attr(0, 0) == HeadlessTerminal::Plain);
    assert(term.attr(0, 4) == HeadlessTerminal::Colored);
    assert(term.attr(0, 6) == HeadlessTerminal::Colored);
    assert(term.line(1) == "        x");
    assert(term.line(2) == "~");
    assert(term.line(4).rfind("[No Name] (modified) -- 2 lines", 0) == 0);
    assert(term.line(4).substr(term.line(4).size() - 3) == "2/2");
    assert(term.line(5).empty());
    assert(term.cursor_row() == 1 && term.cursor_col() == 8);

    RenderOptions plain;
    plain.highlight_digits = false;
    r.render(term, b, vp, std::nullopt, plain);
    assert(term.attr(0, 4) == HeadlessTerminal::Plain);
  }

  // horizontal scroll shows the slice from the column offset
  {
    HeadlessTerminal term(4, 5);
    LineBuffer b;
    b.insert_line(0, "abc 123");
    Viewport vp(2, 5);
    vp.set_cursor(Cursor{0, 7});
    vp.scroll(b);
    assert(vp.column_offset() == 3);
    r.render(term, b, vp, std::nullopt, opts);
    assert(term.line(0) == " 123");
    assert(term.cursor_row() == 0 && term.cursor_col() == 4);
  }
  return 0;
}
