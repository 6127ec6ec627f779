#include "search_engine.hpp"
#include <cassert>
#include <string>
#include <vector>

static void test_row_stepping() {
  LineBuffer b;
  b.init_from_lines({"hello world", "goodbye world"});
  Viewport vp(10, 80);
  SearchEngine s;
  s.begin(vp);
  assert(s.active());

  assert(s.keystroke("world", SearchKey::Char, b, vp));
  assert(vp.cursor() == (Cursor{0, 6}));
  assert(s.state().x_index == 6 && s.state().y_index == 0);

  assert(s.keystroke("world", SearchKey::Down, b, vp));
  assert(vp.cursor() == (Cursor{1, 8}));
  assert(s.state().y_direction == SearchDirection::Forward);

  // stepping past the last row finds nothing and leaves everything alone
  assert(!s.keystroke("world", SearchKey::Down, b, vp));
  assert(vp.cursor() == (Cursor{1, 8}));
  assert(s.state().y_index == 1 && s.state().x_index == 8);

  assert(s.keystroke("world", SearchKey::Up, b, vp));
  assert(vp.cursor() == (Cursor{0, 6}));

  // row 0 backward stops immediately
  assert(!s.keystroke("world", SearchKey::Up, b, vp));
  assert(vp.cursor() == (Cursor{0, 6}));

  // the match row is forced to the top on the next scroll
  assert(vp.row_offset() == b.line_count());
  vp.scroll(b);
  assert(vp.row_offset() == 0);
}

static void test_column_stepping() {
  LineBuffer b;
  b.init_from_lines({"xx ab ab ab", "ab"});
  Viewport vp(10, 80);
  SearchEngine s;
  s.begin(vp);
  assert(s.keystroke("ab", SearchKey::Char, b, vp));
  assert(vp.cursor() == (Cursor{0, 3}));
  assert(s.keystroke("ab", SearchKey::Right, b, vp));
  assert(vp.cursor() == (Cursor{0, 6}));
  assert(s.keystroke("ab", SearchKey::Right, b, vp));
  assert(vp.cursor() == (Cursor{0, 9}));
  // no further match in this row; column stepping never leaves the row
  assert(!s.keystroke("ab", SearchKey::Right, b, vp));
  assert(vp.cursor() == (Cursor{0, 9}));
  assert(s.keystroke("ab", SearchKey::Left, b, vp));
  assert(vp.cursor() == (Cursor{0, 6}));
  assert(s.keystroke("ab", SearchKey::Left, b, vp));
  assert(vp.cursor() == (Cursor{0, 3}));
  assert(!s.keystroke("ab", SearchKey::Left, b, vp));
  assert(vp.cursor() == (Cursor{0, 3}));
}

static void test_misses_and_tabs() {
  LineBuffer b;
  b.init_from_lines({"\tneedle", "none", "x\tneedle"});
  Viewport vp(10, 80);
  SearchEngine s;
  s.begin(vp);
  // matches are found in rendered text and mapped back to logical columns
  assert(s.keystroke("needle", SearchKey::Char, b, vp));
  assert(vp.cursor() == (Cursor{0, 1}));
  assert(s.state().x_index == 8);
  assert(s.keystroke("needle", SearchKey::Down, b, vp));
  assert(vp.cursor() == (Cursor{2, 2}));
  assert(s.state().y_index == 2);

  // a query with no hit anywhere is sticky
  assert(!s.keystroke("needlex", SearchKey::Char, b, vp));
  assert(vp.cursor() == (Cursor{2, 2}));
  assert(s.state().y_index == 2 && s.state().x_index == 8);

  assert(!s.keystroke("", SearchKey::Char, b, vp));
  assert(vp.cursor() == (Cursor{2, 2}));

  LineBuffer e;
  Viewport ve(5, 5);
  SearchEngine se;
  se.begin(ve);
  assert(!se.keystroke("a", SearchKey::Char, e, ve));
  assert(!se.keystroke("a", SearchKey::Down, e, ve));
}

static void test_accept_and_cancel() {
  LineBuffer b;
  std::vector<std::string> lines(40, "filler");
  lines[30] = "target here";
  b.init_from_lines(lines);
  Viewport vp(10, 80);
  vp.set_cursor(Cursor{2, 3});
  vp.scroll(b);

  SearchEngine s;
  s.begin(vp);
  assert(s.keystroke("target", SearchKey::Char, b, vp));
  vp.scroll(b);
  assert(vp.cursor() == (Cursor{30, 0}));
  assert(vp.row_offset() == 30);
  assert(!s.keystroke("target", SearchKey::Cancel, b, vp));
  assert(!s.active());
  assert(vp.cursor() == (Cursor{2, 3}));
  assert(vp.row_offset() == 0);
  assert(s.state().y_index == 0 && s.state().x_direction == SearchDirection::None);

  s.begin(vp);
  assert(s.keystroke("target", SearchKey::Char, b, vp));
  s.keystroke("target", SearchKey::Accept, b, vp);
  assert(!s.active());
  assert(vp.cursor() == (Cursor{30, 0}));
  assert(s.state().x_index == 0 && s.state().y_index == 0);
}

int main() {
  test_row_stepping();
  test_column_stepping();
  test_misses_and_tabs();
  test_accept_and_cancel();
  return 0;
}
