#include "viewport.hpp"
#include "tab_renderer.hpp"
#include <cassert>
#include <string>
#include <vector>

static void check_visible(const Viewport& vp) {
  const Cursor& c = vp.cursor();
  assert(vp.row_offset() <= c.row && c.row < vp.row_offset() + vp.screen_rows());
  assert(vp.column_offset() <= vp.rendered_column());
  assert(vp.rendered_column() < vp.column_offset() + vp.screen_columns());
}

static void test_moves() {
  LineBuffer b;
  b.init_from_lines({"hello", "hi", "world!"});
  Viewport vp(10, 40);

  vp.move_cursor(Direction::Left, b);
  assert(vp.cursor() == (Cursor{0, 0}));
  vp.move_cursor(Direction::Up, b);
  assert(vp.cursor() == (Cursor{0, 0}));

  vp.move_cursor(Direction::End, b);
  assert(vp.cursor() == (Cursor{0, 5}));
  // right at end of line wraps to the next line
  vp.move_cursor(Direction::Right, b);
  assert(vp.cursor() == (Cursor{1, 0}));
  // left at column 0 wraps to the end of the previous line
  vp.move_cursor(Direction::Left, b);
  assert(vp.cursor() == (Cursor{0, 5}));

  // moving onto a shorter line snaps the column, and it is not remembered
  vp.move_cursor(Direction::Down, b);
  assert(vp.cursor() == (Cursor{1, 2}));
  vp.move_cursor(Direction::Down, b);
  assert(vp.cursor() == (Cursor{2, 2}));

  // down reaches the virtual row and stops there
  vp.move_cursor(Direction::Down, b);
  assert(vp.cursor() == (Cursor{3, 0}));
  vp.move_cursor(Direction::Down, b);
  assert(vp.cursor() == (Cursor{3, 0}));
  vp.move_cursor(Direction::Right, b);
  assert(vp.cursor() == (Cursor{3, 0}));
  vp.move_cursor(Direction::End, b);
  assert(vp.cursor() == (Cursor{3, 0}));

  vp.move_cursor(Direction::Left, b);
  assert(vp.cursor() == (Cursor{2, 6}));
  vp.move_cursor(Direction::Home, b);
  assert(vp.cursor() == (Cursor{2, 0}));
}

static void test_scroll_invariant() {
  LineBuffer b;
  std::vector<std::string> lines;
  for (int i = 0; i < 60; ++i) {
    std::string s;
    for (int k = 0; k < i * 3; ++k) s.push_back(k % 7 == 0 ? '\t' : 'x');
    lines.push_back(s);
  }
  b.init_from_lines(lines);
  unsigned seed = 12345;
  auto next = [&](int mod) { seed = seed * 1103515245u + 12345u; return (int)((seed >> 16) % (unsigned)mod); };
  for (int iter = 0; iter < 2000; ++iter) {
    Viewport vp(1 + next(30), 1 + next(50));
    vp.set_offsets(next(80), next(200));
    int row = next(b.line_count() + 1);
    int col = next(b.row_length(row) + 1);
    vp.set_cursor(Cursor{row, col});
    vp.scroll(b);
    check_visible(vp);
    if (row < b.line_count()) assert(vp.rendered_column() == logical_to_rendered(b.row(row), col));
  }

  // minimal adjustment: no scroll when already visible
  Viewport vp(10, 20);
  vp.set_offsets(5, 0);
  vp.set_cursor(Cursor{8, 0});
  vp.scroll(b);
  assert(vp.row_offset() == 5);
  vp.set_cursor(Cursor{20, 0});
  vp.scroll(b);
  assert(vp.row_offset() == 11);
  vp.set_cursor(Cursor{3, 0});
  vp.scroll(b);
  assert(vp.row_offset() == 3);
}

static void test_page_and_slices() {
  LineBuffer b;
  std::vector<std::string> lines;
  for (int i = 0; i < 30; ++i) lines.push_back("line " + std::to_string(i));
  b.init_from_lines(lines);
  Viewport vp(10, 80);
  vp.set_cursor(Cursor{4, 6});
  vp.page_move(PageDirection::Down, b);
  assert(vp.cursor().row == 9);
  vp.scroll(b);
  assert(vp.row_offset() == 0);
  vp.set_cursor(Cursor{25, 0});
  vp.scroll(b);
  assert(vp.row_offset() == 16);
  vp.page_move(PageDirection::Up, b);
  assert(vp.cursor().row == 16);
  vp.set_offsets(25, 0);
  vp.page_move(PageDirection::Down, b);
  assert(vp.cursor().row == 30);
  assert(vp.cursor().col == 0);

  // column clamped to the landing line
  LineBuffer s;
  s.init_from_lines({"a", "a much longer line"});
  Viewport v2(1, 80);
  v2.set_cursor(Cursor{1, 10});
  v2.set_offsets(0, 0);
  v2.page_move(PageDirection::Up, s);
  assert(v2.cursor() == (Cursor{0, 1}));

  LineBuffer t;
  t.init_from_lines({"\tabc", "xy"});
  Viewport v3(5, 4);
  v3.set_cursor(Cursor{0, 2});
  v3.scroll(t);
  assert(v3.rendered_column() == 9);
  assert(v3.column_offset() == 6);
  assert(v3.visible_slice(t, 0) == "  ab");
  assert(v3.visible_slice(t, 1).empty());
  assert(v3.visible_slice(t, 7).empty());
  Cursor sc = v3.screen_cursor();
  assert(sc.row == 0 && sc.col == 3);

  v3.resize(0, -3);
  assert(v3.screen_rows() == 1 && v3.screen_columns() == 1);
}

int main() {
  test_moves();
  test_scroll_invariant();
  test_page_and_slices();
  return 0;
}
