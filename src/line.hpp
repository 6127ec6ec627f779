#pragma once
/*
 * Line
 *
 * Purpose: one logical row plus its rendered (tab-expanded) form.
 * Invariant: every write to content re-renders before returning, so
 *            rendered() can never be stale.
 */
#include <string>
#include <string_view>

class Line {
public:
  Line() = default;
  explicit Line(std::string content);

  const std::string& content() const { return content_; }
  const std::string& rendered() const { return rendered_; }
  int size() const { return static_cast<int>(content_.size()); }

  void assign(std::string content);
  void insert_char(int at, char ch);
  void erase_char(int at);
  void append(std::string_view tail);
  /*cuts the line at `at` and returns what followed*/
  std::string truncate(int at);

private:
  void rerender();
  std::string content_;
  std::string rendered_;
};
