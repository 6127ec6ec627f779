#include "line.hpp"
#include <cassert>
#include <utility>
#include "tab_renderer.hpp"

Line::Line(std::string content) : content_(std::move(content)) { rerender(); }

void Line::assign(std::string content) {
  content_ = std::move(content);
  rerender();
}

void Line::insert_char(int at, char ch) {
  assert(at >= 0 && at <= size());
  content_.insert(content_.begin() + at, ch);
  rerender();
}

void Line::erase_char(int at) {
  assert(at >= 0 && at < size());
  content_.erase(content_.begin() + at);
  rerender();
}

void Line::append(std::string_view tail) {
  content_.append(tail);
  rerender();
}

std::string Line::truncate(int at) {
  assert(at >= 0 && at <= size());
  std::string rest = content_.substr(static_cast<size_t>(at));
  content_.resize(static_cast<size_t>(at));
  rerender();
  return rest;
}

void Line::rerender() { rendered_ = render_tabs(content_); }
