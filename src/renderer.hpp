#pragma once
/*
 * Renderer
 *
 * Purpose: paint text rows, status bar and message bar through ITerminal.
 * Constraint: stateless; expects Viewport::scroll() to have run already.
 */
#include <optional>
#include <string>
#include "iterminal.hpp"
#include "line_buffer.hpp"
#include "viewport.hpp"

struct RenderOptions {
  bool highlight_digits = true;
};

class Renderer {
public:
  void render(ITerminal& term,
              const LineBuffer& buf,
              const Viewport& vp,
              const std::optional<std::string>& message,
              const RenderOptions& opts);

private:
  void draw_rows(ITerminal& term, const LineBuffer& buf, const Viewport& vp, const RenderOptions& opts);
  void draw_status_bar(ITerminal& term, const LineBuffer& buf, const Viewport& vp, int row, int cols);
  void draw_message_bar(ITerminal& term, const std::optional<std::string>& message, int row, int cols);
};
