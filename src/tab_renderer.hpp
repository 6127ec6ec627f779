#pragma once
/*
 * TabRenderer
 *
 * Purpose: expand tabs to POUND_TAB_STOP column stops and translate between
 *          logical columns (characters) and rendered columns (screen cells).
 * Note: pure functions, no state.
 */
#include <string>
#include <string_view>

std::string render_tabs(std::string_view content);
int logical_to_rendered(std::string_view content, int logical_col);
/*a rendered column inside a tab's expansion resolves to the tab itself;
  past the rendered width the logical length is returned*/
int rendered_to_logical(std::string_view content, int rendered_col);
