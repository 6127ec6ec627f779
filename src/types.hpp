#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Cursor/Direction/IoError).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */

enum class Direction { Up, Down, Left, Right, Home, End };
enum class PageDirection { Up, Down };

/*three states so boundary handling stays exhaustive*/
enum class SearchDirection { None, Forward, Backward };

enum class IoError { None, Io, NoFileName };

struct Cursor { int row = 0; int col = 0; };

inline bool operator==(const Cursor& a, const Cursor& b) { return a.row == b.row && a.col == b.col; }
