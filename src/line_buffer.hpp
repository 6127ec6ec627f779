#pragma once
/*
 * LineBuffer
 *
 * Purpose: ordered logical lines with cached renders, edit ops and file I/O.
 * Feature: safe writes (write .tmp → fdatasync → atomic rename).
 * Note: an empty buffer has zero lines; row == line_count() is the virtual
 *       row past the last line where typing appends a new one.
 */
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "line.hpp"
#include "types.hpp"

class LineBuffer {
public:
  LineBuffer() = default;

  int line_count() const { return static_cast<int>(lines_.size()); }
  bool empty() const { return lines_.empty(); }
  const Line& line(int r) const;
  const std::string& row(int r) const { return line(r).content(); }
  const std::string& rendered_row(int r) const { return line(r).rendered(); }
  /*length of row r, 0 for the virtual row*/
  int row_length(int r) const;

  unsigned long dirty() const { return dirty_; }
  const std::optional<std::filesystem::path>& file_path() const { return file_path_; }
  void set_file_path(const std::filesystem::path& p) { file_path_ = p; }
  std::string file_name() const;

  void init_from_lines(std::vector<std::string> lines);

  void insert_line(int index, std::string content);
  void insert_char(int row, int col, char ch);
  void split_line(int row, int col);
  /*returns where the cursor belongs afterwards: one left, or the join point*/
  Cursor delete_char(int row, int col);

  IoError load(const std::filesystem::path& path, std::string& msg);
  IoError save(size_t& written, std::string& msg);
  IoError write_file(const std::filesystem::path& path, size_t& written, std::string& msg) const;

private:
  std::vector<Line> lines_;
  std::optional<std::filesystem::path> file_path_;
  unsigned long dirty_ = 0;
};
