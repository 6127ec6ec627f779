#include "line_buffer.hpp"
#include <cassert>
#include <cstring>
#include <utility>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "config.hpp"
#include "file_reader.hpp"
#include "posix_fd.hpp"

const Line& LineBuffer::line(int r) const {
  assert(r >= 0 && r < line_count());
  return lines_[static_cast<size_t>(r)];
}

int LineBuffer::row_length(int r) const {
  if (r >= line_count()) return 0;
  return line(r).size();
}

std::string LineBuffer::file_name() const {
  if (!file_path_ || file_path_->filename().empty()) return "[No Name]";
  return file_path_->filename().string();
}

void LineBuffer::init_from_lines(std::vector<std::string> lines) {
  lines_.clear();
  lines_.reserve(lines.size());
  for (auto& s : lines) lines_.emplace_back(std::move(s));
  dirty_ = 0;
}

void LineBuffer::insert_line(int index, std::string content) {
  assert(index >= 0 && index <= line_count());
  lines_.insert(lines_.begin() + index, Line(std::move(content)));
  dirty_++;
}

void LineBuffer::insert_char(int row, int col, char ch) {
  assert(row >= 0 && row <= line_count());
  if (row == line_count()) insert_line(row, std::string());
  lines_[static_cast<size_t>(row)].insert_char(col, ch);
  dirty_++;
}

void LineBuffer::split_line(int row, int col) {
  assert(row >= 0 && row < line_count());
  std::string rest = lines_[static_cast<size_t>(row)].truncate(col);
  lines_.insert(lines_.begin() + row + 1, Line(std::move(rest)));
  dirty_++;
}

Cursor LineBuffer::delete_char(int row, int col) {
  assert(row >= 0 && row <= line_count());
  if (row == line_count()) return Cursor{row, col};
  if (col > 0) {
    lines_[static_cast<size_t>(row)].erase_char(col - 1);
    dirty_++;
    return Cursor{row, col - 1};
  }
  if (row == 0) return Cursor{0, 0};
  Line& prev = lines_[static_cast<size_t>(row - 1)];
  int join_col = prev.size();
  prev.append(lines_[static_cast<size_t>(row)].content());
  lines_.erase(lines_.begin() + row);
  dirty_++;
  return Cursor{row - 1, join_col};
}

IoError LineBuffer::load(const std::filesystem::path& path, std::string& msg) {
  std::vector<std::string> ls;
  if (!mmap_readlines(path, ls, msg)) return IoError::Io;
  init_from_lines(std::move(ls));
  file_path_ = path;
  return IoError::None;
}

IoError LineBuffer::save(size_t& written, std::string& msg) {
  if (!file_path_) {
    msg = "no file name specified";
    return IoError::NoFileName;
  }
  IoError err = write_file(*file_path_, written, msg);
  if (err == IoError::None) dirty_ = 0;
  return err;
}

IoError LineBuffer::write_file(const std::filesystem::path& path, size_t& written, std::string& msg) const {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  mode_t mode = 0644;
  struct stat st{};
  if (::stat(path.string().c_str(), &st) == 0) mode = st.st_mode & 07777;
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode));
  auto fail = [&](const std::filesystem::path& p) {
    msg = std::string("write file failed: ") + p.string();
    return IoError::Io;
  };
  if (!ufd.valid()) return fail(tmp);
  auto discard = [&]() {
    ufd.reset();
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    return fail(tmp);
  };
  std::vector<char> buf(static_cast<size_t>(POUND_WRITE_CHUNK_SIZE));
  size_t used = 0;
  size_t total = 0;
  int n = line_count();
  for (int i = 0; i < n; ++i) {
    const std::string& s = row(i);
    bool need_nl = (i + 1 < n);
    size_t need = s.size() + (need_nl ? 1u : 0u);
    if (need > buf.size() - used) {
      if (!ufd.write_all(buf.data(), used)) return discard();
      used = 0;
      if (need > buf.size()) {
        if (!ufd.write_all(s.data(), s.size())) return discard();
        if (need_nl && !ufd.write_all("\n", 1)) return discard();
        total += need;
        continue;
      }
    }
    std::memcpy(buf.data() + used, s.data(), s.size());
    used += s.size();
    if (need_nl) buf[used++] = '\n';
    total += need;
  }
  if (used > 0 && !ufd.write_all(buf.data(), used)) return discard();
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) return discard();
#else
  if (::fdatasync(ufd.get()) != 0) return discard();
#endif
  if (!ufd.close()) return discard();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    return fail(path);
  }
  written = total;
  msg = std::to_string(total) + " bytes written to disk";
  return IoError::None;
}
