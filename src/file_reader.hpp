#pragma once
/*
 * FileReader
 *
 * Purpose: read a file via mmap and split it into lines; strip CR of CRLF.
 * Usage: mmap_readlines(path, out_lines, msg); returns false with msg on failure.
 * Note: a final line terminator does not produce an extra empty line and an
 *       empty file yields no lines at all.
 */
#include <vector>
#include <string>
#include <filesystem>

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);
