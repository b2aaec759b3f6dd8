#pragma once
/*
 * FileReader
 *
 * Purpose: read a small text file via mmap and split into lines; normalize CRLF.
 * Usage: mmap_readlines(path, out_lines, msg); returns false with msg on failure.
 */
#include <vector>
#include <string>
#include <filesystem>

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);
