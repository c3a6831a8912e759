#pragma once
#include <string>

namespace txt2html {

// Replaces the first occurrence of `from` in `text` with `to`.
// Returns `text` unchanged when `from` is empty or not found.
std::string replaceFirst(const std::string& text,
                         const std::string& from,
                         const std::string& to);

// Destination path for a source path: the first ".txt" anywhere in the
// string becomes ".html". Plain substring replacement, not extension-aware:
//   "a.txt.txt" -> "a.html.txt",  "readme.md" -> "readme.md" (same file).
std::string deriveOutputPath(const std::string& inputPath);

} // namespace txt2html
