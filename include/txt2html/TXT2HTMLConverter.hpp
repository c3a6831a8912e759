#pragma once
#include "Converter.hpp"
#include <cstddef>
#include <string>

namespace txt2html {

// Literal marker placed before every newline.
inline constexpr const char* kLineBreakMarker = "<br>";

// Universal newlines: "\r\n" and a lone "\r" both become "\n".
std::string normalizeNewlines(const std::string& text);

// "a\nb\n" -> "a<br>\nb<br>\n"; every other character is left as is.
std::string insertLineBreaks(const std::string& text);

// Number of markers insertLineBreaks() puts into `text`.
std::size_t countLineBreaks(const std::string& text);

// Plain text → HTML line breaks. Options: "encoding" (default "utf-8").
class TXT2HTMLConverter final : public IConverter {
public:
    void convert(const std::string& inputPath,
                 const std::string& outputPath,
                 const Options&     opts) override;
};

// Converts `inputPath` into the file named by deriveOutputPath() and
// returns that path. Errors propagate unchanged.
std::string txt2html(const std::string& inputPath, const Options& opts = {});

} // namespace txt2html
