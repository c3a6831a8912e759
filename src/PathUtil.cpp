#include "txt2html/PathUtil.hpp"

namespace txt2html {

std::string replaceFirst(const std::string& text,
                         const std::string& from,
                         const std::string& to)
{
    if (from.empty()) return text;
    const auto pos = text.find(from);
    if (pos == std::string::npos) return text;

    std::string out = text;
    out.replace(pos, from.size(), to);
    return out;
}

std::string deriveOutputPath(const std::string& inputPath)
{
    return replaceFirst(inputPath, ".txt", ".html");
}

} // namespace txt2html
