/*============================================================================
  TXT2HTMLConverter.cpp  –  part of txt2html
  --------------------------------------------------------------------------
  Converts a plain-text file into HTML by putting a <br> marker in front of
  every newline. No escaping, no <html>/<body> wrapper: the output is the
  source text with line breaks a browser will render.
============================================================================*/

#include "txt2html/TXT2HTMLConverter.hpp"

#include "txt2html/ConverterFactory.hpp"
#include "txt2html/Encoding.hpp"
#include "txt2html/FileStream.hpp"
#include "txt2html/PathUtil.hpp"

#include <algorithm>
#include <cstring>

namespace txt2html {

// ─────────────────────── option helpers ────────────────────────────────────
static std::string optS(const Options& o,const std::string& k,const std::string& d){auto it=o.params.find(k);return it==o.params.end()?d:it->second;}

// ───────────────────────── transform ───────────────────────────────────────
std::size_t countLineBreaks(const std::string& text)
{
    return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
}

std::string normalizeNewlines(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\r') { out += text[i]; continue; }
        out += '\n';                                   // "\r\n" and lone "\r"
        if (i + 1 < text.size() && text[i+1] == '\n') ++i;
    }
    return out;
}

std::string insertLineBreaks(const std::string& text)
{
    const std::size_t markerLen = std::strlen(kLineBreakMarker);

    std::string out;
    out.reserve(text.size() + countLineBreaks(text) * markerLen);
    for (char c : text) {
        if (c == '\n') out.append(kLineBreakMarker, markerLen);
        out += c;
    }
    return out;
}

// ───────────────────────────── convert() ───────────────────────────────────
void TXT2HTMLConverter::convert(const std::string& inPath,
                                const std::string& outPath,
                                const Options&     opts)
{
    const Encoding enc = parseEncoding(optS(opts, "encoding", "utf-8"));

    // source is read in full before the destination is opened:
    // inPath == outPath is legal and must see the original text
    const std::string text = FileReader::readAll(inPath);
    validateText(text, enc);

    FileWriter::writeAll(outPath, insertLineBreaks(normalizeNewlines(text)));
}

std::string txt2html(const std::string& inputPath, const Options& opts)
{
    const std::string outputPath = deriveOutputPath(inputPath);
    ConverterFactory::create("txt2html")->convert(inputPath, outputPath, opts);
    return outputPath;
}

} // namespace txt2html
