#include "txt2html/Encoding.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace txt2html {

DecodeError::DecodeError(const std::string& encoding, std::size_t offset)
    : std::runtime_error("invalid " + encoding + " byte sequence at offset "
                         + std::to_string(offset)),
      offset_(offset)
{
}

Encoding parseEncoding(const std::string& name)
{
    static const std::unordered_map<std::string, Encoding> known {
        {"utf-8",      Encoding::Utf8},
        {"utf8",       Encoding::Utf8},
        {"ascii",      Encoding::Ascii},
        {"us-ascii",   Encoding::Ascii},
        {"latin1",     Encoding::Latin1},
        {"latin-1",    Encoding::Latin1},
        {"iso-8859-1", Encoding::Latin1}
    };

    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    auto it = known.find(key);
    if (it == known.end())
        throw std::invalid_argument("Unknown encoding: " + name);
    return it->second;
}

std::string encodingName(Encoding enc)
{
    switch (enc) {
        case Encoding::Utf8:   return "utf-8";
        case Encoding::Ascii:  return "ascii";
        case Encoding::Latin1: return "iso-8859-1";
    }
    return "unknown";
}

// ─────────────────────────── utf-8 ─────────────────────────────────────────
// RFC 3629, table 3-7 of the Unicode standard: rejects overlongs,
// surrogates (ED A0..BF) and code points above U+10FFFF.
static void validateUtf8(const std::string& s)
{
    const std::size_t n = s.size();
    auto p = [&s](std::size_t k){ return static_cast<unsigned char>(s[k]); };

    std::size_t i = 0;
    while (i < n) {
        const unsigned char c = p(i);
        if (c < 0x80) { ++i; continue; }

        std::size_t len;
        unsigned char lo = 0x80, hi = 0xBF;   // range of the 2nd byte
        if      (c >= 0xC2 && c <= 0xDF) len = 2;
        else if (c == 0xE0)            { len = 3; lo = 0xA0; }
        else if (c == 0xED)            { len = 3; hi = 0x9F; }
        else if (c >= 0xE1 && c <= 0xEF) len = 3;
        else if (c == 0xF0)            { len = 4; lo = 0x90; }
        else if (c == 0xF4)            { len = 4; hi = 0x8F; }
        else if (c >= 0xF1 && c <= 0xF3) len = 4;
        else throw DecodeError("utf-8", i);

        if (i + len > n) throw DecodeError("utf-8", i);
        if (p(i+1) < lo || p(i+1) > hi) throw DecodeError("utf-8", i);
        for (std::size_t k = 2; k < len; ++k)
            if ((p(i+k) & 0xC0) != 0x80) throw DecodeError("utf-8", i);

        i += len;
    }
}

void validateText(const std::string& bytes, Encoding enc)
{
    switch (enc) {
        case Encoding::Utf8:
            validateUtf8(bytes);
            break;
        case Encoding::Ascii:
            for (std::size_t i = 0; i < bytes.size(); ++i)
                if (static_cast<unsigned char>(bytes[i]) >= 0x80)
                    throw DecodeError("ascii", i);
            break;
        case Encoding::Latin1:
            break;                          // every byte is a character
    }
}

} // namespace txt2html
