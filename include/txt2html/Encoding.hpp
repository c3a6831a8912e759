#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace txt2html {

// Source encodings understood by the converter. All are ASCII-compatible,
// so '\n' is the single byte 0x0A in every one of them.
enum class Encoding {
    Utf8,
    Ascii,
    Latin1
};

// Raised when the source bytes are not valid text in the chosen encoding.
class DecodeError : public std::runtime_error {
public:
    DecodeError(const std::string& encoding, std::size_t offset);

    std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

// "utf-8", "UTF8", "latin1", "iso-8859-1", "ascii", ... (case-insensitive).
// Throws std::invalid_argument for anything else.
Encoding parseEncoding(const std::string& name);

std::string encodingName(Encoding enc);

// Throws DecodeError at the first byte that does not decode.
void validateText(const std::string& bytes, Encoding enc);

} // namespace txt2html
