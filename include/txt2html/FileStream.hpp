#pragma once
#include <string>

namespace txt2html {

// Whole-file text I/O. Failures throw std::system_error carrying the
// errno of the failed open, or std::errc::io_error for read/write errors.
class FileReader {
public:
    static std::string readAll(const std::string& path);
};

class FileWriter {
public:
    // truncates (or creates) the file at path
    static void writeAll(const std::string& path, const std::string& data);
};

} // namespace txt2html
