#include "txt2html/FileStream.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

namespace txt2html {

// errno of the failed open; io_error if the library did not set one
static std::system_error openError(const std::string& path, const char* mode)
{
    const int err = errno ? errno : static_cast<int>(std::errc::io_error);
    return std::system_error(err, std::generic_category(),
                             "cannot open '" + path + "' for " + mode);
}

std::string FileReader::readAll(const std::string& path)
{
    errno = 0;
    std::ifstream in(path);                    // text mode
    if (!in)
        throw openError(path, "reading");

    std::string data((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
    if (in.bad())
        throw std::system_error(std::make_error_code(std::errc::io_error),
                                "read failed for '" + path + "'");
    return data;
}

void FileWriter::writeAll(const std::string& path, const std::string& data)
{
    errno = 0;
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out)
        throw openError(path, "writing");

    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out)
        throw std::system_error(std::make_error_code(std::errc::io_error),
                                "write failed for '" + path + "'");
}

} // namespace txt2html
