#include "txt2html/ConverterFactory.hpp"
#include "txt2html/TXT2HTMLConverter.hpp"
#include <stdexcept>

namespace txt2html {

std::unique_ptr<IConverter> ConverterFactory::create(const std::string& id) {
    if (id == "txt2html") return std::make_unique<TXT2HTMLConverter>();
    throw std::invalid_argument("Unknown converter: " + id);
}

} // namespace txt2html
