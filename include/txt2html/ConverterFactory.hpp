#pragma once
#include "Converter.hpp"
#include <memory>
#include <string>

namespace txt2html {

class ConverterFactory {
public:
    // создаёт нужный конвертер по ключу, например "txt2html"
    static std::unique_ptr<IConverter> create(const std::string& converterId);
};

} // namespace txt2html
