#include "tanto/core/body.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <fstream>
#include <memory>

namespace tanto::http {

std::string type_name(std::type_index type) {
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), &std::free);
    if (status != 0 || !demangled) {
        return type.name();
    }
    return demangled.get();
}

asset asset::from_file(const std::filesystem::path& file) {
    asset a;
    a.name = file.filename().string();
    a.type = media_type::by_path(file.string());
    a.open = [file]() -> std::unique_ptr<std::istream> {
        return std::make_unique<std::ifstream>(file, std::ios::binary);
    };
    return a;
}

} // namespace tanto::http
