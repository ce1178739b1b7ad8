/// @file src/core/document_loader.cpp
/// @brief Text DocumentLoader.

#include "fdx/document_loader.hpp"

#include <fstream>
#include <new>

namespace fdx {

std::string_view DocumentLoader::strip_bom(std::string_view content) noexcept {
    constexpr std::string_view BOM = "\xEF\xBB\xBF";
    if (content.substr(0, BOM.size()) == BOM) {
        content.remove_prefix(BOM.size());
    }
    return content;
}

std::optional<std::string> DocumentLoader::read_stream(std::istream& in) noexcept {
    try {
        std::string content;
        char buffer[64 * 1024];
        while (in) {
            in.read(buffer, sizeof(buffer));
            const auto got = static_cast<std::size_t>(in.gcount());
            if (content.size() + got > MAX_DOCUMENT_BYTES) {
                return std::nullopt;
            }
            content.append(buffer, got);
        }
        if (in.bad()) {
            return std::nullopt;
        }
        return std::string(strip_bom(content));
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::optional<std::string> DocumentLoader::load_text(const std::string& filepath) noexcept {
    std::ifstream file(filepath, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    return read_stream(file);
}

}  // namespace fdx
