#include "utils/terminal_text.hpp"

#include <regex>

namespace compass::utils {

bool IsValidUtf8(const char* data, std::size_t size) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(data);
    std::size_t i = 0;
    while (i < size) {
        const unsigned char lead = bytes[i];
        if (lead < 0x80) {
            ++i;
            continue;
        }
        std::size_t length = 0;
        unsigned int code_point = 0;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return false;
        }
        if (i + length > size) {
            return false;
        }
        for (std::size_t k = 1; k < length; ++k) {
            const unsigned char next = bytes[i + k];
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }
        if ((length == 2 && code_point < 0x80) ||
            (length == 3 && code_point < 0x800) ||
            (length == 4 && code_point < 0x10000)) {
            return false;
        }
        if (code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

std::optional<std::string> DecodeChunk(const char* data, std::size_t size) {
    if (!IsValidUtf8(data, size)) {
        return std::nullopt;
    }
    return std::string(data, size);
}

std::string CleanAnsi(const std::string& text) {
    static const std::regex kAnsi(
        "\\x1b\\[[0-9;?]*[a-zA-Z]"
        "|\\x1b\\][\\s\\S]*?(\\x07|\\x1b\\\\)"
        "|\\x1b[()#][0-9a-zA-Z]"
        "|\\x1b[A-Z>=\\[\\]]");
    return std::regex_replace(text, kAnsi, "");
}

void AppendOutput(std::string& buffer, const std::string& chunk) {
    const auto cleaned = CleanAnsi(chunk);
    for (std::size_t i = 0; i < cleaned.size(); ++i) {
        const char c = cleaned[i];
        if (c == '\r') {
            continue;
        }
        const auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte == 0x7F) {
            if (c != '\n' && c != '\t') {
                continue;
            }
        }
        buffer.push_back(c);
    }
}

}  // namespace compass::utils
