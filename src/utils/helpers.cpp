#include "helpers.hpp"
#include <cstdint>
#include <vector>
#include <string>
#include <charconv>
#include <array>

//
// Little-endian readers
//
 uint16_t read_le16(const std::vector<uint8_t>& blob, size_t offset) {
    return (blob[offset + 1] << 8) |
           (blob[offset]);
}

 uint32_t read_le32(const std::vector<uint8_t>& blob, size_t offset) {
    return (static_cast<uint32_t>(blob[offset + 3]) << 24) |
           (static_cast<uint32_t>(blob[offset + 2]) << 16) |
           (static_cast<uint32_t>(blob[offset + 1]) << 8) |
           (static_cast<uint32_t>(blob[offset]));
}

 uint64_t read_le64(const std::vector<uint8_t>& blob, size_t offset) {
    return (static_cast<uint64_t>(blob[offset + 7]) << 56) |
           (static_cast<uint64_t>(blob[offset + 6]) << 48) |
           (static_cast<uint64_t>(blob[offset + 5]) << 40) |
           (static_cast<uint64_t>(blob[offset + 4]) << 32) |
           (static_cast<uint64_t>(blob[offset + 3]) << 24) |
           (static_cast<uint64_t>(blob[offset + 2]) << 16) |
           (static_cast<uint64_t>(blob[offset + 1]) << 8)  |
           (static_cast<uint64_t>(blob[offset]));
}

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

 std::string read_utf16le(const std::vector<uint8_t>& blob, size_t offset, size_t maxBytes) {
    std::string result;
    size_t end = offset + maxBytes;
    if (end > blob.size())
        end = blob.size();

    for (size_t i = offset; i + 1 < end; i += 2) {
        uint32_t unit = read_le16(blob, i);
        if (unit == 0)
            break;

        if (unit >= 0xD800 && unit <= 0xDBFF && i + 3 < end) {
            uint32_t low = read_le16(blob, i + 2);
            if (low >= 0xDC00 && low <= 0xDFFF) {
                append_utf8(result, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                i += 2;
                continue;
            }
        }
        // lone surrogates become U+FFFD
        if (unit >= 0xD800 && unit <= 0xDFFF)
            unit = 0xFFFD;
        append_utf8(result, unit);
    }
    return result;
}

std::string to_hex(uint64_t value)
{
   std::array<char, 24> buffer;
   auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                              value, 16);  // base 16

   std::string hex(buffer.data(), result.ptr);
   return hex;
}

std::string finalSegment(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos == std::string::npos)
        return path;
    return path.substr(pos + 1);
}

std::string sanitizeFileName(const std::string& path) {
    std::string name = finalSegment(path);

    for (char& c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7F) {
            c = '_';
            continue;
        }
        switch (c) {
            case '<': case '>': case ':': case '"':
            case '|': case '?': case '*':
                c = '_';
                break;
            default:
                break;
        }
    }

    if (name == "." || name == "..")
        return "";
    return name;
}
