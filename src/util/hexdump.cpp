#include "hexdump.hpp"
#include <algorithm>
#include <cstdio>

namespace fileio {
namespace util {

std::string hexdump(ByteSpan data) {
    constexpr size_t ASCII_COLUMN = 60;

    std::string out;
    char buf[16];

    for (size_t ofs = 0; ofs < data.size(); ofs += 16) {
        auto chunk = data.subspan(ofs, std::min<size_t>(16, data.size() - ofs));

        std::string line;
        snprintf(buf, sizeof(buf), "%08X  ", static_cast<unsigned>(ofs));
        line += buf;

        for (size_t i = 0; i < chunk.size() && i < 8; i++) {
            if (i > 0) line += ' ';
            snprintf(buf, sizeof(buf), "%02X", chunk[i]);
            line += buf;
        }
        line += "  ";
        for (size_t i = 8; i < chunk.size(); i++) {
            if (i > 8) line += ' ';
            snprintf(buf, sizeof(buf), "%02X", chunk[i]);
            line += buf;
        }

        if (line.size() < ASCII_COLUMN) {
            line.append(ASCII_COLUMN - line.size(), ' ');
        }

        line += '|';
        for (uint8_t c : chunk) {
            line += (c >= 32 && c < 128) ? static_cast<char>(c) : '.';
        }
        line += "|\n";

        out += line;
    }

    return out;
}

} // namespace util
} // namespace fileio
