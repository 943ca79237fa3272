#pragma once

#include "fileio/types.hpp"
#include <string>

namespace fileio {
namespace util {

// Classic 16-bytes-per-line dump:
// 00000000  48 65 6C 6C 6F 00 01 02  03 04 05 06 07 08 09 0A  |Hello...........|
std::string hexdump(ByteSpan data);

} // namespace util
} // namespace fileio
