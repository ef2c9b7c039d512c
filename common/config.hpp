// config.hpp
#pragma once
#include <cstddef>

namespace Config {
    inline constexpr size_t BLOCK_SIZE = 6 * 1024;     // 6 kb blocks, shared by checksums and apply
    inline constexpr const char* DEFAULT_HASH = "md5"; // strong checksum when none is supplied
}
