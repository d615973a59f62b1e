#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "io/image_types.hpp"

namespace thermlabel {

// PGM (P5) 8-bit. Mono1 buffers are written as 0/255.
void save_pgm(const std::string& path, const PixelBuffer& buf);

void write_all(const std::string& path, const std::vector<uint8_t>& bytes);

} // namespace thermlabel
