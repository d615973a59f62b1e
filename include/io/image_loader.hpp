#pragma once

#include <string>
#include "io/image_types.hpp"

namespace thermlabel {

// Decode an image file to an 8-bit grayscale PixelBuffer:
// - PGM (P5) 8/16-bit, rescaled to 0..255
// - PNG (libpng), any color type, alpha composited on white
// - DICOM (DCMTK), uncompressed single-frame MONOCHROME1/2, windowed to its
//   own min..max
// Anything without a .pgm/.png extension is tried as DICOM.
PixelBuffer load_grayscale(const std::string& path);

} // namespace thermlabel
