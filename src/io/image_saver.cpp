#include "io/image_saver.hpp"

#include <fstream>
#include <stdexcept>

namespace thermlabel {

void save_pgm(const std::string& path, const PixelBuffer& buf) {
    validate(buf, "save_pgm");

    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);

    ofs << "P5\n" << buf.width << " " << buf.height << "\n255\n";
    if (buf.depth == SampleDepth::Mono1) {
        for (uint8_t v : buf.pixels) {
            ofs.put(static_cast<char>(v ? 255 : 0));
        }
    } else {
        ofs.write(reinterpret_cast<const char*>(buf.pixels.data()), static_cast<std::streamsize>(buf.pixels.size()));
    }
    if (!ofs.good()) throw std::runtime_error("Write failed: " + path);
}

void write_all(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);
    ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!ofs.good()) throw std::runtime_error("Write failed: " + path);
}

} // namespace thermlabel
