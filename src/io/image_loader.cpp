#include "io/image_loader.hpp"

#include <dcmtk/config/osconfig.h>   // must precede other DCMTK headers
#include <dcmtk/dcmdata/dctk.h>
#include <dcmtk/dcmdata/dcdeftag.h>
#include <dcmtk/dcmdata/dcxfer.h>

#include <png.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace thermlabel {
namespace {

bool ends_with_ci(const std::string& path, const char* ext) {
    const size_t n = std::strlen(ext);
    if (path.size() < n) return false;
    for (size_t i = 0; i < n; ++i) {
        const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(path[path.size() - n + i])));
        if (c != ext[i]) return false;
    }
    return true;
}

// Stretch raw samples over 0..255 using their own range. A flat image has no
// range to stretch and becomes mid-gray.
PixelBuffer stretch_to_gray8(int width, int height, const std::vector<int32_t>& raw, bool white_is_low) {
    PixelBuffer im = make_buffer(width, height, SampleDepth::Gray8, 128);

    const auto range = std::minmax_element(raw.begin(), raw.end());
    const double lo = *range.first;
    const double span = static_cast<double>(*range.second) - lo;
    if (span <= 0.0) return im;

    for (size_t i = 0; i < raw.size(); ++i) {
        long v = std::lround(255.0 * (raw[i] - lo) / span);
        im.pixels[i] = static_cast<uint8_t>(white_is_low ? 255 - v : v);
    }
    return im;
}

//===PGM===//

struct PgmHeader {
    int width = 0;
    int height = 0;
    int maxval = 0;
};

// Next header token, skipping whitespace and '#' comments.
std::string pgm_token(std::istream& is) {
    std::string tok;
    int c = is.get();
    while (c != EOF) {
        if (c == '#') {
            while (c != EOF && c != '\n') c = is.get();
        } else if (std::isspace(c)) {
            if (!tok.empty()) break;
        } else {
            tok.push_back(static_cast<char>(c));
        }
        c = is.get();
    }
    return tok;
}

int pgm_number(std::istream& is, const std::string& path) {
    const std::string tok = pgm_token(is);
    if (tok.empty() || !std::all_of(tok.begin(), tok.end(), [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)); })) {
        throw std::runtime_error("Malformed PGM header: " + path);
    }
    return std::stoi(tok);
}

// Leaves the stream at the first payload byte (the single whitespace after
// maxval is consumed by pgm_token).
PgmHeader read_pgm_header(std::istream& is, const std::string& path) {
    if (pgm_token(is) != "P5") throw std::runtime_error("Only binary PGM (P5) is supported: " + path);
    PgmHeader h;
    h.width = pgm_number(is, path);
    h.height = pgm_number(is, path);
    h.maxval = pgm_number(is, path);
    if (h.width <= 0 || h.height <= 0) throw std::runtime_error("Invalid PGM size: " + path);
    if (h.maxval <= 0 || h.maxval > 65535) throw std::runtime_error("Invalid PGM maxval: " + path);
    return h;
}

PixelBuffer load_pgm(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);

    const PgmHeader h = read_pgm_header(ifs, path);
    const size_t count = static_cast<size_t>(h.width) * h.height;
    const size_t bytes_per_sample = h.maxval > 255 ? 2 : 1;

    std::vector<uint8_t> payload(count * bytes_per_sample);
    ifs.read(reinterpret_cast<char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    if (ifs.gcount() != static_cast<std::streamsize>(payload.size())) {
        throw std::runtime_error("PGM payload too short: " + path);
    }

    PixelBuffer im = make_buffer(h.width, h.height, SampleDepth::Gray8);
    for (size_t i = 0; i < count; ++i) {
        // 16-bit samples are big-endian
        long v = bytes_per_sample == 2 ? (static_cast<long>(payload[2 * i]) << 8) | payload[2 * i + 1]
                                       : static_cast<long>(payload[i]);
        v = std::min<long>(v, h.maxval);
        im.pixels[i] = static_cast<uint8_t>((v * 255 + h.maxval / 2) / h.maxval);
    }
    return im;
}

//===PNG===//

PixelBuffer load_png(const std::string& path) {
    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;

    if (!png_image_begin_read_from_file(&image, path.c_str())) {
        throw std::runtime_error("PNG read failed (" + path + "): " + image.message);
    }
    // gray without alpha: libpng composites any alpha onto the background
    image.format = PNG_FORMAT_GRAY;
    if (image.width == 0 || image.height == 0) {
        png_image_free(&image);
        throw std::runtime_error("Invalid PNG size: " + path);
    }

    PixelBuffer im = make_buffer(static_cast<int>(image.width), static_cast<int>(image.height), SampleDepth::Gray8);
    png_color white;
    white.red = white.green = white.blue = 255;
    if (!png_image_finish_read(&image, &white, im.pixels.data(), 0, nullptr)) {
        const std::string msg = image.message;
        png_image_free(&image);
        throw std::runtime_error("PNG decode failed (" + path + "): " + msg);
    }
    return im;
}

//===DICOM===//

void check(const OFCondition& cond, const std::string& what) {
    if (cond.bad()) throw std::runtime_error(what + ": " + cond.text());
}

struct DicomFrame {
    Uint16 rows = 0;
    Uint16 cols = 0;
    Uint16 bits_allocated = 0;
    bool is_signed = false;
    bool white_is_low = false; // MONOCHROME1
};

DicomFrame read_frame_header(DcmDataset& ds, const std::string& path) {
    DicomFrame f;
    Uint16 pixel_rep = 0;
    check(ds.findAndGetUint16(DCM_Rows, f.rows), "Missing/invalid Rows");
    check(ds.findAndGetUint16(DCM_Columns, f.cols), "Missing/invalid Columns");
    check(ds.findAndGetUint16(DCM_BitsAllocated, f.bits_allocated), "Missing/invalid BitsAllocated");
    check(ds.findAndGetUint16(DCM_PixelRepresentation, pixel_rep), "Missing/invalid PixelRepresentation");
    f.is_signed = (pixel_rep == 1);

    Uint16 spp = 1;
    if (ds.findAndGetUint16(DCM_SamplesPerPixel, spp).good() && spp != 1) {
        throw std::runtime_error("Only grayscale DICOM (SamplesPerPixel=1) is supported: " + path);
    }

    OFString photometric;
    if (ds.findAndGetOFString(DCM_PhotometricInterpretation, photometric).good()) {
        if (photometric != "MONOCHROME1" && photometric != "MONOCHROME2") {
            throw std::runtime_error("Unsupported PhotometricInterpretation " + std::string(photometric.c_str()) +
                                     ": " + path);
        }
        f.white_is_low = (photometric == "MONOCHROME1");
    }

    Sint32 frames = 1;
    if (ds.findAndGetSint32(DCM_NumberOfFrames, frames).good() && frames != 1) {
        throw std::runtime_error("Multi-frame DICOM is not supported: " + path);
    }
    if (f.bits_allocated != 8 && f.bits_allocated != 16) {
        throw std::runtime_error("Only 8- or 16-bit DICOM samples are supported: " + path);
    }
    if (f.rows == 0 || f.cols == 0) throw std::runtime_error("Invalid DICOM size: " + path);
    return f;
}

// The PixelData element length is independent of Rows x Columns.
void require_samples(unsigned long have, size_t need, const char* what) {
    if (have < need) {
        throw std::runtime_error(std::string(what) + " PixelData shorter than Rows*Columns (" + std::to_string(have) +
                                 " < " + std::to_string(need) + ")");
    }
}

std::vector<int32_t> read_frame_samples(DcmDataset& ds, const DicomFrame& f) {
    const size_t count = static_cast<size_t>(f.rows) * f.cols;
    std::vector<int32_t> raw(count);

    if (f.bits_allocated == 8) {
        const Uint8* u8 = nullptr;
        unsigned long n = 0;
        const OFCondition st = ds.findAndGetUint8Array(DCM_PixelData, u8, &n);
        if (st.bad() || u8 == nullptr) {
            throw std::runtime_error(std::string("Cannot read 8-bit PixelData: ") + st.text());
        }
        require_samples(n, count, "8-bit");
        std::copy(u8, u8 + count, raw.begin());
        return raw;
    }

    // OW pixel data is usually only reachable through the unsigned accessor,
    // even for signed samples
    const Uint16* u16 = nullptr;
    unsigned long n = 0;
    const OFCondition st = ds.findAndGetUint16Array(DCM_PixelData, u16, &n);
    if (st.good() && u16 != nullptr) {
        require_samples(n, count, "16-bit");
        for (size_t i = 0; i < count; ++i) {
            raw[i] = f.is_signed ? static_cast<int16_t>(u16[i]) : static_cast<int32_t>(u16[i]);
        }
        return raw;
    }
    const Sint16* s16 = nullptr;
    n = 0;
    if (ds.findAndGetSint16Array(DCM_PixelData, s16, &n).bad() || s16 == nullptr) {
        throw std::runtime_error(std::string("Cannot read 16-bit PixelData: ") + st.text());
    }
    require_samples(n, count, "16-bit");
    std::copy(s16, s16 + count, raw.begin());
    return raw;
}

PixelBuffer load_dicom(const std::string& path) {
    DcmFileFormat file;
    check(file.loadFile(path.c_str(), EXS_Unknown, EGL_noChange, DCM_MaxReadLength),
          "Cannot load DICOM (" + path + ")");

    DcmDataset* ds = file.getDataset();
    if (ds == nullptr) throw std::runtime_error("DICOM has no dataset: " + path);

    const DcmXfer xfer(ds->getOriginalXfer());
    if (xfer.isEncapsulated()) {
        throw std::runtime_error("Compressed DICOM (" + std::string(xfer.getXferName()) +
                                 ") is not supported; decompress it first: " + path);
    }

    const DicomFrame f = read_frame_header(*ds, path);
    return stretch_to_gray8(f.cols, f.rows, read_frame_samples(*ds, f), f.white_is_low);
}

} // namespace

PixelBuffer load_grayscale(const std::string& path) {
    if (ends_with_ci(path, ".pgm")) return load_pgm(path);
    if (ends_with_ci(path, ".png")) return load_png(path);

    // DICOM files frequently carry no extension
    try {
        return load_dicom(path);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Load failed (not a supported PGM/PNG/DICOM): ") + e.what());
    }
}

} // namespace thermlabel
