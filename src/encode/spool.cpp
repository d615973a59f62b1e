#include "encode/spool.hpp"

#include "encode/packing.hpp"
#include "encode/png_encoder.hpp"
#include "io/image_saver.hpp"

#include <cmath>
#include <ostream>
#include <sstream>
#include <utility>

namespace thermlabel {
namespace {

// CUPS custom page sizes are in PostScript points.
int to_points(int pixels, int dpi) {
    return static_cast<int>(std::lround(static_cast<double>(pixels) * 72.0 / static_cast<double>(dpi)));
}

} // namespace

SpoolPayload to_spool_format(const PixelBuffer& mono, const std::string& options, int dpi) {
    validate(mono, SampleDepth::Mono1, "to_spool_format");

    SpoolPayload p;
    p.raster = mono;
    p.packed_rows = pack_mono_rows(mono, BitPolarity::BlackIsOne);
    p.stride = packed_stride(mono.width);
    p.dpi = dpi;
    p.options = options;
    return p;
}

std::vector<std::string> split_print_options(const std::string& options) {
    std::vector<std::string> out;
    std::istringstream iss(options);
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

std::vector<std::string> lp_command(const std::string& printer, const std::string& file, const SpoolPayload& payload) {
    std::vector<std::string> argv = {"lp", "-d", printer};
    if (payload.dpi > 0) {
        argv.push_back("-o");
        argv.push_back("PageSize=w" + std::to_string(to_points(payload.raster.width, payload.dpi)) +
                       "h" + std::to_string(to_points(payload.raster.height, payload.dpi)));
    }
    // the raster is already at native resolution; the driver must not rescale
    argv.push_back("-o");
    argv.push_back("scaling=100");
    if (payload.dpi > 0) {
        argv.push_back("-o");
        argv.push_back("ppi=" + std::to_string(payload.dpi));
    }
    for (const auto& opt : split_print_options(payload.options)) {
        argv.push_back("-o");
        argv.push_back(opt);
    }
    argv.push_back(file);
    return argv;
}

LpDryRunSpooler::LpDryRunSpooler(std::string printer, std::string spool_path, std::ostream& log)
    : printer_(std::move(printer)), spool_path_(std::move(spool_path)), log_(log) {}

void LpDryRunSpooler::submit(const SpoolPayload& payload) {
    write_all(spool_path_, encode_png(payload.raster, payload.dpi));
    last_command_ = lp_command(printer_, spool_path_, payload);

    for (size_t i = 0; i < last_command_.size(); ++i) {
        if (i) log_ << ' ';
        log_ << last_command_[i];
    }
    log_ << "\n";
}

} // namespace thermlabel
