#pragma once

#include <string>
#include <utility>

#include "dither/dither_config.hpp"
#include "io/image_types.hpp"
#include "label/label_geometry.hpp"
#include "preprocess/enhancer.hpp"

namespace thermlabel {

// Everything one print/preview job needs. Built per job and passed by
// value; nothing here is shared between jobs.
struct JobSettings {
    EnhancementSettings enhancement;
    LabelGeometry label;
    DitherConfig dither;
    std::string print_options; // passed through to the spooler

    explicit JobSettings(LabelGeometry l) : label(std::move(l)) {}
};

// Intermediate buffers of one run, kept for previews and reports.
struct JobResult {
    PixelBuffer enhanced;
    PixelBuffer fitted;
    PixelBuffer mono;
};

// Enhancer -> LabelFitter -> DitherEngine.
JobResult run_job(const PixelBuffer& source, const JobSettings& settings);

// Same, returning only the 1-bit label raster.
PixelBuffer prepare_label(const PixelBuffer& source, const JobSettings& settings);

} // namespace thermlabel
