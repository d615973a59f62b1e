#include "pipeline/job.hpp"

#include "dither/dither_engine.hpp"
#include "fit/label_fitter.hpp"

#include <cstdio>

namespace thermlabel {

JobResult run_job(const PixelBuffer& source, const JobSettings& settings) {
    validate(source, SampleDepth::Gray8, "run_job");
    // fail on a bad algorithm before spending time on the image
    validate(settings.dither);

    JobResult r;
    //===Enhance===//
    r.enhanced = enhance(source, settings.enhancement);
#ifndef NDEBUG
    std::fprintf(stderr, "job: enhanced %dx%d (brightness=%.2f contrast=%.2f)\n",
                 r.enhanced.width, r.enhanced.height,
                 settings.enhancement.brightness, settings.enhancement.contrast);
#endif

    //===Fit to label===//
    r.fitted = fit_to_label(r.enhanced, settings.label);

    //===Dither===//
    r.mono = dither(r.fitted, settings.dither);
    return r;
}

PixelBuffer prepare_label(const PixelBuffer& source, const JobSettings& settings) {
    return run_job(source, settings).mono;
}

} // namespace thermlabel
