#pragma once

#include "io/image_types.hpp"
#include "label/label_geometry.hpp"

namespace thermlabel {

// Rotate 90 degrees counter-clockwise: output is H x W and
// out(x', y') = in(W - 1 - y', x').
PixelBuffer rotate90_ccw(const PixelBuffer& in);

// Separable triangle-filter resample to out_w x out_h. The filter support
// widens with the reduction factor, so shrinking area-averages and
// enlarging interpolates bilinearly.
PixelBuffer resample(const PixelBuffer& in, int out_w, int out_h);

// True when source and target disagree on landscape/portrait. Square
// shapes never trigger a rotation.
bool should_rotate(int src_w, int src_h, int dst_w, int dst_h);

// Same as fit_to_label() for a raw pixel target. Throws InvalidGeometry
// when target_w or target_h is below 1.
PixelBuffer fit_to_size(const PixelBuffer& in, int target_w, int target_h);

// Rotate (if needed), scale to fit within the label and center on a
// white canvas of exactly label.width_px() x label.height_px().
PixelBuffer fit_to_label(const PixelBuffer& in, const LabelGeometry& label);

} // namespace thermlabel
