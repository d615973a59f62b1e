#include "label/label_geometry.hpp"

#include "core/errors.hpp"

#include <cmath>
#include <utility>

namespace thermlabel {
namespace {

int to_pixels(double inches, int dpi) {
    return static_cast<int>(std::lround(inches * static_cast<double>(dpi)));
}

} // namespace

LabelGeometry::LabelGeometry(double width_in, double height_in, int dpi,
                             std::string code, std::string name, std::string brand)
    : width_in_(width_in),
      height_in_(height_in),
      dpi_(dpi),
      code_(std::move(code)),
      name_(std::move(name)),
      brand_(std::move(brand)) {
    if (dpi <= 0) {
        throw InvalidGeometry("label " + code_ + ": dpi must be positive");
    }
    if (!(width_in > 0.0) || !(height_in > 0.0)) {
        throw InvalidGeometry("label " + code_ + ": physical size must be positive");
    }
    width_px_ = to_pixels(width_in, dpi);
    height_px_ = to_pixels(height_in, dpi);
    if (width_px_ < 1 || height_px_ < 1) {
        throw InvalidGeometry("label " + code_ + ": resolves to " + std::to_string(width_px_) + "x" +
                              std::to_string(height_px_) + " pixels");
    }
}

LabelGeometry LabelGeometry::from_pixels(int width_px, int height_px, int dpi) {
    if (width_px < 1 || height_px < 1) {
        throw InvalidGeometry("label: pixel size must be positive (" + std::to_string(width_px) + "x" +
                              std::to_string(height_px) + ")");
    }
    if (dpi <= 0) throw InvalidGeometry("label: dpi must be positive");

    LabelGeometry g;
    g.dpi_ = dpi;
    g.width_px_ = width_px;
    g.height_px_ = height_px;
    g.width_in_ = static_cast<double>(width_px) / dpi;
    g.height_in_ = static_cast<double>(height_px) / dpi;
    g.name_ = std::to_string(width_px) + "x" + std::to_string(height_px) + " px";
    g.brand_ = "generic";
    return g;
}

} // namespace thermlabel
