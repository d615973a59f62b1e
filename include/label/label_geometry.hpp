#pragma once

#include <string>

namespace thermlabel {

// Physical label size. Pixel dimensions are derived as
// round(inches * dpi) and must come out >= 1 on both axes.
class LabelGeometry {
public:
    LabelGeometry(double width_in, double height_in, int dpi,
                  std::string code = "", std::string name = "", std::string brand = "generic");

    // Geometry given directly in device pixels (no physical size lookup).
    static LabelGeometry from_pixels(int width_px, int height_px, int dpi = 203);

    int width_px() const { return width_px_; }
    int height_px() const { return height_px_; }
    int dpi() const { return dpi_; }
    double width_in() const { return width_in_; }
    double height_in() const { return height_in_; }

    const std::string& code() const { return code_; }
    const std::string& name() const { return name_; }
    const std::string& brand() const { return brand_; }

    bool is_portrait() const { return height_px_ > width_px_; }
    bool is_landscape() const { return width_px_ > height_px_; }

private:
    LabelGeometry() = default;

    double width_in_ = 0.0;
    double height_in_ = 0.0;
    int dpi_ = 0;
    int width_px_ = 0;
    int height_px_ = 0;
    std::string code_;
    std::string name_;
    std::string brand_;
};

} // namespace thermlabel
