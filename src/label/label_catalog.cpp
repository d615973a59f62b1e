#include "label/label_catalog.hpp"

#include "core/errors.hpp"

#include <cctype>

namespace thermlabel {

const std::vector<LabelGeometry>& label_catalog() {
    // Direct thermal stock: generic printers are 203 dpi, Dymo LabelWriters 300 dpi.
    static const std::vector<LabelGeometry> kLabels = {
        LabelGeometry(4.0, 6.0, 203, "4x6", "4\" x 6\" Shipping", "generic"),
        LabelGeometry(2.0, 1.0, 203, "2x1", "2\" x 1\" Barcode", "generic"),
        LabelGeometry(2.3125, 4.0, 300, "30256", "2-5/16\" x 4\" Shipping", "dymo"),
        LabelGeometry(1.125, 3.5, 300, "30252", "1-1/8\" x 3-1/2\" Address", "dymo"),
        LabelGeometry(1.0, 2.125, 300, "30336", "1\" x 2-1/8\" Multipurpose", "dymo"),
    };
    return kLabels;
}

const LabelGeometry& find_label(const std::string& code) {
    for (const auto& g : label_catalog()) {
        if (g.code() == code) return g;
    }
    throw InvalidGeometry("Unknown label code: " + code);
}

std::vector<LabelGeometry> labels_for_brand(const std::string& brand) {
    std::vector<LabelGeometry> out;
    for (const auto& g : label_catalog()) {
        if (g.brand() == brand) out.push_back(g);
    }
    return out;
}

std::string default_print_options(const std::string& brand) {
    if (brand == "dymo") return "DymoPrintDensity=Medium DymoPrintQuality=Graphics";
    return "";
}

std::string brand_for_printer(const std::string& printer_name) {
    std::string p = printer_name;
    for (auto& ch : p) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return p.find("dymo") != std::string::npos ? "dymo" : "generic";
}

} // namespace thermlabel
