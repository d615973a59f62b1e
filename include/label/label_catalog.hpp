#pragma once

#include <string>
#include <vector>

#include "label/label_geometry.hpp"

namespace thermlabel {

// Built-in label stock, in display order.
const std::vector<LabelGeometry>& label_catalog();

// Lookup by code ("4x6", "30256", ...). Throws InvalidGeometry if unknown.
const LabelGeometry& find_label(const std::string& code);

// Labels of one brand ("generic" / "dymo").
std::vector<LabelGeometry> labels_for_brand(const std::string& brand);

// Spooler options a brand expects by default; empty for generic printers.
std::string default_print_options(const std::string& brand);

// "dymo" when the printer name mentions it (case-insensitive), else "generic".
std::string brand_for_printer(const std::string& printer_name);

} // namespace thermlabel
