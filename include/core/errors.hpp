#pragma once

#include <stdexcept>
#include <string>

namespace thermlabel {

// Target label resolves to fewer than one pixel on an axis, or an unknown
// label code was requested.
class InvalidGeometry : public std::runtime_error {
public:
    explicit InvalidGeometry(const std::string& msg) : std::runtime_error(msg) {}
};

// Unknown dithering tag, or a parameter outside its valid range.
class UnsupportedAlgorithm : public std::runtime_error {
public:
    explicit UnsupportedAlgorithm(const std::string& msg) : std::runtime_error(msg) {}
};

// Declared dimensions disagree with the sample count (or the sample depth
// is not the one a stage expects).
class BufferSizeMismatch : public std::runtime_error {
public:
    explicit BufferSizeMismatch(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace thermlabel
