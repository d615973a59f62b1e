#include "cli/cli_parser.hpp"

#include <cstring>
#include <stdexcept>

namespace thermlabel {

namespace {

bool is_option(const char* arg) {
    return arg != nullptr && std::strncmp(arg, "--", 2) == 0;
}

} // namespace

void CliParser::parse(int argc, char** argv) {
    kv_.clear();
    int i = 1;
    while (i < argc) {
        if (!is_option(argv[i])) {
            throw std::runtime_error(std::string("Unexpected argument: ") + (argv[i] ? argv[i] : ""));
        }
        const std::string key = argv[i] + 2;
        // a following non-option token is the value; otherwise it is a flag
        const bool has_value = (i + 1 < argc) && argv[i + 1] != nullptr && !is_option(argv[i + 1]);
        kv_[key] = has_value ? std::string(argv[i + 1]) : std::string("true");
        i += has_value ? 2 : 1;
    }
}

bool CliParser::has(const std::string& key) const {
    return kv_.find(key) != kv_.end();
}

std::string CliParser::get(const std::string& key, const std::string& def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    return it->second;
}

int CliParser::get_int(const std::string& key, int def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(it->second, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != it->second.size()) {
        throw std::runtime_error("--" + key + " must be an integer, got '" + it->second + "'");
    }
    return v;
}

double CliParser::get_double(const std::string& key, double def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(it->second, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != it->second.size()) {
        throw std::runtime_error("--" + key + " must be a number, got '" + it->second + "'");
    }
    return v;
}

} // namespace thermlabel
