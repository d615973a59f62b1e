#pragma once

#include <string>
#include <unordered_map>

namespace thermlabel {

// `--key value` pairs and bare `--flag` switches (stored as "true").
// Positional arguments are rejected; a repeated key keeps its last value.
class CliParser {
public:
    void parse(int argc, char** argv);

    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;

    // `def` when absent; std::runtime_error when the value is not entirely
    // a number.
    int get_int(const std::string& key, int def) const;
    double get_double(const std::string& key, double def) const;

private:
    std::unordered_map<std::string, std::string> kv_;
};

} // namespace thermlabel
