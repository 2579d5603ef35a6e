#ifndef BEARDMOLD_SERIALIZATION_JSON_SERIALIZATION_HPP
#define BEARDMOLD_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>
#include <string>

namespace beardmold::json {

// Write JSON to file
inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2);  // Pretty print with 2-space indent
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed writing file: " + path);
    }
}

// Read JSON from file. Parse errors surface as nlohmann::json::parse_error.
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return j;
}

}  // namespace beardmold::json

#endif // BEARDMOLD_SERIALIZATION_JSON_SERIALIZATION_HPP
