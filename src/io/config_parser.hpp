#ifndef Ctess_CONFIG_PARSER_HPP
#define Ctess_CONFIG_PARSER_HPP

#include "core/tess_types.hpp"
#include <string>
#include <map>
#include <istream>
#include <stdexcept> // For std::runtime_error, std::invalid_argument

namespace Ctess {
namespace io {

// Helper to trim whitespace from a string
inline std::string trim_string(const std::string& str) {
    const std::string whitespace = " \t\n\r\f\v";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) return ""; // Empty or all whitespace
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

// How a model is loaded and queried.
//
//   [Model]
//   file_path      = model.ctm          (required)
//   grid_directory = grids              (default: directory of file_path)
//
//   [Interpolation]
//   horizontal = linear | natural_neighbor
//   radial     = linear | cubic_spline
//   radius_out_of_range_allowed = true | false
//   max_tess_level = 3
//
//   [Logging]
//   verbose = true | false
struct ModelConfig {
    std::string model_path;
    std::string grid_directory;
    InterpolatorType horizontal = InterpolatorType::LINEAR;
    InterpolatorType radial = InterpolatorType::LINEAR;
    bool radius_out_of_range_allowed = true;
    int max_tess_level = -1; // no limit
    bool verbose = false;
};

class ConfigParser {
public:
    ConfigParser() = default;

    ModelConfig parse(const std::string& filename);
    // source names the stream in error messages.
    ModelConfig parse(std::istream& input, const std::string& source);

private:
    std::map<std::string, std::map<std::string, std::string>> sections;
    std::string m_source;

    void read_sections(std::istream& input);

    template<typename T>
    T get_value(const std::string& section, const std::string& key, const T& default_value) const;

    template<typename T>
    T get_required_value(const std::string& section, const std::string& key) const;

    const std::string* find_raw(const std::string& section, const std::string& key) const;
};


template<>
inline std::string ConfigParser::get_value<std::string>(const std::string& section, const std::string& key, const std::string& default_value) const {
    const std::string* raw = find_raw(section, key);
    return raw ? *raw : default_value;
}

template<>
inline int ConfigParser::get_value<int>(const std::string& section, const std::string& key, const int& default_value) const {
    const std::string* raw = find_raw(section, key);
    if (!raw) return default_value;
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(*raw, &used);
    } catch (const std::invalid_argument&) {
        throw std::runtime_error(m_source + ": invalid integer value for " + section + "/" + key + ": " + *raw);
    } catch (const std::out_of_range&) {
        throw std::runtime_error(m_source + ": integer value out of range for " + section + "/" + key + ": " + *raw);
    }
    if (used != raw->size()) {
        throw std::runtime_error(m_source + ": invalid integer value for " + section + "/" + key + ": " + *raw);
    }
    return value;
}

template<>
inline bool ConfigParser::get_value<bool>(const std::string& section, const std::string& key, const bool& default_value) const {
    const std::string* raw = find_raw(section, key);
    if (!raw) return default_value;
    std::string s = to_lower(*raw);
    if (s == "true" || s == "yes" || s == "on" || s == "1") return true;
    if (s == "false" || s == "no" || s == "off" || s == "0") return false;
    throw std::runtime_error(m_source + ": invalid boolean value for " + section + "/" + key + ": " + *raw);
}

template<>
inline InterpolatorType ConfigParser::get_value<InterpolatorType>(const std::string& section, const std::string& key, const InterpolatorType& default_value) const {
    const std::string* raw = find_raw(section, key);
    if (!raw) return default_value;
    try {
        return interpolator_type_from_string(*raw);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(m_source + ": " + section + "/" + key + ": " + e.what());
    }
}


template<typename T>
T ConfigParser::get_required_value(const std::string& section, const std::string& key) const {
    auto sec_it = sections.find(section);
    if (sec_it == sections.end()) {
        throw std::runtime_error(m_source + ": required section missing: [" + section + "]");
    }
    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) {
        throw std::runtime_error(m_source + ": required key '" + key + "' missing in section [" + section + "]");
    }
    return get_value<T>(section, key, T{});
}

} // namespace io
} // namespace Ctess
#endif // Ctess_CONFIG_PARSER_HPP
