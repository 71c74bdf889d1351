#include "config_parser.hpp"
#include <fstream>

namespace Ctess {
namespace io {

ModelConfig ConfigParser::parse(const std::string& filename) {
    std::ifstream infile(filename);
    if (!infile.is_open()) {
        throw std::runtime_error("Failed to open config file: " + filename);
    }
    return parse(infile, filename);
}

ModelConfig ConfigParser::parse(std::istream& input, const std::string& source) {
    m_source = source;
    read_sections(input);

    ModelConfig config;
    config.model_path = get_required_value<std::string>("Model", "file_path");
    if (config.model_path.empty()) {
        throw std::runtime_error(m_source + ": Model/file_path is empty.");
    }
    config.grid_directory = get_value<std::string>("Model", "grid_directory", "");

    config.horizontal = get_value<InterpolatorType>("Interpolation", "horizontal", InterpolatorType::LINEAR);
    if (config.horizontal == InterpolatorType::CUBIC_SPLINE) {
        throw std::runtime_error(m_source + ": Interpolation/horizontal must be linear or natural_neighbor.");
    }
    config.radial = get_value<InterpolatorType>("Interpolation", "radial", InterpolatorType::LINEAR);
    if (config.radial == InterpolatorType::NATURAL_NEIGHBOR) {
        throw std::runtime_error(m_source + ": Interpolation/radial must be linear or cubic_spline.");
    }
    config.radius_out_of_range_allowed = get_value<bool>("Interpolation", "radius_out_of_range_allowed", true);
    config.max_tess_level = get_value<int>("Interpolation", "max_tess_level", -1);
    if (config.max_tess_level < -1) {
        throw std::runtime_error(m_source + ": Interpolation/max_tess_level must be >= 0.");
    }

    config.verbose = get_value<bool>("Logging", "verbose", false);
    return config;
}

void ConfigParser::read_sections(std::istream& input) {
    sections.clear();
    std::string line;
    std::string current_section;
    int line_number = 0;

    while (std::getline(input, line)) {
        line_number++;
        line = trim_string(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') { // Skip empty lines and comments
            continue;
        }

        if (line[0] == '[' && line.back() == ']') { // Section header
            current_section = trim_string(line.substr(1, line.length() - 2));
            if (current_section.empty()) {
                throw std::runtime_error("Syntax error in config file " + m_source + " at line " + std::to_string(line_number) + ": Empty section name.");
            }
            sections[current_section];
        } else if (!current_section.empty()) { // Key-value pair
            size_t delimiter_pos = line.find('=');
            if (delimiter_pos == std::string::npos) {
                throw std::runtime_error("Syntax error in config file " + m_source + " at line " + std::to_string(line_number) + ": Missing '=' in key-value pair in section [" + current_section + "].");
            }
            std::string key = trim_string(line.substr(0, delimiter_pos));
            std::string value = trim_string(line.substr(delimiter_pos + 1));
            if (key.empty()) {
                throw std::runtime_error("Syntax error in config file " + m_source + " at line " + std::to_string(line_number) + ": Empty key name in section [" + current_section + "].");
            }
            sections[current_section][key] = value;
        } else {
            throw std::runtime_error("Syntax error in config file " + m_source + " at line " + std::to_string(line_number) + ": Key-value pair outside of any section.");
        }
    }
}

const std::string* ConfigParser::find_raw(const std::string& section, const std::string& key) const {
    auto sec_it = sections.find(section);
    if (sec_it == sections.end()) return nullptr;
    auto key_it = sec_it->second.find(key);
    return key_it == sec_it->second.end() ? nullptr : &key_it->second;
}

} // namespace io
} // namespace Ctess
