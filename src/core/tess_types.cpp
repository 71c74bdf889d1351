#include "tess_types.hpp"
#include <stdexcept>
#include <algorithm> // For std::transform
#include <cctype>

namespace Ctess {

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string to_string(InterpolatorType type) {
    switch (type) {
        case InterpolatorType::LINEAR: return "linear";
        case InterpolatorType::NATURAL_NEIGHBOR: return "natural_neighbor";
        case InterpolatorType::CUBIC_SPLINE: return "cubic_spline";
        default: return "unknown";
    }
}

InterpolatorType interpolator_type_from_string(const std::string& s_in) {
    std::string s = to_lower(s_in);
    if (s == "linear") return InterpolatorType::LINEAR;
    if (s == "natural_neighbor" || s == "naturalneighbor" || s == "nn") return InterpolatorType::NATURAL_NEIGHBOR;
    if (s == "cubic_spline" || s == "cubicspline") return InterpolatorType::CUBIC_SPLINE;
    throw std::invalid_argument("Unknown interpolator type string: " + s_in);
}

std::string to_string(DataType type) {
    switch (type) {
        case DataType::DOUBLE: return "double";
        case DataType::FLOAT: return "float";
        case DataType::LONG: return "long";
        case DataType::INT: return "int";
        case DataType::SHORT: return "short";
        case DataType::BYTE: return "byte";
        default: return "unknown";
    }
}

DataType data_type_from_string(const std::string& s_in) {
    std::string s = to_lower(s_in);
    if (s == "double") return DataType::DOUBLE;
    if (s == "float") return DataType::FLOAT;
    if (s == "long") return DataType::LONG;
    if (s == "int") return DataType::INT;
    if (s == "short") return DataType::SHORT;
    if (s == "byte") return DataType::BYTE;
    throw std::invalid_argument("Unknown data type string: " + s_in);
}

} // namespace Ctess
