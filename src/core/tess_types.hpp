#ifndef Ctess_TESS_TYPES_HPP
#define Ctess_TESS_TYPES_HPP

#include "tess_constants.hpp"
#include <array>
#include <vector>
#include <string>

namespace Ctess {

// 3D Cartesian vector; unit vectors on the sphere use the same type.
using Vec3 = std::array<real_t, 3>;

// Horizontal (2D) and radial (1D) interpolation strategies.
enum class InterpolatorType {
    LINEAR,
    NATURAL_NEIGHBOR,
    CUBIC_SPLINE
};

std::string to_string(InterpolatorType type);
InterpolatorType interpolator_type_from_string(const std::string& s);

// Storage type shared by every Data object of a model.
enum class DataType : char {
    DOUBLE,
    FLOAT,
    LONG,
    INT,
    SHORT,
    BYTE
};

std::string to_string(DataType type);
DataType data_type_from_string(const std::string& s);

// Lowercase copy, used by the *_from_string parsers.
std::string to_lower(const std::string& s);

} // namespace Ctess

#endif // Ctess_TESS_TYPES_HPP
