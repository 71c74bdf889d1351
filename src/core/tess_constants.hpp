#ifndef Ctess_TESS_CONSTANTS_HPP
#define Ctess_TESS_CONSTANTS_HPP

#include <cstddef> // For size_t
#include <limits>  // For std::numeric_limits

namespace Ctess {

// Basic data types
using real_t = double;

// Mathematical Constants
constexpr real_t PI = 3.14159265358979323846;
constexpr real_t DEG_TO_RAD = PI / 180.0;
constexpr real_t RAD_TO_DEG = 180.0 / PI;
constexpr real_t NaN = std::numeric_limits<real_t>::quiet_NaN();

// Physical Constants
constexpr real_t EARTH_RADIUS_KM = 6371.0; // kilometers

// A query point whose dot product with a grid vertex exceeds this value
// is treated as coincident with that vertex (angular separation < 1e-7 rad).
// Equals cos(1e-7) to double precision.
constexpr real_t VERTEX_HIT_COS = 1.0 - 5.0e-15;

// Boundary radii of adjacent layers may disagree by up to this much (km)
// before the model is rejected; smaller mismatches are repaired.
constexpr real_t LAYER_RADIUS_TOLERANCE_KM = 0.01;

constexpr int INVALID_INDEX = -1;

} // namespace Ctess

#endif // Ctess_TESS_CONSTANTS_HPP
