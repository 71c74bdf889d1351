#ifndef Ctess_VECTOR_UNIT_HPP
#define Ctess_VECTOR_UNIT_HPP

#include "core/tess_types.hpp"
#include "core/tess_constants.hpp"
#include <vector>

namespace Ctess {
namespace vector_unit {

// --- Elementary vector algebra on 3-component vectors ---
inline real_t dot(const Vec3& a, const Vec3& b) {
    return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

inline Vec3 cross(const Vec3& a, const Vec3& b) {
    return {a[1] * b[2] - a[2] * b[1],
            a[2] * b[0] - a[0] * b[2],
            a[0] * b[1] - a[1] * b[0]};
}

// (a x b) . c, positive when a, b, c are counter-clockwise seen from outside.
inline real_t scalar_triple_product(const Vec3& a, const Vec3& b, const Vec3& c) {
    return dot(cross(a, b), c);
}

real_t length(const Vec3& v);

// Returns the zero vector if v has zero length.
Vec3 normalize(const Vec3& v);

// Angle in radians between two unit vectors, in [0, PI].
real_t angle(const Vec3& u, const Vec3& v);
real_t angle_degrees(const Vec3& u, const Vec3& v);

// --- Spherical triangle geometry (all inputs are unit vectors) ---

// Center of the circle through a, b and c on the unit sphere. Of the two
// antipodal candidates the one on the same side as the triangle is returned.
Vec3 circumcenter(const Vec3& a, const Vec3& b, const Vec3& c);

// Area (steradians, always >= 0) of the spherical triangle a, b, c.
real_t triangle_area(const Vec3& a, const Vec3& b, const Vec3& c);

// Normalized mean of the supplied unit vectors.
Vec3 center(const Vec3& a, const Vec3& b, const Vec3& c);

// --- Geocentric coordinates on a sphere (degrees) ---
Vec3 vector_degrees(real_t lat_deg, real_t lon_deg);
real_t lat_degrees(const Vec3& u);
real_t lon_degrees(const Vec3& u);

} // namespace vector_unit
} // namespace Ctess

#endif // Ctess_VECTOR_UNIT_HPP
