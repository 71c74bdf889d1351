#include "vector_unit.hpp"
#include <cmath>     // For sqrt, atan2, asin, acos

namespace Ctess {
namespace vector_unit {

real_t length(const Vec3& v) {
    return std::sqrt(dot(v, v));
}

Vec3 normalize(const Vec3& v) {
    real_t len = length(v);
    if (len == 0.0) {
        return {0.0, 0.0, 0.0};
    }
    return {v[0] / len, v[1] / len, v[2] / len};
}

real_t angle(const Vec3& u, const Vec3& v) {
    // atan2 of |u x v| and u.v is accurate for both tiny and near-PI angles,
    // where acos(u.v) loses precision.
    return std::atan2(length(cross(u, v)), dot(u, v));
}

real_t angle_degrees(const Vec3& u, const Vec3& v) {
    return angle(u, v) * RAD_TO_DEG;
}

Vec3 circumcenter(const Vec3& a, const Vec3& b, const Vec3& c) {
    Vec3 ab = {b[0] - a[0], b[1] - a[1], b[2] - a[2]};
    Vec3 ac = {c[0] - a[0], c[1] - a[1], c[2] - a[2]};
    Vec3 cc = normalize(cross(ab, ac));
    // The normal of the plane through a, b, c points to the circle's center
    // or to its antipode depending on the winding of the three points.
    if (dot(cc, a) < 0.0) {
        cc[0] = -cc[0];
        cc[1] = -cc[1];
        cc[2] = -cc[2];
    }
    return cc;
}

real_t triangle_area(const Vec3& a, const Vec3& b, const Vec3& c) {
    // Eriksson (1990): tan(E/2) = |a.(b x c)| / (1 + a.b + b.c + c.a)
    real_t numerator = std::abs(scalar_triple_product(a, b, c));
    real_t denominator = 1.0 + dot(a, b) + dot(b, c) + dot(c, a);
    return 2.0 * std::atan2(numerator, denominator);
}

Vec3 center(const Vec3& a, const Vec3& b, const Vec3& c) {
    return normalize({a[0] + b[0] + c[0], a[1] + b[1] + c[1], a[2] + b[2] + c[2]});
}

Vec3 vector_degrees(real_t lat_deg, real_t lon_deg) {
    real_t lat = lat_deg * DEG_TO_RAD;
    real_t lon = lon_deg * DEG_TO_RAD;
    return {std::cos(lat) * std::cos(lon), std::cos(lat) * std::sin(lon), std::sin(lat)};
}

real_t lat_degrees(const Vec3& u) {
    return std::atan2(u[2], std::sqrt(u[0] * u[0] + u[1] * u[1])) * RAD_TO_DEG;
}

real_t lon_degrees(const Vec3& u) {
    return std::atan2(u[1], u[0]) * RAD_TO_DEG;
}

} // namespace vector_unit
} // namespace Ctess
