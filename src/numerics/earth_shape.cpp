#include "earth_shape.hpp"
#include "vector_unit.hpp"
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace Ctess {

std::string to_string(EarthShapeType type) {
    switch (type) {
        case EarthShapeType::SPHERE: return "SPHERE";
        case EarthShapeType::GRS80: return "GRS80";
        case EarthShapeType::GRS80_RCONST: return "GRS80_RCONST";
        case EarthShapeType::WGS84: return "WGS84";
        case EarthShapeType::WGS84_RCONST: return "WGS84_RCONST";
        case EarthShapeType::IERS2003: return "IERS2003";
        case EarthShapeType::IERS2003_RCONST: return "IERS2003_RCONST";
        default: return "UNKNOWN";
    }
}

EarthShapeType earth_shape_from_string(const std::string& s_in) {
    std::string s = to_lower(s_in);
    if (s == "sphere") return EarthShapeType::SPHERE;
    if (s == "grs80") return EarthShapeType::GRS80;
    if (s == "grs80_rconst") return EarthShapeType::GRS80_RCONST;
    if (s == "wgs84") return EarthShapeType::WGS84;
    if (s == "wgs84_rconst") return EarthShapeType::WGS84_RCONST;
    if (s == "iers2003") return EarthShapeType::IERS2003;
    if (s == "iers2003_rconst") return EarthShapeType::IERS2003_RCONST;
    throw std::invalid_argument("Unknown earth shape string: " + s_in);
}

EarthShape::EarthShape(EarthShapeType type)
    : m_type(type), m_equatorial_radius(EARTH_RADIUS_KM), m_e2(0.0), m_constant_radius(false) {
    real_t inverse_flattening = 0.0;
    switch (type) {
        case EarthShapeType::SPHERE:
            break;
        case EarthShapeType::GRS80:
        case EarthShapeType::GRS80_RCONST:
            m_equatorial_radius = 6378.137;
            inverse_flattening = 298.257222101;
            break;
        case EarthShapeType::WGS84:
        case EarthShapeType::WGS84_RCONST:
            m_equatorial_radius = 6378.137;
            inverse_flattening = 298.257223563;
            break;
        case EarthShapeType::IERS2003:
        case EarthShapeType::IERS2003_RCONST:
            m_equatorial_radius = 6378.1366;
            inverse_flattening = 298.25642;
            break;
    }
    if (inverse_flattening > 0.0) {
        real_t f = 1.0 / inverse_flattening;
        m_e2 = f * (2.0 - f);
    }
    m_constant_radius = type == EarthShapeType::GRS80_RCONST
                     || type == EarthShapeType::WGS84_RCONST
                     || type == EarthShapeType::IERS2003_RCONST;
}

real_t EarthShape::get_earth_radius(const Vec3& u) const {
    if (m_constant_radius || m_e2 == 0.0) {
        return m_constant_radius ? EARTH_RADIUS_KM : m_equatorial_radius;
    }
    // u[2] is the sine of the geocentric latitude.
    real_t cos2 = 1.0 - u[2] * u[2];
    return m_equatorial_radius * std::sqrt(1.0 - m_e2) / std::sqrt(1.0 - m_e2 * cos2);
}

real_t EarthShape::get_geocentric_lat(real_t geographic_lat) const {
    return std::atan((1.0 - m_e2) * std::tan(geographic_lat));
}

real_t EarthShape::get_geographic_lat(real_t geocentric_lat) const {
    return std::atan(std::tan(geocentric_lat) / (1.0 - m_e2));
}

Vec3 EarthShape::get_vector_degrees(real_t lat_deg, real_t lon_deg) const {
    real_t lat = lat_deg * DEG_TO_RAD;
    // tan() is singular at the poles; the latitude is unchanged there.
    if (std::abs(lat_deg) < 90.0) {
        lat = get_geocentric_lat(lat);
    }
    real_t lon = lon_deg * DEG_TO_RAD;
    return {std::cos(lat) * std::cos(lon), std::cos(lat) * std::sin(lon), std::sin(lat)};
}

real_t EarthShape::get_lat_degrees(const Vec3& u) const {
    real_t geocentric = std::atan2(u[2], std::sqrt(u[0] * u[0] + u[1] * u[1]));
    if (std::abs(geocentric) >= PI / 2.0) {
        return geocentric * RAD_TO_DEG;
    }
    return get_geographic_lat(geocentric) * RAD_TO_DEG;
}

real_t EarthShape::get_lon_degrees(const Vec3& u) const {
    return vector_unit::lon_degrees(u);
}

std::string EarthShape::get_lat_lon_string(const Vec3& u) const {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%9.5f %10.5f", get_lat_degrees(u), get_lon_degrees(u));
    return std::string(buf);
}

} // namespace Ctess
