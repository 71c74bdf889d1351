#ifndef Ctess_EARTH_SHAPE_HPP
#define Ctess_EARTH_SHAPE_HPP

#include "core/tess_types.hpp"
#include "core/tess_constants.hpp"
#include <string>

namespace Ctess {

// Reference shapes used to convert between geographic coordinates, unit
// vectors, depth and radius.
//   SPHERE            sphere of radius 6371 km
//   GRS80, WGS84,
//   IERS2003          ellipsoids: ellipsoidal radius and geographic latitudes
//   *_RCONST          ellipsoidal latitudes but a constant 6371 km radius
enum class EarthShapeType {
    SPHERE,
    GRS80,
    GRS80_RCONST,
    WGS84,
    WGS84_RCONST,
    IERS2003,
    IERS2003_RCONST
};

std::string to_string(EarthShapeType type);
EarthShapeType earth_shape_from_string(const std::string& s);

class EarthShape {
public:
    explicit EarthShape(EarthShapeType type = EarthShapeType::WGS84);

    EarthShapeType get_type() const { return m_type; }
    std::string get_name() const { return to_string(m_type); }

    // Radius of the Earth (km) beneath unit vector u.
    real_t get_earth_radius(const Vec3& u) const;

    // Geographic latitude / longitude (degrees) <-> unit vector.
    Vec3 get_vector_degrees(real_t lat_deg, real_t lon_deg) const;
    real_t get_lat_degrees(const Vec3& u) const;
    real_t get_lon_degrees(const Vec3& u) const;

    real_t get_geocentric_lat(real_t geographic_lat) const;  // radians
    real_t get_geographic_lat(real_t geocentric_lat) const;  // radians

    real_t depth_to_radius(const Vec3& u, real_t depth) const { return get_earth_radius(u) - depth; }
    real_t radius_to_depth(const Vec3& u, real_t radius) const { return get_earth_radius(u) - radius; }

    std::string get_lat_lon_string(const Vec3& u) const;

private:
    EarthShapeType m_type;
    real_t m_equatorial_radius; // km
    real_t m_e2;                // squared eccentricity
    bool m_constant_radius;
};

} // namespace Ctess

#endif // Ctess_EARTH_SHAPE_HPP
