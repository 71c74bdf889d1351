#include "numerics/vector_unit.hpp"
#include "numerics/earth_shape.hpp"
#include "numerics/cubic_spline.hpp"
#include "core/tess_types.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>

using namespace Ctess;

TEST(VectorUnit, CrossAndTripleProduct) {
    Vec3 x = {1, 0, 0}, y = {0, 1, 0}, z = {0, 0, 1};
    Vec3 c = vector_unit::cross(x, y);
    EXPECT_DOUBLE_EQ(c[2], 1.0);
    EXPECT_DOUBLE_EQ(vector_unit::scalar_triple_product(x, y, z), 1.0);
    EXPECT_DOUBLE_EQ(vector_unit::scalar_triple_product(y, x, z), -1.0);
}

TEST(VectorUnit, AngleIsAccurateNearZeroAndPi) {
    Vec3 a = {1, 0, 0};
    Vec3 b = vector_unit::normalize({1, 1e-9, 0});
    EXPECT_NEAR(vector_unit::angle(a, b), 1e-9, 1e-18);
    EXPECT_NEAR(vector_unit::angle(a, {-1, 0, 0}), PI, 1e-15);
    EXPECT_NEAR(vector_unit::angle_degrees(a, {0, 1, 0}), 90.0, 1e-12);
}

TEST(VectorUnit, CircumcenterIsEquidistantOnTrianglesSide) {
    Vec3 a = vector_unit::vector_degrees(10, 20);
    Vec3 b = vector_unit::vector_degrees(12, 25);
    Vec3 c = vector_unit::vector_degrees(5, 23);
    for (const auto& cc : {vector_unit::circumcenter(a, b, c), vector_unit::circumcenter(a, c, b)}) {
        EXPECT_NEAR(vector_unit::length(cc), 1.0, 1e-14);
        EXPECT_GT(vector_unit::dot(cc, a), 0.0);
        EXPECT_NEAR(vector_unit::dot(cc, a), vector_unit::dot(cc, b), 1e-14);
        EXPECT_NEAR(vector_unit::dot(cc, a), vector_unit::dot(cc, c), 1e-14);
    }
}

TEST(VectorUnit, OctantAreaIsEighthOfSphere) {
    EXPECT_NEAR(vector_unit::triangle_area({1, 0, 0}, {0, 1, 0}, {0, 0, 1}), 4.0 * PI / 8.0, 1e-14);
    // unsigned
    EXPECT_NEAR(vector_unit::triangle_area({0, 1, 0}, {1, 0, 0}, {0, 0, 1}), PI / 2.0, 1e-14);
}

TEST(VectorUnit, LatLonRoundTrip) {
    Vec3 u = vector_unit::vector_degrees(-33.5, 151.25);
    EXPECT_NEAR(vector_unit::lat_degrees(u), -33.5, 1e-12);
    EXPECT_NEAR(vector_unit::lon_degrees(u), 151.25, 1e-12);
}

TEST(EarthShape, SphereHasConstantRadius) {
    EarthShape sphere(EarthShapeType::SPHERE);
    EXPECT_DOUBLE_EQ(sphere.get_earth_radius({0, 0, 1}), EARTH_RADIUS_KM);
    Vec3 u = sphere.get_vector_degrees(45, 10);
    EXPECT_NEAR(u[2], std::sin(45 * DEG_TO_RAD), 1e-15);
    EXPECT_DOUBLE_EQ(sphere.depth_to_radius(u, 100.0), EARTH_RADIUS_KM - 100.0);
}

TEST(EarthShape, Wgs84EquatorAndPole) {
    EarthShape wgs(EarthShapeType::WGS84);
    EXPECT_NEAR(wgs.get_earth_radius({1, 0, 0}), 6378.137, 1e-9);
    EXPECT_NEAR(wgs.get_earth_radius({0, 0, 1}), 6356.752314, 1e-5);
    EarthShape rconst(EarthShapeType::WGS84_RCONST);
    EXPECT_DOUBLE_EQ(rconst.get_earth_radius({0, 0, 1}), EARTH_RADIUS_KM);
}

TEST(EarthShape, GeographicLatitudeRoundTrip) {
    EarthShape wgs(EarthShapeType::WGS84);
    Vec3 u = wgs.get_vector_degrees(40.0, -105.0);
    // geocentric latitude is closer to the equator than geographic latitude
    EXPECT_LT(vector_unit::lat_degrees(u), 40.0);
    EXPECT_NEAR(wgs.get_lat_degrees(u), 40.0, 1e-10);
    EXPECT_NEAR(wgs.get_lon_degrees(u), -105.0, 1e-10);
    EXPECT_NEAR(wgs.get_vector_degrees(90.0, 0.0)[2], 1.0, 1e-15);
}

TEST(EarthShape, NamesParse) {
    EXPECT_EQ(earth_shape_from_string("grs80_rconst"), EarthShapeType::GRS80_RCONST);
    EXPECT_EQ(to_string(EarthShapeType::IERS2003), "IERS2003");
    EXPECT_THROW(earth_shape_from_string("flat"), std::invalid_argument);
}

TEST(TessTypes, InterpolatorAndDataTypeNames) {
    EXPECT_EQ(interpolator_type_from_string("Natural_Neighbor"), InterpolatorType::NATURAL_NEIGHBOR);
    EXPECT_EQ(interpolator_type_from_string("cubic_spline"), InterpolatorType::CUBIC_SPLINE);
    EXPECT_EQ(to_string(InterpolatorType::LINEAR), "linear");
    EXPECT_THROW(interpolator_type_from_string("bilinear"), std::invalid_argument);
    EXPECT_EQ(data_type_from_string("short"), DataType::SHORT);
    EXPECT_THROW(data_type_from_string("half"), std::invalid_argument);
}

TEST(CubicSpline, ReproducesNodesAndStraightLines) {
    std::vector<real_t> x = {0.0, 1.0, 3.0, 3.5, 6.0};
    std::vector<real_t> line, curve;
    for (real_t xi : x) {
        line.push_back(2.0 * xi - 1.0);
        curve.push_back(std::sin(xi));
    }
    auto y2_line = cubic_spline::second_derivatives(x, line);
    auto y2_curve = cubic_spline::second_derivatives(x, curve);
    for (size_t i = 0; i < x.size(); ++i) {
        EXPECT_NEAR(cubic_spline::evaluate(x, curve, y2_curve, x[i]), curve[i], 1e-14);
        EXPECT_NEAR(y2_line[i], 0.0, 1e-13);
    }
    EXPECT_DOUBLE_EQ(y2_curve.front(), 0.0);
    EXPECT_DOUBLE_EQ(y2_curve.back(), 0.0);
    EXPECT_NEAR(cubic_spline::evaluate(x, line, y2_line, 2.2), 3.4, 1e-13);
}

TEST(CubicSpline, WeightsReproduceEvaluation) {
    std::vector<real_t> x = {0.0, 0.5, 2.0, 2.5, 4.0, 5.0};
    std::vector<real_t> y = {1.0, -2.0, 0.5, 3.0, 2.0, -1.0};
    auto y2 = cubic_spline::second_derivatives(x, y);
    std::vector<real_t> w;
    for (real_t xq : {0.0, 0.3, 1.7, 2.5, 3.1, 4.9, 5.0}) {
        cubic_spline::weights(x, xq, w);
        ASSERT_EQ(w.size(), x.size());
        real_t value = 0.0, sum = 0.0;
        for (size_t k = 0; k < w.size(); ++k) {
            value += w[k] * y[k];
            sum += w[k];
        }
        EXPECT_NEAR(value, cubic_spline::evaluate(x, y, y2, xq), 1e-12) << "xq = " << xq;
        EXPECT_NEAR(sum, 1.0, 1e-12);
    }
}

TEST(CubicSpline, RejectsBadInput) {
    EXPECT_THROW(cubic_spline::second_derivatives({1.0}, {1.0}), std::invalid_argument);
    EXPECT_THROW(cubic_spline::second_derivatives({1.0, 2.0}, {1.0}), std::invalid_argument);
    EXPECT_TRUE(cubic_spline::is_strictly_increasing({1.0, 2.0, 3.0}));
    EXPECT_FALSE(cubic_spline::is_strictly_increasing({1.0, 2.0, 2.0}));
}
