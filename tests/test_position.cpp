#include "test_fixtures.hpp"
#include "interp/position.hpp"
#include "model/model.hpp"
#include "numerics/vector_unit.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace Ctess;
using namespace ctess_test;

class PositionTest : public ::testing::TestWithParam<InterpolatorType> {
protected:
    void SetUp() override {
        m_grid = make_grid(2);
        m_model = make_layered_model(m_grid);
        m_position = m_model->get_position(GetParam());
    }

    std::shared_ptr<const Grid> m_grid;
    std::unique_ptr<Model> m_model;
    std::unique_ptr<Position> m_position;
};

TEST_P(PositionTest, StartsUnset) {
    EXPECT_FALSE(m_position->is_set());
    EXPECT_THROW(m_position->get_value(0), std::invalid_argument);
    EXPECT_THROW(m_position->get_radius(), std::invalid_argument);
    EXPECT_THROW(m_position->set_radius(5000.0), std::invalid_argument);
    EXPECT_THROW(m_position->set_top(1), std::invalid_argument);
    EXPECT_EQ(m_position->get_horizontal_type(), GetParam());
    EXPECT_EQ(m_position->get_radial_type(), InterpolatorType::LINEAR);
}

TEST_P(PositionTest, ExactAtGridNodes) {
    for (int v = 0; v < m_grid->get_n_vertices(); v += 7) {
        const Vec3& u = m_grid->get_vertex(v);
        for (int l = 0; l < 3; ++l) {
            const Profile& profile = m_model->get_profile(v, l);
            for (int k = 0; k < profile.get_n_radii(); ++k) {
                m_position->set(l, u, profile.get_radius(k));
                EXPECT_EQ(m_position->get_value(0), m_model->get_value(v, l, k, 0));
                EXPECT_EQ(m_position->get_index_of_closest_vertex(), v);
                ASSERT_EQ(m_position->get_vertices().size(), 1u);
            }
        }
    }
}

TEST_P(PositionTest, ReproducesRadiallyLinearModel) {
    std::mt19937 rng(23);
    std::uniform_real_distribution<real_t> radius(10.0, 6370.0);
    std::vector<real_t> values;
    for (int trial = 0; trial < 50; ++trial) {
        Vec3 u = random_unit_vector(rng);
        real_t r = radius(rng);
        m_position->set(u, r);
        int layer = r < 3480.0 ? 0 : (r < 6341.0 ? 1 : 2);
        EXPECT_EQ(m_position->get_layer_id(), layer);
        EXPECT_NEAR(m_position->get_value(0), layered_vp(layer, r), 1e-9);
        m_position->get_values(values);
        ASSERT_EQ(values.size(), 2u);
        EXPECT_NEAR(values[1], 2.0 * layered_vp(layer, r), 1e-9);

        real_t sum = 0.0;
        for (real_t c : m_position->get_horizontal_coefficients()) sum += c;
        EXPECT_NEAR(sum, 1.0, 1e-9);
        EXPECT_TRUE(m_grid->contains(m_position->get_triangle(), u));
    }
}

TEST_P(PositionTest, LayerSelectionAtInterfacesAndBeyond) {
    Vec3 u = vector_unit::vector_degrees(10.0, 20.0);
    m_position->set(u, 3480.001);
    EXPECT_EQ(m_position->get_layer_id(), 1);
    m_position->set(u, 3479.9);
    EXPECT_EQ(m_position->get_layer_id(), 0);
    m_position->set(u, 7000.0);
    EXPECT_EQ(m_position->get_layer_id(), 2);
    EXPECT_NEAR(m_position->get_value(0), layered_vp(2, 6371.f), 1e-9);
    m_position->set(u, -5.0);
    EXPECT_EQ(m_position->get_layer_id(), 0);
    m_position->set_radius(6000.0);
    EXPECT_EQ(m_position->get_layer_id(), 1);
}

TEST_P(PositionTest, LayerConstraintClampsRadius) {
    Vec3 u = vector_unit::vector_degrees(-35.0, 140.0);
    m_position->set(2, u, 5000.0);
    EXPECT_EQ(m_position->get_layer_id(), 2);
    EXPECT_DOUBLE_EQ(m_position->get_radius(), 5000.0);
    EXPECT_NEAR(m_position->get_value(0), layered_vp(2, 6341.f), 1e-9);
    m_position->set_radius(6500.0);
    EXPECT_EQ(m_position->get_layer_id(), 2);
    EXPECT_NEAR(m_position->get_value(0), layered_vp(2, 6371.f), 1e-9);

    m_position->set_radius_out_of_range_allowed(false);
    EXPECT_TRUE(std::isnan(m_position->get_value(0)));
    std::map<int, real_t> coefficients;
    EXPECT_THROW(m_position->get_coefficients(coefficients), std::out_of_range);
    EXPECT_TRUE(coefficients.empty());
    EXPECT_THROW(m_position->set(3, u, 5000.0), std::out_of_range);
}

TEST_P(PositionTest, TopAndBottomOfLayers) {
    Vec3 u = vector_unit::vector_degrees(55.0, -3.0);
    m_position->set(u, 5000.0);
    m_position->set_top(1);
    EXPECT_NEAR(m_position->get_radius(), 6341.0, 1e-3);
    EXPECT_EQ(m_position->get_layer_id(), 1);
    EXPECT_NEAR(m_position->get_value(0), layered_vp(1, 6341.f), 1e-9);
    m_position->set_bottom(2);
    EXPECT_NEAR(m_position->get_value(0), layered_vp(2, 6341.f), 1e-9);
    EXPECT_NEAR(m_position->get_layer_thickness(), 30.0, 1e-3);
    EXPECT_NEAR(m_position->get_radius_top(0), 3480.0, 1e-3);
    EXPECT_NEAR(m_position->get_radius_bottom(0), 0.0, 1e-9);
    EXPECT_NEAR(m_position->get_layer_thickness(1), 2861.0, 1e-3);

    Vec3 w = vector_unit::vector_degrees(-10.0, 80.0);
    m_position->set_bottom(1, w);
    EXPECT_EQ(m_position->get_unit_vector(), w);
    EXPECT_NEAR(m_position->get_radius(), 3480.0, 1e-3);
    EXPECT_THROW(m_position->set_top(5, w), std::out_of_range);
}

TEST_P(PositionTest, CoefficientsMatchValue) {
    std::mt19937 rng(41);
    std::map<int, real_t> coefficients;
    for (int trial = 0; trial < 30; ++trial) {
        Vec3 u = random_unit_vector(rng);
        m_position->set(u, 1000.0 + 180.0 * trial);
        m_position->get_coefficients(coefficients);
        real_t value = 0.0;
        real_t sum = 0.0;
        for (const auto& c : coefficients) {
            value += c.second * m_model->get_value_by_point(c.first, 0);
            sum += c.second;
        }
        EXPECT_NEAR(sum, 1.0, 1e-9);
        EXPECT_NEAR(value, m_position->get_value(0), 1e-9);
    }
}

TEST_P(PositionTest, DepthUsesEarthShape) {
    m_position->set_degrees(0.0, 90.0, 100.0);
    EXPECT_NEAR(m_position->get_radius(), EARTH_RADIUS_KM - 100.0, 1e-9);
    EXPECT_NEAR(m_position->get_depth(), 100.0, 1e-9);
    EXPECT_NEAR(m_position->get_unit_vector()[1], 1.0, 1e-15);
    EXPECT_DOUBLE_EQ(m_position->get_earth_radius(), EARTH_RADIUS_KM);
    m_position->set_depth(2000.0);
    EXPECT_EQ(m_position->get_layer_id(), 1);
    EXPECT_NEAR(m_position->get_radius(), EARTH_RADIUS_KM - 2000.0, 1e-9);
    m_position->set_degrees(0, 0.0, 90.0, 100.0);
    EXPECT_EQ(m_position->get_layer_id(), 0);
}

TEST_P(PositionTest, EmptySupportProfile) {
    Vec3 u = vector_unit::vector_degrees(12.0, 34.0);
    m_position->set(1, u, 5000.0);
    std::vector<int> support = m_position->get_vertices();
    for (int v : support) {
        m_model->set_profile(v, 1, Profile::make_empty(3480.f, 6341.f));
    }
    m_position->set(1, u, 5000.0);
    EXPECT_TRUE(std::isnan(m_position->get_value(0)));
    std::vector<real_t> values;
    m_position->get_values(values);
    EXPECT_TRUE(std::isnan(values[1]));
    std::map<int, real_t> coefficients;
    EXPECT_THROW(m_position->get_coefficients(coefficients), std::invalid_argument);
    EXPECT_TRUE(coefficients.empty());
    EXPECT_THROW(m_position->get_value(2), std::out_of_range);
}

TEST_P(PositionTest, MaxTessLevelLimitsTheSearch) {
    Vec3 u = vector_unit::vector_degrees(33.0, 44.0);
    m_position->set(u, 5000.0);
    EXPECT_EQ(m_position->get_tess_level(), 2);
    m_position->set_max_tess_level(0);
    EXPECT_EQ(m_position->get_max_tess_level(0), 0);
    EXPECT_EQ(m_position->get_tess_level(), 0);
    EXPECT_LT(m_position->get_triangle(), 20);
    EXPECT_TRUE(m_grid->contains(m_position->get_triangle(), u));
    EXPECT_NEAR(m_position->get_value(0), layered_vp(1, 5000.0), 1e-9);
    m_position->set_max_tess_level(0, 10);
    EXPECT_EQ(m_position->get_max_tess_level(0), 2);
    EXPECT_THROW(m_position->set_max_tess_level(1, 0), std::out_of_range);
    EXPECT_THROW(m_position->set_max_tess_level(-1), std::out_of_range);
}

TEST_P(PositionTest, RadiusChangeKeepsHorizontalSupport) {
    Vec3 u = vector_unit::vector_degrees(-20.0, -60.0);
    m_position->set(u, 4000.0);
    std::vector<int> vertices = m_position->get_vertices();
    std::vector<real_t> coefficients = m_position->get_horizontal_coefficients();
    m_position->set_radius(4100.0);
    EXPECT_EQ(m_position->get_vertices(), vertices);
    EXPECT_EQ(m_position->get_horizontal_coefficients(), coefficients);
    m_position->set(u, 6000.0);
    EXPECT_EQ(m_position->get_horizontal_coefficients(), coefficients);
}

INSTANTIATE_TEST_SUITE_P(Horizontal, PositionTest,
                         ::testing::Values(InterpolatorType::LINEAR, InterpolatorType::NATURAL_NEIGHBOR));

TEST(Position, CubicSplineRadialInterpolation) {
    auto model = make_layered_model(make_grid(1));
    auto position = model->get_position(InterpolatorType::LINEAR, InterpolatorType::CUBIC_SPLINE);
    EXPECT_EQ(position->get_radial_type(), InterpolatorType::CUBIC_SPLINE);
    Vec3 u = vector_unit::vector_degrees(1.0, 2.0);
    position->set(u, 5123.0);
    EXPECT_NEAR(position->get_value(0), layered_vp(1, 5123.0), 1e-9);

    std::map<int, real_t> coefficients;
    position->get_coefficients(coefficients);
    real_t value = 0.0;
    for (const auto& c : coefficients) value += c.second * model->get_value_by_point(c.first, 0);
    EXPECT_NEAR(value, position->get_value(0), 1e-9);

    EXPECT_THROW(model->get_position(InterpolatorType::LINEAR, InterpolatorType::NATURAL_NEIGHBOR),
                 std::invalid_argument);
    EXPECT_THROW(model->get_position(InterpolatorType::CUBIC_SPLINE), std::invalid_argument);
}

TEST(Position, SurfaceModelIgnoresRadius) {
    auto grid = make_grid(3);
    auto model = make_surface_model(grid);
    auto position = model->get_position(InterpolatorType::NATURAL_NEIGHBOR);
    std::mt19937 rng(2);
    for (int trial = 0; trial < 20; ++trial) {
        Vec3 u = random_unit_vector(rng);
        position->set(u, 1e5);
        EXPECT_EQ(position->get_layer_id(), 0);
        EXPECT_NEAR(position->get_value(0), smooth_function(u), 1e-2);
    }
}

TEST(Position, LayersOnDifferentTessellations) {
    auto grid = make_grid(2, true);
    ModelMetaData md;
    md.set_layers({"lower", "upper"}, {0, 1});
    md.set_attributes({"x"}, {"u"});
    md.set_data_type(DataType::DOUBLE);
    md.set_earth_shape(EarthShapeType::SPHERE);
    Model model(grid, md);
    for (int v = 0; v < model.get_n_vertices(); ++v) {
        Data d(DataType::DOUBLE, std::vector<real_t>{static_cast<real_t>(v)});
        model.set_profile(v, 0, Profile::make_constant(3000.f, 5000.f, d));
        model.set_profile(v, 1, Profile::make_constant(5000.f, 6371.f, d));
    }
    auto position = model.get_position(InterpolatorType::LINEAR);
    Vec3 u = vector_unit::vector_degrees(5.0, 5.0);
    position->set(u, 6000.0);
    EXPECT_EQ(position->get_layer_id(), 1);
    EXPECT_EQ(position->get_tess_level(), 0);
    EXPECT_EQ(grid->get_level_of_triangle(position->get_triangle()), 3);
    for (int v : position->get_vertices()) EXPECT_LT(v, 12);

    position->set_radius(4000.0);
    EXPECT_EQ(position->get_layer_id(), 0);
    EXPECT_EQ(position->get_tess_level(), 2);
    EXPECT_EQ(grid->get_level_of_triangle(position->get_triangle()), 2);
}

TEST(Position, IcosahedronRoundTrip) {
    auto grid = make_grid(0);
    auto model = make_surface_model(grid);
    auto position = model->get_position(InterpolatorType::LINEAR);
    for (int v = 0; v < grid->get_n_vertices(); ++v) {
        position->set(grid->get_vertex(v), EARTH_RADIUS_KM);
        EXPECT_EQ(position->get_value(0), model->get_value(v, 0));
    }
    for (int t = 0; t < grid->get_n_triangles(); ++t) {
        const auto& corners = grid->get_triangle_vertices(t);
        real_t lo = 1e30, hi = -1e30;
        for (int c : corners) {
            lo = std::min(lo, model->get_value(c, 0));
            hi = std::max(hi, model->get_value(c, 0));
        }
        position->set(vector_unit::center(grid->get_vertex(corners[0]), grid->get_vertex(corners[1]),
                                          grid->get_vertex(corners[2])), EARTH_RADIUS_KM);
        real_t value = position->get_value(0);
        EXPECT_GE(value, lo - 1e-12);
        EXPECT_LE(value, hi + 1e-12);
    }
}

TEST(Position, RadialValuesAreMonotonic) {
    auto model = make_layered_model(make_grid(1));
    for (auto radial : {InterpolatorType::LINEAR, InterpolatorType::CUBIC_SPLINE}) {
        auto position = model->get_position(InterpolatorType::NATURAL_NEIGHBOR, radial);
        Vec3 u = vector_unit::vector_degrees(-12.0, 77.0);
        real_t previous = -1e30;
        for (real_t r = 3480.0; r <= 6341.0; r += 25.0) {
            position->set(1, u, r);
            real_t value = position->get_value(0);
            EXPECT_GE(value, previous);
            previous = value;
        }
    }
}
