#ifndef Ctess_POSITION_HPP
#define Ctess_POSITION_HPP

#include "horizontal_interpolator.hpp"
#include "model/profile.hpp"
#include "core/tess_types.hpp"
#include "core/tess_constants.hpp"
#include <map>
#include <memory>
#include <vector>

namespace Ctess {

class Model;

// Interpolation context for one Model.
//
// A Position is first set to a location (unit vector or lat/lon, radius or
// depth, optionally constrained to a layer) and then queried for values,
// point weights or the horizontal support. Horizontal work is done lazily,
// per tessellation, the first time a query needs it, and is reused until
// the horizontal location or the level limits change: moving only in
// radius never repeats a triangle search.
//
// Not thread-safe. Use one Position per thread; the Model may be shared.
class Position {
public:
    // horizontal is LINEAR or NATURAL_NEIGHBOR, radial LINEAR or CUBIC_SPLINE.
    Position(const Model& model, InterpolatorType horizontal,
             InterpolatorType radial = InterpolatorType::LINEAR);

    Position(const Position&) = delete;
    Position& operator=(const Position&) = delete;

    const Model& get_model() const { return m_model; }
    InterpolatorType get_horizontal_type() const { return m_interpolator->get_type(); }
    InterpolatorType get_radial_type() const { return m_radial; }
    const HorizontalInterpolator& get_interpolator() const { return *m_interpolator; }

    // --- Location ---
    // Without a layer the layer is chosen from the radius: the highest layer
    // of positive thickness whose bottom lies at or below it, layer 0 below
    // the model and the top layer above it.
    void set(const Vec3& unit_vector, real_t radius);
    // With a layer the radius is clamped into that layer.
    void set(int layer, const Vec3& unit_vector, real_t radius);
    // Geographic latitude and longitude (degrees) and depth (km) below the
    // model's earth shape.
    void set_degrees(real_t lat_deg, real_t lon_deg, real_t depth);
    void set_degrees(int layer, real_t lat_deg, real_t lon_deg, real_t depth);

    // Keep the horizontal location (and layer constraint, if any).
    void set_radius(real_t radius);
    void set_depth(real_t depth);

    // Move to the top / bottom of layer at the current or a new location,
    // constrained to that layer.
    void set_top(int layer);
    void set_top(int layer, const Vec3& unit_vector);
    void set_bottom(int layer);
    void set_bottom(int layer, const Vec3& unit_vector);

    bool is_set() const { return m_is_set; }

    // --- Options ---
    // Limits the search on tessellation tess to relative level `level`
    // (clamped to the tessellation's top level).
    void set_max_tess_level(int tess, int level);
    void set_max_tess_level(int level); // all tessellations
    int get_max_tess_level(int tess) const;

    // When false, a radius outside the support profiles' radial range
    // yields NaN values and get_coefficients throws std::out_of_range.
    void set_radius_out_of_range_allowed(bool allowed) { m_radius_out_of_range_allowed = allowed; }
    bool is_radius_out_of_range_allowed() const { return m_radius_out_of_range_allowed; }

    // --- Values ---
    // NaN when a supporting vertex has no data (EMPTY profile) in the layer.
    real_t get_value(int attribute);
    void get_values(std::vector<real_t>& values);

    // Point index -> weight, such that get_value(a) equals the weighted sum
    // of the points' values. Throws std::invalid_argument when a supporting
    // vertex has no data in the layer or one of the points is not active.
    void get_coefficients(std::map<int, real_t>& coefficients);

    // --- Horizontal support (tessellation of the current layer) ---
    const std::vector<int>& get_vertices();
    const std::vector<real_t>& get_horizontal_coefficients();
    int get_triangle();
    int get_tess_level();
    int get_index_of_closest_vertex();

    // --- Location queries ---
    const Vec3& get_unit_vector() const;
    real_t get_radius() const;
    real_t get_depth() const;
    real_t get_earth_radius() const;
    int get_layer_id();

    // Interpolated layer geometry at the current horizontal location.
    real_t get_radius_top();
    real_t get_radius_bottom();
    real_t get_layer_thickness();
    real_t get_radius_top(int layer);
    real_t get_radius_bottom(int layer);
    real_t get_layer_thickness(int layer);

private:
    // Horizontal state of one tessellation.
    struct TessState {
        int triangle = INVALID_INDEX; // last triangle found, also the next walk's start
        int level = INVALID_INDEX;    // relative level of triangle
        bool valid = false;
        std::vector<int> vertices;
        std::vector<real_t> coefficients;
    };

    const Model& m_model;
    std::unique_ptr<HorizontalInterpolator> m_interpolator;
    InterpolatorType m_radial;

    bool m_is_set = false;
    Vec3 m_unit_vector = {0.0, 0.0, 0.0};
    real_t m_radius = NaN;
    int m_layer_constraint = INVALID_INDEX;
    int m_layer = INVALID_INDEX;
    bool m_radius_out_of_range_allowed = true;

    std::vector<TessState> m_tess;
    std::vector<int> m_max_level;
    NodeWeights m_node_weights;

    void require_set() const;
    void check_layer(int layer) const;
    void move_to(const Vec3& unit_vector);
    void select_layer();
    const TessState& horizontal(int tess);
    const TessState& horizontal_of_layer(int layer);
    real_t interpolate_radius(int layer, bool top);
};

} // namespace Ctess

#endif // Ctess_POSITION_HPP
