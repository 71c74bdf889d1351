#ifndef Ctess_MODEL_HPP
#define Ctess_MODEL_HPP

#include "profile.hpp"
#include "model_metadata.hpp"
#include "point_map.hpp"
#include "active_region.hpp"
#include "grid/grid.hpp"
#include "numerics/earth_shape.hpp"
#include "core/tess_types.hpp"
#include <array>
#include <map>
#include <memory>
#include <vector>

namespace Ctess {

class Position;

// A grid plus one Profile per (vertex, layer).
//
// Models are populated during a setup phase (set_profile, set_value,
// test_model_integrity, set_active_region) and are read-only afterwards,
// when any number of threads may query them, each through its own Position.
class Model {
public:
    Model(std::shared_ptr<const Grid> grid, const ModelMetaData& metadata);

    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;

    const Grid& get_grid() const { return *m_grid; }
    std::shared_ptr<const Grid> get_grid_ptr() const { return m_grid; }
    const ModelMetaData& get_metadata() const { return m_metadata; }
    const EarthShape& get_earth_shape() const { return m_earth_shape; }

    int get_n_vertices() const { return m_grid->get_n_vertices(); }
    int get_n_layers() const { return m_metadata.get_n_layers(); }
    int get_n_attributes() const { return m_metadata.get_n_attributes(); }
    int get_tessellation(int layer) const { return m_metadata.get_tessellation(layer); }

    // True when profiles are SURFACE or SURFACE_EMPTY (2D model).
    bool is_surface_model() const { return m_profiles.front().is_surface(); }

    void set_verbose(bool verbose) { m_verbose = verbose; }
    bool is_verbose() const { return m_verbose; }

    // --- Profiles ---
    const Profile& get_profile(int vertex, int layer) const;
    // Throws std::out_of_range for bad indices and std::invalid_argument
    // when the profile's attribute count or data type differs from the
    // model's.
    void set_profile(int vertex, int layer, Profile profile);
    // Single-layer models only.
    void set_profile(int vertex, Profile profile);

    // --- Values ---
    real_t get_value(int vertex, int layer, int node, int attribute) const;
    const Data& get_data(int vertex, int layer, int node) const;
    void set_value(int vertex, int layer, int node, int attribute, real_t value);

    // 2D models only; std::invalid_argument otherwise.
    real_t get_value(int vertex, int attribute) const;

    real_t get_value_by_point(int point, int attribute) const;
    void set_value_by_point(int point, int attribute, real_t value);

    // --- Layer geometry at a vertex ---
    float get_radius_bottom(int vertex, int layer) const { return get_profile(vertex, layer).get_radius_bottom(); }
    float get_radius_top(int vertex, int layer) const { return get_profile(vertex, layer).get_radius_top(); }
    float get_layer_thickness(int vertex, int layer) const { return get_profile(vertex, layer).get_thickness(); }
    // Bottom of layer 0 followed by the top of every layer.
    std::vector<float> get_layer_radii(int vertex) const;
    const std::vector<bool>& get_connected_vertices(int layer) const;

    // Number of profiles of each ProfileType (indexed by ordinal) in a layer.
    std::array<int, 6> get_profile_type_counts(int layer) const;

    // Checks that profiles are all 2D or all 3D, that 2D models have one
    // layer, and that the top of each layer meets the bottom of the layer
    // above. Mismatches up to LAYER_RADIUS_TOLERANCE_KM are repaired by
    // moving the top of the lower layer; larger ones throw
    // std::invalid_argument.
    void test_model_integrity();

    // --- Interpolation ---
    std::unique_ptr<Position> get_position(InterpolatorType horizontal,
                                           InterpolatorType radial = InterpolatorType::LINEAR) const;

    // --- Point index space ---
    // nullptr activates every point.
    void set_active_region(std::shared_ptr<const ActiveRegion> region);
    std::shared_ptr<const PointMap> get_point_map() const;

    // Integration weights (point index -> weight) of a path sampled at the
    // given unit vectors and radii. Each sample is weighted by half the
    // length (km) of its adjacent segments.
    void get_weights(const std::vector<Vec3>& unit_vectors, const std::vector<real_t>& radii,
                     InterpolatorType horizontal, InterpolatorType radial,
                     std::map<int, real_t>& weights) const;
    real_t get_path_integral(int attribute, const std::map<int, real_t>& weights) const;

private:
    std::shared_ptr<const Grid> m_grid;
    ModelMetaData m_metadata;
    EarthShape m_earth_shape;
    std::vector<Profile> m_profiles; // [vertex * n_layers + layer]
    std::shared_ptr<const ActiveRegion> m_region;
    mutable std::shared_ptr<const PointMap> m_point_map;
    bool m_verbose = false;

    size_t slot(int vertex, int layer) const;
    void invalidate_point_map();
};

} // namespace Ctess

#endif // Ctess_MODEL_HPP
