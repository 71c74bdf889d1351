#ifndef Ctess_POINT_MAP_HPP
#define Ctess_POINT_MAP_HPP

#include "core/tess_types.hpp"
#include "core/tess_constants.hpp"
#include <array>
#include <vector>

namespace Ctess {

class Model;
class ActiveRegion;

// Dense index 0..size()-1 over the active (vertex, layer, node) triples of
// a model, ordered by vertex, then layer, then node. Only vertices that the
// layer's tessellation connects are included.
//
// A PointMap is a snapshot of the model's profile shapes; Model discards it
// and builds a new one whenever profiles are replaced or the active region
// changes. Values are read through to the model.
class PointMap {
public:
    // region may be null, in which case every point is active.
    PointMap(const Model& model, const ActiveRegion* region);

    int size() const { return static_cast<int>(m_points.size()); }

    // INVALID_INDEX for inactive nodes; std::out_of_range for bad indices.
    int get_point_index(int vertex, int layer, int node) const;

    // {vertex, layer, node}
    const std::array<int, 3>& get_point_indices(int point) const;
    int get_vertex_index(int point) const { return get_point_indices(point)[0]; }
    int get_layer_index(int point) const { return get_point_indices(point)[1]; }
    int get_node_index(int point) const { return get_point_indices(point)[2]; }

    const Vec3& get_point_unit_vector(int point) const;
    // Radius of the node. CONSTANT profiles report the middle of the layer
    // and SURFACE profiles the earth radius.
    real_t get_point_radius(int point) const;
    real_t get_point_depth(int point) const;
    real_t get_point_value(int point, int attribute) const;

private:
    const Model& m_model;
    std::vector<std::array<int, 3>> m_points;
    std::vector<int> m_slot_offsets; // [vertex * n_layers + layer] -> offset into m_node_points
    std::vector<int> m_node_points;  // point index per node, INVALID_INDEX when inactive
};

} // namespace Ctess

#endif // Ctess_POINT_MAP_HPP
