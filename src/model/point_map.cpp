#include "point_map.hpp"
#include "model.hpp"
#include "active_region.hpp"
#include <stdexcept>
#include <string>

namespace Ctess {

PointMap::PointMap(const Model& model, const ActiveRegion* region)
    : m_model(model)
{
    const Grid& grid = model.get_grid();
    const int n_vertices = model.get_n_vertices();
    const int n_layers = model.get_n_layers();

    m_slot_offsets.assign(static_cast<size_t>(n_vertices) * n_layers, 0);
    for (int v = 0; v < n_vertices; ++v) {
        for (int l = 0; l < n_layers; ++l) {
            const Profile& profile = model.get_profile(v, l);
            m_slot_offsets[static_cast<size_t>(v) * n_layers + l] = static_cast<int>(m_node_points.size());
            bool connected = grid.get_connected_vertices(model.get_metadata().get_tessellation(l))[v];
            for (int n = 0; n < profile.get_n_data(); ++n) {
                m_node_points.push_back(INVALID_INDEX);
                if (!connected) continue;
                int point = static_cast<int>(m_points.size());
                m_points.push_back({v, l, n});
                if (region && !region->contains(grid.get_vertex(v), get_point_radius(point), l)) {
                    m_points.pop_back();
                    continue;
                }
                m_node_points.back() = point;
            }
        }
    }
}

int PointMap::get_point_index(int vertex, int layer, int node) const {
    const Profile& profile = m_model.get_profile(vertex, layer);
    if (node < 0 || node >= profile.get_n_data()) {
        throw std::out_of_range("Node index " + std::to_string(node) + " out of range at vertex " +
                                std::to_string(vertex) + ", layer " + std::to_string(layer) + ".");
    }
    size_t slot = static_cast<size_t>(vertex) * m_model.get_n_layers() + layer;
    return m_node_points[m_slot_offsets[slot] + node];
}

const std::array<int, 3>& PointMap::get_point_indices(int point) const {
    if (point < 0 || point >= size()) {
        throw std::out_of_range("Point index " + std::to_string(point) + " out of range (" +
                                std::to_string(size()) + " points).");
    }
    return m_points[point];
}

const Vec3& PointMap::get_point_unit_vector(int point) const {
    return m_model.get_grid().get_vertex(get_vertex_index(point));
}

real_t PointMap::get_point_radius(int point) const {
    const auto& idx = get_point_indices(point);
    const Profile& profile = m_model.get_profile(idx[0], idx[1]);
    switch (profile.get_type()) {
        case ProfileType::NPOINT:
        case ProfileType::THIN:
            return profile.get_radius(idx[2]);
        case ProfileType::CONSTANT:
            return 0.5 * (static_cast<real_t>(profile.get_radius_bottom()) + profile.get_radius_top());
        default:
            return m_model.get_earth_shape().get_earth_radius(m_model.get_grid().get_vertex(idx[0]));
    }
}

real_t PointMap::get_point_depth(int point) const {
    const Vec3& u = get_point_unit_vector(point);
    return m_model.get_earth_shape().radius_to_depth(u, get_point_radius(point));
}

real_t PointMap::get_point_value(int point, int attribute) const {
    const auto& idx = get_point_indices(point);
    return m_model.get_value(idx[0], idx[1], idx[2], attribute);
}

} // namespace Ctess
