#include "model.hpp"
#include "interp/position.hpp"
#include "numerics/vector_unit.hpp"
#include <atomic>    // For std::atomic_load / std::atomic_store on shared_ptr
#include <cmath>     // For std::abs
#include <cstdio>    // For std::snprintf
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace Ctess {

Model::Model(std::shared_ptr<const Grid> grid, const ModelMetaData& metadata)
    : m_grid(std::move(grid)),
      m_metadata(metadata),
      m_earth_shape(metadata.get_earth_shape())
{
    if (!m_grid) {
        throw std::invalid_argument("Model requires a grid.");
    }
    m_metadata.validate(m_grid->get_n_tessellations());
    m_profiles.resize(static_cast<size_t>(get_n_vertices()) * get_n_layers());
}

size_t Model::slot(int vertex, int layer) const {
    if (vertex < 0 || vertex >= get_n_vertices()) {
        throw std::out_of_range("Vertex index " + std::to_string(vertex) + " out of range (" +
                                std::to_string(get_n_vertices()) + " vertices).");
    }
    if (layer < 0 || layer >= get_n_layers()) {
        throw std::out_of_range("Layer index " + std::to_string(layer) + " out of range (" +
                                std::to_string(get_n_layers()) + " layers).");
    }
    return static_cast<size_t>(vertex) * get_n_layers() + layer;
}

// --- Profiles ---

const Profile& Model::get_profile(int vertex, int layer) const {
    return m_profiles[slot(vertex, layer)];
}

void Model::set_profile(int vertex, int layer, Profile profile) {
    size_t s = slot(vertex, layer);
    if (profile.has_data()) {
        if (profile.get_n_attributes() != get_n_attributes()) {
            throw std::invalid_argument("Profile at vertex " + std::to_string(vertex) + ", layer " +
                                        std::to_string(layer) + " has " + std::to_string(profile.get_n_attributes()) +
                                        " attributes but the model has " + std::to_string(get_n_attributes()) + ".");
        }
        if (profile.get_data()[0].get_data_type() != m_metadata.get_data_type()) {
            throw std::invalid_argument("Profile at vertex " + std::to_string(vertex) + ", layer " +
                                        std::to_string(layer) + " stores " +
                                        to_string(profile.get_data()[0].get_data_type()) + " data but the model stores " +
                                        to_string(m_metadata.get_data_type()) + ".");
        }
    }
    m_profiles[s] = std::move(profile);
    invalidate_point_map();
}

void Model::set_profile(int vertex, Profile profile) {
    if (get_n_layers() != 1) {
        throw std::invalid_argument("set_profile(vertex, profile) requires a single-layer model; this one has " +
                                    std::to_string(get_n_layers()) + " layers.");
    }
    set_profile(vertex, 0, std::move(profile));
}

// --- Values ---

real_t Model::get_value(int vertex, int layer, int node, int attribute) const {
    return get_profile(vertex, layer).get_value(attribute, node);
}

const Data& Model::get_data(int vertex, int layer, int node) const {
    return get_profile(vertex, layer).get_data(node);
}

void Model::set_value(int vertex, int layer, int node, int attribute, real_t value) {
    m_profiles[slot(vertex, layer)].set_value(attribute, node, value);
}

real_t Model::get_value(int vertex, int attribute) const {
    if (!is_surface_model()) {
        throw std::invalid_argument("get_value(vertex, attribute) is only defined for 2D models.");
    }
    const Profile& profile = get_profile(vertex, 0);
    if (!profile.has_data()) {
        throw std::invalid_argument("Vertex " + std::to_string(vertex) + " has a surface_empty profile.");
    }
    return profile.get_value(attribute, 0);
}

real_t Model::get_value_by_point(int point, int attribute) const {
    const auto& idx = get_point_map()->get_point_indices(point);
    return get_value(idx[0], idx[1], idx[2], attribute);
}

void Model::set_value_by_point(int point, int attribute, real_t value) {
    std::array<int, 3> idx = get_point_map()->get_point_indices(point);
    set_value(idx[0], idx[1], idx[2], attribute, value);
}

// --- Layer geometry ---

std::vector<float> Model::get_layer_radii(int vertex) const {
    std::vector<float> radii;
    radii.reserve(static_cast<size_t>(get_n_layers()) + 1);
    radii.push_back(get_radius_bottom(vertex, 0));
    for (int l = 0; l < get_n_layers(); ++l) {
        radii.push_back(get_radius_top(vertex, l));
    }
    return radii;
}

const std::vector<bool>& Model::get_connected_vertices(int layer) const {
    return m_grid->get_connected_vertices(get_tessellation(layer));
}

std::array<int, 6> Model::get_profile_type_counts(int layer) const {
    std::array<int, 6> counts = {0, 0, 0, 0, 0, 0};
    for (int v = 0; v < get_n_vertices(); ++v) {
        ++counts[static_cast<size_t>(get_profile(v, layer).get_type())];
    }
    return counts;
}

void Model::test_model_integrity() {
    const bool surface = is_surface_model();
    if (surface && get_n_layers() != 1) {
        throw std::invalid_argument("A model of surface profiles must have exactly 1 layer; this one has " +
                                    std::to_string(get_n_layers()) + ".");
    }

    std::ostringstream repairs;
    char line[160];
    for (int v = 0; v < get_n_vertices(); ++v) {
        for (int l = 0; l < get_n_layers(); ++l) {
            if (get_profile(v, l).is_surface() != surface) {
                throw std::invalid_argument("Model may not mix surface profiles with profiles of other types "
                                            "(vertex " + std::to_string(v) + ", layer " + std::to_string(l) + ").");
            }
        }
        if (surface) continue;

        for (int l = get_n_layers() - 1; l >= 1; --l) {
            Profile& lower = m_profiles[slot(v, l - 1)];
            const Profile& upper = m_profiles[slot(v, l)];
            real_t dr = static_cast<real_t>(upper.get_radius_bottom()) - lower.get_radius_top();
            if (std::abs(dr) > LAYER_RADIUS_TOLERANCE_KM) {
                std::snprintf(line, sizeof(line),
                              "At vertex %d the radius at the top of layer %d is %1.3f and the radius at the "
                              "bottom of layer %d is %1.3f. They differ by %1.3f km.",
                              v, l - 1, lower.get_radius_top(), l, upper.get_radius_bottom(), dr);
                throw std::invalid_argument(line);
            }
            if (dr != 0.0) {
                std::snprintf(line, sizeof(line), "vertex=%6d, layer=%2d, radius %8.3f -> %8.3f, dr=%6.3f\n",
                              v, l - 1, lower.get_radius_top(), upper.get_radius_bottom(), dr);
                repairs << line;
                lower.set_radius_top(upper.get_radius_bottom());
            }
        }
    }

    std::string repaired = repairs.str();
    if (m_verbose && !repaired.empty()) {
        std::cerr << "Model Warning: repaired layer interface radii that differed by less than "
                  << LAYER_RADIUS_TOLERANCE_KM << " km:\n" << repaired;
    }
}

// --- Interpolation ---

std::unique_ptr<Position> Model::get_position(InterpolatorType horizontal, InterpolatorType radial) const {
    return std::make_unique<Position>(*this, horizontal, radial);
}

// --- Point index space ---

void Model::set_active_region(std::shared_ptr<const ActiveRegion> region) {
    m_region = std::move(region);
    invalidate_point_map();
}

std::shared_ptr<const PointMap> Model::get_point_map() const {
    std::shared_ptr<const PointMap> map = std::atomic_load(&m_point_map);
    if (!map) {
        map = std::make_shared<PointMap>(*this, m_region.get());
        std::atomic_store(&m_point_map, map);
    }
    return map;
}

void Model::invalidate_point_map() {
    std::atomic_store(&m_point_map, std::shared_ptr<const PointMap>());
}

void Model::get_weights(const std::vector<Vec3>& unit_vectors, const std::vector<real_t>& radii,
                        InterpolatorType horizontal, InterpolatorType radial,
                        std::map<int, real_t>& weights) const {
    if (unit_vectors.size() != radii.size()) {
        throw std::invalid_argument("get_weights: " + std::to_string(unit_vectors.size()) + " unit vectors but " +
                                    std::to_string(radii.size()) + " radii.");
    }
    weights.clear();
    size_t n = unit_vectors.size();
    if (n < 2) return;

    std::vector<real_t> segment(n - 1);
    for (size_t i = 0; i + 1 < n; ++i) {
        Vec3 d;
        for (int k = 0; k < 3; ++k) {
            d[k] = radii[i + 1] * unit_vectors[i + 1][k] - radii[i] * unit_vectors[i][k];
        }
        segment[i] = vector_unit::length(d);
    }

    Position position(*this, horizontal, radial);
    std::map<int, real_t> coefficients;
    for (size_t i = 0; i < n; ++i) {
        real_t length = 0.5 * ((i > 0 ? segment[i - 1] : 0.0) + (i + 1 < n ? segment[i] : 0.0));
        if (length == 0.0) continue;
        position.set(unit_vectors[i], radii[i]);
        position.get_coefficients(coefficients);
        for (const auto& c : coefficients) {
            weights[c.first] += length * c.second;
        }
    }
}

real_t Model::get_path_integral(int attribute, const std::map<int, real_t>& weights) const {
    real_t sum = 0.0;
    for (const auto& w : weights) {
        sum += w.second * get_value_by_point(w.first, attribute);
    }
    return sum;
}

} // namespace Ctess
