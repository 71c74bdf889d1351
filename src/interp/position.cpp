#include "position.hpp"
#include "model/model.hpp"
#include "numerics/vector_unit.hpp"
#include <algorithm> // For std::min
#include <limits>
#include <stdexcept>
#include <string>

namespace Ctess {

Position::Position(const Model& model, InterpolatorType horizontal, InterpolatorType radial)
    : m_model(model),
      m_interpolator(HorizontalInterpolator::create(horizontal, model.get_grid())),
      m_radial(radial)
{
    if (radial != InterpolatorType::LINEAR && radial != InterpolatorType::CUBIC_SPLINE) {
        throw std::invalid_argument(to_string(radial) + " is not a radial interpolator.");
    }
    int n_tess = model.get_grid().get_n_tessellations();
    m_tess.resize(static_cast<size_t>(n_tess));
    m_max_level.assign(static_cast<size_t>(n_tess), std::numeric_limits<int>::max());
}

// --- Location ---

void Position::set(const Vec3& unit_vector, real_t radius) {
    m_is_set = false;
    move_to(unit_vector);
    m_radius = radius;
    m_layer_constraint = INVALID_INDEX;
    select_layer();
    m_is_set = true;
}

void Position::set(int layer, const Vec3& unit_vector, real_t radius) {
    check_layer(layer);
    move_to(unit_vector);
    m_radius = radius;
    m_layer_constraint = layer;
    m_layer = layer;
    m_is_set = true;
}

void Position::set_degrees(real_t lat_deg, real_t lon_deg, real_t depth) {
    const EarthShape& shape = m_model.get_earth_shape();
    Vec3 u = shape.get_vector_degrees(lat_deg, lon_deg);
    set(u, shape.depth_to_radius(u, depth));
}

void Position::set_degrees(int layer, real_t lat_deg, real_t lon_deg, real_t depth) {
    const EarthShape& shape = m_model.get_earth_shape();
    Vec3 u = shape.get_vector_degrees(lat_deg, lon_deg);
    set(layer, u, shape.depth_to_radius(u, depth));
}

void Position::set_radius(real_t radius) {
    require_set();
    m_radius = radius;
    if (m_layer_constraint == INVALID_INDEX) select_layer();
}

void Position::set_depth(real_t depth) {
    require_set();
    set_radius(m_model.get_earth_shape().depth_to_radius(m_unit_vector, depth));
}

void Position::set_top(int layer) {
    require_set();
    set_top(layer, m_unit_vector);
}

void Position::set_top(int layer, const Vec3& unit_vector) {
    check_layer(layer);
    m_is_set = false;
    move_to(unit_vector);
    m_layer_constraint = layer;
    m_layer = layer;
    m_radius = interpolate_radius(layer, true);
    m_is_set = true;
}

void Position::set_bottom(int layer) {
    require_set();
    set_bottom(layer, m_unit_vector);
}

void Position::set_bottom(int layer, const Vec3& unit_vector) {
    check_layer(layer);
    m_is_set = false;
    move_to(unit_vector);
    m_layer_constraint = layer;
    m_layer = layer;
    m_radius = interpolate_radius(layer, false);
    m_is_set = true;
}

void Position::move_to(const Vec3& unit_vector) {
    if (unit_vector == m_unit_vector) return;
    m_unit_vector = unit_vector;
    for (auto& state : m_tess) state.valid = false;
}

void Position::select_layer() {
    if (m_model.is_surface_model()) {
        m_layer = 0;
        return;
    }
    for (int l = m_model.get_n_layers() - 1; l >= 0; --l) {
        real_t bottom = interpolate_radius(l, false);
        real_t top = interpolate_radius(l, true);
        if (top - bottom > 0.0 && bottom <= m_radius) {
            m_layer = l;
            return;
        }
    }
    m_layer = 0;
}

void Position::require_set() const {
    if (!m_is_set) {
        throw std::invalid_argument("Position has not been set to a location.");
    }
}

void Position::check_layer(int layer) const {
    if (layer < 0 || layer >= m_model.get_n_layers()) {
        throw std::out_of_range("Layer index " + std::to_string(layer) + " out of range (" +
                                std::to_string(m_model.get_n_layers()) + " layers).");
    }
}

// --- Options ---

void Position::set_max_tess_level(int tess, int level) {
    if (tess < 0 || tess >= static_cast<int>(m_tess.size())) {
        throw std::out_of_range("Tessellation index " + std::to_string(tess) + " out of range.");
    }
    if (level < 0) {
        throw std::out_of_range("Tessellation level " + std::to_string(level) + " must be >= 0.");
    }
    m_max_level[tess] = level;
    m_tess[tess].valid = false;
}

void Position::set_max_tess_level(int level) {
    for (int tess = 0; tess < static_cast<int>(m_tess.size()); ++tess) {
        set_max_tess_level(tess, level);
    }
}

int Position::get_max_tess_level(int tess) const {
    int top = m_model.get_grid().get_n_levels(tess) - 1;
    return std::min(m_max_level[tess], top);
}

// --- Horizontal support ---

const Position::TessState& Position::horizontal(int tess) {
    TessState& state = m_tess[tess];
    if (!state.valid) {
        int level = get_max_tess_level(tess);
        state.triangle = m_model.get_grid().find_triangle(tess, level, m_unit_vector, state.triangle);
        state.level = level;
        m_interpolator->interpolate(state.triangle, m_unit_vector, state.vertices, state.coefficients);
        state.valid = true;
    }
    return state;
}

const Position::TessState& Position::horizontal_of_layer(int layer) {
    return horizontal(m_model.get_tessellation(layer));
}

const std::vector<int>& Position::get_vertices() {
    require_set();
    return horizontal_of_layer(m_layer).vertices;
}

const std::vector<real_t>& Position::get_horizontal_coefficients() {
    require_set();
    return horizontal_of_layer(m_layer).coefficients;
}

int Position::get_triangle() {
    require_set();
    return horizontal_of_layer(m_layer).triangle;
}

int Position::get_tess_level() {
    require_set();
    return horizontal_of_layer(m_layer).level;
}

int Position::get_index_of_closest_vertex() {
    const std::vector<int>& vertices = get_vertices();
    int closest = INVALID_INDEX;
    real_t best = -2.0;
    for (int v : vertices) {
        real_t d = vector_unit::dot(m_model.get_grid().get_vertex(v), m_unit_vector);
        if (d > best) {
            best = d;
            closest = v;
        }
    }
    return closest;
}

// --- Values ---

real_t Position::get_value(int attribute) {
    require_set();
    if (attribute < 0 || attribute >= m_model.get_n_attributes()) {
        throw std::out_of_range("Attribute index " + std::to_string(attribute) + " out of range (" +
                                std::to_string(m_model.get_n_attributes()) + " attributes).");
    }
    const TessState& state = horizontal_of_layer(m_layer);
    real_t value = 0.0;
    for (size_t i = 0; i < state.vertices.size(); ++i) {
        if (state.coefficients[i] == 0.0) continue;
        const Profile& profile = m_model.get_profile(state.vertices[i], m_layer);
        if (!profile.has_data()) return NaN;
        value += state.coefficients[i] *
                 profile.interpolate(attribute, m_radius, m_radial, m_radius_out_of_range_allowed);
    }
    return value;
}

void Position::get_values(std::vector<real_t>& values) {
    require_set();
    const int n_attributes = m_model.get_n_attributes();
    values.assign(static_cast<size_t>(n_attributes), 0.0);
    const TessState& state = horizontal_of_layer(m_layer);
    for (size_t i = 0; i < state.vertices.size(); ++i) {
        if (state.coefficients[i] == 0.0) continue;
        const Profile& profile = m_model.get_profile(state.vertices[i], m_layer);
        if (!profile.has_data()) {
            values.assign(static_cast<size_t>(n_attributes), NaN);
            return;
        }
        for (int a = 0; a < n_attributes; ++a) {
            values[a] += state.coefficients[i] *
                         profile.interpolate(a, m_radius, m_radial, m_radius_out_of_range_allowed);
        }
    }
}

void Position::get_coefficients(std::map<int, real_t>& coefficients) {
    coefficients.clear();
    require_set();
    std::shared_ptr<const PointMap> points = m_model.get_point_map();
    const TessState& state = horizontal_of_layer(m_layer);
    for (size_t i = 0; i < state.vertices.size(); ++i) {
        if (state.coefficients[i] == 0.0) continue;
        int vertex = state.vertices[i];
        const Profile& profile = m_model.get_profile(vertex, m_layer);
        if (!profile.has_data()) {
            coefficients.clear();
            throw std::invalid_argument("Vertex " + std::to_string(vertex) + " has a " + to_string(profile.get_type()) +
                                        " profile in layer " + std::to_string(m_layer) + " and carries no points.");
        }
        if (!profile.get_coefficients(m_radius, m_radial, m_radius_out_of_range_allowed, m_node_weights)) {
            coefficients.clear();
            throw std::out_of_range("Radius " + std::to_string(m_radius) + " lies outside layer " +
                                    std::to_string(m_layer) + " at vertex " + std::to_string(vertex) +
                                    " and radius_out_of_range_allowed is false.");
        }
        for (const auto& w : m_node_weights) {
            int point = points->get_point_index(vertex, m_layer, w.first);
            if (point == INVALID_INDEX) {
                coefficients.clear();
                throw std::invalid_argument("Node " + std::to_string(w.first) + " of vertex " + std::to_string(vertex) +
                                            " in layer " + std::to_string(m_layer) + " is outside the active region.");
            }
            coefficients[point] += state.coefficients[i] * w.second;
        }
    }
}

// --- Location queries ---

const Vec3& Position::get_unit_vector() const {
    require_set();
    return m_unit_vector;
}

real_t Position::get_radius() const {
    require_set();
    return m_radius;
}

real_t Position::get_depth() const {
    require_set();
    return m_model.get_earth_shape().radius_to_depth(m_unit_vector, m_radius);
}

real_t Position::get_earth_radius() const {
    require_set();
    return m_model.get_earth_shape().get_earth_radius(m_unit_vector);
}

int Position::get_layer_id() {
    require_set();
    return m_layer;
}

real_t Position::interpolate_radius(int layer, bool top) {
    const TessState& state = horizontal_of_layer(layer);
    real_t radius = 0.0;
    for (size_t i = 0; i < state.vertices.size(); ++i) {
        if (state.coefficients[i] == 0.0) continue;
        const Profile& profile = m_model.get_profile(state.vertices[i], layer);
        radius += state.coefficients[i] * (top ? profile.get_radius_top() : profile.get_radius_bottom());
    }
    return radius;
}

real_t Position::get_radius_top() {
    require_set();
    return interpolate_radius(m_layer, true);
}

real_t Position::get_radius_bottom() {
    require_set();
    return interpolate_radius(m_layer, false);
}

real_t Position::get_layer_thickness() {
    return get_radius_top() - get_radius_bottom();
}

real_t Position::get_radius_top(int layer) {
    require_set();
    check_layer(layer);
    return interpolate_radius(layer, true);
}

real_t Position::get_radius_bottom(int layer) {
    require_set();
    check_layer(layer);
    return interpolate_radius(layer, false);
}

real_t Position::get_layer_thickness(int layer) {
    return get_radius_top(layer) - get_radius_bottom(layer);
}

} // namespace Ctess
