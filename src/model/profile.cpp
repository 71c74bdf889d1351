#include "profile.hpp"
#include "numerics/cubic_spline.hpp"
#include <algorithm> // For std::upper_bound, std::lower_bound, std::transform
#include <atomic>    // For std::atomic_load / std::atomic_store on shared_ptr
#include <cmath>     // For std::isnan, std::abs
#include <stdexcept>

namespace Ctess {

std::string to_string(ProfileType type) {
    switch (type) {
        case ProfileType::EMPTY: return "empty";
        case ProfileType::THIN: return "thin";
        case ProfileType::CONSTANT: return "constant";
        case ProfileType::NPOINT: return "npoint";
        case ProfileType::SURFACE: return "surface";
        case ProfileType::SURFACE_EMPTY: return "surface_empty";
        default: return "unknown";
    }
}

ProfileType profile_type_from_string(const std::string& s_in) {
    std::string s = to_lower(s_in);
    if (s == "empty") return ProfileType::EMPTY;
    if (s == "thin") return ProfileType::THIN;
    if (s == "constant") return ProfileType::CONSTANT;
    if (s == "npoint") return ProfileType::NPOINT;
    if (s == "surface") return ProfileType::SURFACE;
    if (s == "surface_empty") return ProfileType::SURFACE_EMPTY;
    throw std::invalid_argument("Unknown profile type string: " + s_in);
}

// --- Construction ---

Profile::Profile() : m_type(ProfileType::SURFACE_EMPTY) {}

Profile::Profile(ProfileType type, std::vector<float> radii, std::vector<Data> data)
    : m_type(type), m_radii(std::move(radii)), m_data(std::move(data)) {}

Profile Profile::make(ProfileType type, std::vector<float> radii, std::vector<Data> data) {
    size_t n_radii = radii.size();
    size_t n_data = data.size();
    bool shape_ok = false;
    switch (type) {
        case ProfileType::EMPTY: shape_ok = n_radii == 2 && n_data == 0; break;
        case ProfileType::THIN: shape_ok = n_radii == 1 && n_data == 1; break;
        case ProfileType::CONSTANT: shape_ok = n_radii == 2 && n_data == 1; break;
        case ProfileType::NPOINT: shape_ok = n_radii >= 2 && n_data == n_radii; break;
        case ProfileType::SURFACE: shape_ok = n_radii == 0 && n_data == 1; break;
        case ProfileType::SURFACE_EMPTY: shape_ok = n_radii == 0 && n_data == 0; break;
    }
    if (!shape_ok) {
        throw std::invalid_argument("Profile of type " + to_string(type) + " cannot hold " +
                                    std::to_string(n_radii) + " radii and " +
                                    std::to_string(n_data) + " data.");
    }
    for (size_t i = 0; i < n_radii; ++i) {
        if (std::isnan(radii[i])) {
            throw std::invalid_argument("Profile radius " + std::to_string(i) + " is NaN.");
        }
        if (i > 0 && radii[i] < radii[i - 1]) {
            throw std::invalid_argument("Profile radii must not decrease: radius[" + std::to_string(i) +
                                        "] = " + std::to_string(radii[i]) + " < radius[" +
                                        std::to_string(i - 1) + "] = " + std::to_string(radii[i - 1]) + ".");
        }
    }
    for (size_t i = 1; i < n_data; ++i) {
        if (data[i].get_data_type() != data[0].get_data_type() || data[i].size() != data[0].size()) {
            throw std::invalid_argument("All Data of a profile must share one data type and attribute count.");
        }
    }
    return Profile(type, std::move(radii), std::move(data));
}

Profile Profile::make_empty(float radius_bottom, float radius_top) {
    return make(ProfileType::EMPTY, {radius_bottom, radius_top}, {});
}

Profile Profile::make_thin(float radius, const Data& data) {
    return make(ProfileType::THIN, {radius}, {data});
}

Profile Profile::make_constant(float radius_bottom, float radius_top, const Data& data) {
    return make(ProfileType::CONSTANT, {radius_bottom, radius_top}, {data});
}

Profile Profile::make_npoint(std::vector<float> radii, std::vector<Data> data) {
    return make(ProfileType::NPOINT, std::move(radii), std::move(data));
}

Profile Profile::make_surface(const Data& data) {
    return make(ProfileType::SURFACE, {}, {data});
}

Profile Profile::make_surface_empty() {
    return Profile();
}

Profile Profile::from_shape(std::vector<float> radii, std::vector<Data> data) {
    ProfileType type;
    if (radii.empty()) {
        type = data.empty() ? ProfileType::SURFACE_EMPTY : ProfileType::SURFACE;
    } else if (radii.size() == 1) {
        type = ProfileType::THIN;
    } else if (data.empty()) {
        type = ProfileType::EMPTY;
    } else if (data.size() == 1 && radii.size() == 2) {
        type = ProfileType::CONSTANT;
    } else {
        type = ProfileType::NPOINT;
    }
    return make(type, std::move(radii), std::move(data));
}

// --- Radii ---

float Profile::get_radius(int node) const {
    if (node < 0 || node >= get_n_radii()) {
        throw std::out_of_range("Radius index " + std::to_string(node) + " out of range for " +
                                to_string(m_type) + " profile.");
    }
    return m_radii[node];
}

float Profile::get_radius_bottom() const {
    return m_radii.empty() ? static_cast<float>(NaN) : m_radii.front();
}

float Profile::get_radius_top() const {
    return m_radii.empty() ? static_cast<float>(NaN) : m_radii.back();
}

float Profile::get_thickness() const {
    return get_radius_top() - get_radius_bottom();
}

void Profile::set_radius_bottom(float radius) {
    if (m_radii.empty()) {
        throw std::invalid_argument("A " + to_string(m_type) + " profile has no radii.");
    }
    if (m_radii.size() > 1 && radius > m_radii[1]) {
        throw std::invalid_argument("New bottom radius " + std::to_string(radius) +
                                    " lies above the next radius " + std::to_string(m_radii[1]) + ".");
    }
    m_radii.front() = radius;
    invalidate_spline();
}

void Profile::set_radius_top(float radius) {
    if (m_radii.empty()) {
        throw std::invalid_argument("A " + to_string(m_type) + " profile has no radii.");
    }
    size_t n = m_radii.size();
    if (n > 1 && radius < m_radii[n - 2]) {
        throw std::invalid_argument("New top radius " + std::to_string(radius) +
                                    " lies below the previous radius " + std::to_string(m_radii[n - 2]) + ".");
    }
    m_radii.back() = radius;
    invalidate_spline();
}

bool Profile::is_in_range(real_t radius) const {
    if (is_surface()) return true;
    return radius >= get_radius_bottom() && radius <= get_radius_top();
}

int Profile::find_closest_node(real_t radius) const {
    if (m_data.empty()) return INVALID_INDEX;
    if (m_type != ProfileType::NPOINT) return 0;
    auto it = std::lower_bound(m_radii.begin(), m_radii.end(), radius,
                               [](float r, real_t value) { return r < value; });
    if (it == m_radii.begin()) return 0;
    if (it == m_radii.end()) return get_n_radii() - 1;
    int hi = static_cast<int>(it - m_radii.begin());
    return (radius - m_radii[hi - 1] <= m_radii[hi] - radius) ? hi - 1 : hi;
}

// --- Data ---

void Profile::check_node(int node) const {
    if (node < 0 || node >= get_n_data()) {
        throw std::out_of_range("Node index " + std::to_string(node) + " out of range for " +
                                to_string(m_type) + " profile with " + std::to_string(get_n_data()) + " data.");
    }
}

const Data& Profile::get_data(int node) const {
    check_node(node);
    return m_data[node];
}

real_t Profile::get_value(int attribute, int node) const {
    check_node(node);
    if (attribute < 0) {
        throw std::out_of_range("Attribute index " + std::to_string(attribute) + " out of range.");
    }
    return m_data[node].get_double(static_cast<size_t>(attribute));
}

void Profile::set_value(int attribute, int node, real_t value) {
    check_node(node);
    if (attribute < 0) {
        throw std::out_of_range("Attribute index " + std::to_string(attribute) + " out of range.");
    }
    m_data[node].set_value(static_cast<size_t>(attribute), value);
    invalidate_spline();
}

// --- Radial interpolation ---

void Profile::require_values(const char* operation) const {
    if (m_data.empty()) {
        throw std::invalid_argument(std::string(operation) + " is not available for a " +
                                    to_string(m_type) + " profile, which carries no data.");
    }
}

bool Profile::uses_spline(InterpolatorType radial) const {
    if (radial == InterpolatorType::NATURAL_NEIGHBOR) {
        throw std::invalid_argument("natural_neighbor is not a radial interpolator.");
    }
    if (radial != InterpolatorType::CUBIC_SPLINE || m_type != ProfileType::NPOINT || m_radii.size() < 3) {
        return false;
    }
    for (size_t i = 1; i < m_radii.size(); ++i) {
        if (!(m_radii[i] > m_radii[i - 1])) return false;
    }
    return true;
}

std::shared_ptr<const Profile::SplineCache> Profile::get_spline() const {
    std::shared_ptr<const SplineCache> cache = std::atomic_load(&m_spline);
    if (cache) return cache;

    auto built = std::make_shared<SplineCache>();
    built->x.assign(m_radii.begin(), m_radii.end());
    size_t n_attributes = static_cast<size_t>(get_n_attributes());
    built->y.resize(n_attributes);
    built->y2.resize(n_attributes);
    for (size_t a = 0; a < n_attributes; ++a) {
        built->y[a].resize(m_data.size());
        for (size_t k = 0; k < m_data.size(); ++k) built->y[a][k] = m_data[k].get_double(a);
        built->y2[a] = cubic_spline::second_derivatives(built->x, built->y[a]);
    }
    cache = built;
    std::atomic_store(&m_spline, cache);
    return cache;
}

void Profile::invalidate_spline() {
    std::atomic_store(&m_spline, std::shared_ptr<const SplineCache>());
}

void Profile::bracket(real_t radius, int& j, real_t& w) const {
    int n = get_n_radii();
    if (radius >= m_radii[n - 1]) {
        j = n - 2;
        w = 0.0;
        return;
    }
    if (radius <= m_radii[0]) {
        j = 0;
        w = 1.0;
        return;
    }
    // r[j] <= radius < r[j + 1], so the interval has positive width
    auto it = std::upper_bound(m_radii.begin(), m_radii.end(), radius,
                               [](real_t value, float r) { return value < r; });
    j = static_cast<int>(it - m_radii.begin()) - 1;
    w = (m_radii[j + 1] - radius) / (static_cast<real_t>(m_radii[j + 1]) - m_radii[j]);
}

real_t Profile::interpolate(int attribute, real_t radius, InterpolatorType radial,
                            bool out_of_range_allowed) const {
    require_values("Radial interpolation");
    bool spline = uses_spline(radial);
    if (attribute < 0 || attribute >= get_n_attributes()) {
        throw std::out_of_range("Attribute index " + std::to_string(attribute) + " out of range (" +
                                std::to_string(get_n_attributes()) + " attributes).");
    }
    if (!out_of_range_allowed && !is_in_range(radius)) return NaN;
    if (m_type != ProfileType::NPOINT) return m_data[0].get_double(static_cast<size_t>(attribute));

    real_t r = std::min(std::max(radius, static_cast<real_t>(get_radius_bottom())),
                        static_cast<real_t>(get_radius_top()));
    if (spline) {
        std::shared_ptr<const SplineCache> s = get_spline();
        return cubic_spline::evaluate(s->x, s->y[attribute], s->y2[attribute], r);
    }

    int j;
    real_t w;
    bracket(r, j, w);
    real_t lo = m_data[j].get_double(static_cast<size_t>(attribute));
    real_t hi = m_data[j + 1].get_double(static_cast<size_t>(attribute));
    if (w == 1.0) return lo;
    if (w == 0.0) return hi;
    return w * lo + (1.0 - w) * hi;
}

bool Profile::get_coefficients(real_t radius, InterpolatorType radial, bool out_of_range_allowed,
                               NodeWeights& weights) const {
    weights.clear();
    require_values("Radial interpolation");
    bool spline = uses_spline(radial);
    if (!out_of_range_allowed && !is_in_range(radius)) return false;
    if (m_type != ProfileType::NPOINT) {
        weights.emplace_back(0, 1.0);
        return true;
    }

    real_t r = std::min(std::max(radius, static_cast<real_t>(get_radius_bottom())),
                        static_cast<real_t>(get_radius_top()));
    if (spline) {
        std::vector<real_t> w;
        cubic_spline::weights(get_spline()->x, r, w);
        for (size_t k = 0; k < w.size(); ++k) {
            if (w[k] != 0.0) weights.emplace_back(static_cast<int>(k), w[k]);
        }
        return true;
    }

    int j;
    real_t w;
    bracket(r, j, w);
    if (w != 0.0) weights.emplace_back(j, w);
    if (w != 1.0) weights.emplace_back(j + 1, 1.0 - w);
    return true;
}

} // namespace Ctess
