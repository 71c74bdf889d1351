#ifndef Ctess_PROFILE_HPP
#define Ctess_PROFILE_HPP

#include "data.hpp"
#include "core/tess_types.hpp"
#include "core/tess_constants.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Ctess {

// Radial discretization of one (vertex, layer) slot.
//   type            radii   data
//   EMPTY             2       0    layer present, no values
//   THIN              1       1    zero-thickness layer
//   CONSTANT          2       1    one value across [bottom, top]
//   NPOINT           N>=2     N    one value per radial node
//   SURFACE           0       1    2D model
//   SURFACE_EMPTY     0       0    2D model, no value
enum class ProfileType {
    EMPTY,
    THIN,
    CONSTANT,
    NPOINT,
    SURFACE,
    SURFACE_EMPTY
};

std::string to_string(ProfileType type);
ProfileType profile_type_from_string(const std::string& s);

// (node index, weight) pairs of a radial interpolation.
using NodeWeights = std::vector<std::pair<int, real_t>>;

class Profile {
public:
    // SURFACE_EMPTY
    Profile();

    // Validating factories; throw std::invalid_argument when radii and data
    // do not have the shape of the requested type, radii decrease, or the
    // Data objects disagree in type or attribute count.
    static Profile make(ProfileType type, std::vector<float> radii, std::vector<Data> data);
    static Profile make_empty(float radius_bottom, float radius_top);
    static Profile make_thin(float radius, const Data& data);
    static Profile make_constant(float radius_bottom, float radius_top, const Data& data);
    static Profile make_npoint(std::vector<float> radii, std::vector<Data> data);
    static Profile make_surface(const Data& data);
    static Profile make_surface_empty();
    // Type deduced from the number of radii and data.
    static Profile from_shape(std::vector<float> radii, std::vector<Data> data);

    ProfileType get_type() const { return m_type; }
    bool is_surface() const { return m_type == ProfileType::SURFACE || m_type == ProfileType::SURFACE_EMPTY; }
    bool has_data() const { return !m_data.empty(); }

    int get_n_radii() const { return static_cast<int>(m_radii.size()); }
    int get_n_data() const { return static_cast<int>(m_data.size()); }
    int get_n_attributes() const { return m_data.empty() ? 0 : static_cast<int>(m_data[0].size()); }

    const std::vector<float>& get_radii() const { return m_radii; }
    float get_radius(int node) const;
    // NaN for surface profiles.
    float get_radius_bottom() const;
    float get_radius_top() const;
    float get_thickness() const;

    // Move one boundary radius; used to repair small interface mismatches.
    void set_radius_bottom(float radius);
    void set_radius_top(float radius);

    const std::vector<Data>& get_data() const { return m_data; }
    const Data& get_data(int node) const;
    real_t get_value(int attribute, int node) const;
    void set_value(int attribute, int node, real_t value);

    // Node whose radius is closest to radius; 0 for single-valued profiles,
    // INVALID_INDEX when the profile has no data.
    int find_closest_node(real_t radius) const;

    bool is_in_range(real_t radius) const;

    // --- Radial interpolation ---
    // radial is LINEAR or CUBIC_SPLINE. A radius outside [bottom, top] is
    // clamped to the end value when out_of_range_allowed, otherwise the
    // result is NaN (get_coefficients returns false and leaves weights
    // empty). Throw std::invalid_argument for EMPTY and SURFACE_EMPTY.
    real_t interpolate(int attribute, real_t radius, InterpolatorType radial,
                       bool out_of_range_allowed) const;
    bool get_coefficients(real_t radius, InterpolatorType radial, bool out_of_range_allowed,
                          NodeWeights& weights) const;

private:
    struct SplineCache {
        std::vector<real_t> x;
        std::vector<std::vector<real_t>> y;  // [attribute][node]
        std::vector<std::vector<real_t>> y2; // [attribute][node]
    };

    ProfileType m_type;
    std::vector<float> m_radii;
    std::vector<Data> m_data;
    // Built on first cubic query; shared and swapped atomically so that
    // concurrent readers of a loaded model never race.
    mutable std::shared_ptr<const SplineCache> m_spline;

    Profile(ProfileType type, std::vector<float> radii, std::vector<Data> data);

    void require_values(const char* operation) const;
    void check_node(int node) const;
    bool uses_spline(InterpolatorType radial) const;
    std::shared_ptr<const SplineCache> get_spline() const;
    void invalidate_spline();
    // Bracketing node j and weight of node j for linear interpolation inside
    // [bottom, top]; the weight of node j + 1 is 1 - w.
    void bracket(real_t radius, int& j, real_t& w) const;
};

} // namespace Ctess

#endif // Ctess_PROFILE_HPP
