#ifndef Ctess_HORIZONTAL_INTERPOLATOR_HPP
#define Ctess_HORIZONTAL_INTERPOLATOR_HPP

#include "grid/grid.hpp"
#include "core/tess_types.hpp"
#include <memory>
#include <vector>

namespace Ctess {

// Computes the 2D interpolation support of a point on one tessellation
// level: the contributing vertices and their weights, which sum to 1.
class HorizontalInterpolator {
public:
    virtual ~HorizontalInterpolator() = default;

    virtual InterpolatorType get_type() const = 0;

    // triangle must contain u (see Grid::find_triangle). vertices and
    // coefficients are overwritten. A point within VERTEX_HIT_COS of a corner
    // of the triangle yields that vertex alone with weight 1.
    virtual void interpolate(int triangle, const Vec3& u,
                             std::vector<int>& vertices,
                             std::vector<real_t>& coefficients) = 0;

    // LINEAR or NATURAL_NEIGHBOR; std::invalid_argument otherwise.
    static std::unique_ptr<HorizontalInterpolator> create(InterpolatorType type, const Grid& grid);

protected:
    explicit HorizontalInterpolator(const Grid& grid) : m_grid(grid) {}

    // Corner vertex of triangle coincident with u, or INVALID_INDEX.
    int find_vertex_hit(int triangle, const Vec3& u) const;

    const Grid& m_grid;
};

} // namespace Ctess

#endif // Ctess_HORIZONTAL_INTERPOLATOR_HPP
