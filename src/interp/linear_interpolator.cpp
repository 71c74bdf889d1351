#include "linear_interpolator.hpp"
#include "core/tess_exception.hpp"
#include <string>

namespace Ctess {

void LinearInterpolator::interpolate(int triangle, const Vec3& u,
                                     std::vector<int>& vertices,
                                     std::vector<real_t>& coefficients) {
    vertices.clear();
    coefficients.clear();

    int hit = find_vertex_hit(triangle, u);
    if (hit != INVALID_INDEX) {
        vertices.push_back(hit);
        coefficients.push_back(1.0);
        return;
    }

    const auto& corners = m_grid.get_triangle_vertices(triangle);
    real_t side[3];
    real_t total = 0.0;
    for (int i = 0; i < 3; ++i) {
        side[i] = m_grid.get_edge_side(triangle, i, u);
        total += side[i];
    }
    if (!(total > 0.0)) {
        throw GeometryException("Linear interpolation in triangle " + std::to_string(triangle) +
                                " failed: the point is not on the triangle's side of the sphere.");
    }
    for (int i = 0; i < 3; ++i) {
        vertices.push_back(corners[i]);
        coefficients.push_back(side[i] / total);
    }
}

} // namespace Ctess
