#include "horizontal_interpolator.hpp"
#include "linear_interpolator.hpp"
#include "natural_neighbor_interpolator.hpp"
#include "numerics/vector_unit.hpp"
#include <stdexcept>

namespace Ctess {

std::unique_ptr<HorizontalInterpolator> HorizontalInterpolator::create(InterpolatorType type, const Grid& grid) {
    switch (type) {
        case InterpolatorType::LINEAR:
            return std::make_unique<LinearInterpolator>(grid);
        case InterpolatorType::NATURAL_NEIGHBOR:
            return std::make_unique<NaturalNeighborInterpolator>(grid);
        default:
            throw std::invalid_argument(to_string(type) + " is not a horizontal interpolator.");
    }
}

int HorizontalInterpolator::find_vertex_hit(int triangle, const Vec3& u) const {
    for (int vertex : m_grid.get_triangle_vertices(triangle)) {
        if (vector_unit::dot(m_grid.get_vertex(vertex), u) > VERTEX_HIT_COS) return vertex;
    }
    return INVALID_INDEX;
}

} // namespace Ctess
