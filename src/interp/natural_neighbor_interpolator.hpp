#ifndef Ctess_NATURAL_NEIGHBOR_INTERPOLATOR_HPP
#define Ctess_NATURAL_NEIGHBOR_INTERPOLATOR_HPP

#include "horizontal_interpolator.hpp"
#include <unordered_map>
#include <vector>

namespace Ctess {

// Sibson natural-neighbor interpolation on the sphere.
//
// The natural-neighbor triangles of u are those whose circumcircle contains
// it; they form a connected region around the containing triangle. Every
// vertex on the boundary of that region receives a weight proportional to
// the area its Voronoi cell would lose to u if u were inserted into the
// triangulation. Vertices are returned in boundary order, so consecutive
// vertices (and the last and first) share a grid edge.
//
// The circumcircle test compares dot(center, u) with the cosine of the
// circumradius. For small triangles both are close to 1 and points that are
// nearly cocircular with a triangle can fall on either side of the test;
// this changes which region is found but not that it is closed.
class NaturalNeighborInterpolator : public HorizontalInterpolator {
public:
    explicit NaturalNeighborInterpolator(const Grid& grid);

    InterpolatorType get_type() const override { return InterpolatorType::NATURAL_NEIGHBOR; }

    // Throws GeometryException if the region boundary is not a single
    // closed loop. Scratch state is cleared on return, also when throwing.
    void interpolate(int triangle, const Vec3& u,
                     std::vector<int>& vertices,
                     std::vector<real_t>& coefficients) override;

    // True when no triangle is marked and all work lists are empty.
    bool is_scratch_clear() const;

    // Size of the natural-neighbor region found by the last interpolation
    // (0 after a vertex hit).
    int get_last_region_size() const { return m_last_region_size; }

private:
    std::vector<bool> m_marked;                  // per grid triangle
    std::vector<int> m_region;                   // marked triangles, breadth-first order
    std::vector<int> m_boundary;                 // boundary spokes, region on their right
    std::vector<int> m_ordered;                  // m_boundary in loop order
    std::unordered_map<int, int> m_spoke_from;   // hub vertex -> boundary spoke
    int m_last_region_size = 0;

    bool is_natural_neighbor(int triangle, const Vec3& u) const;
    void collect_region(int seed, const Vec3& u);
    void order_boundary();
    real_t stolen_area(int spoke, const Vec3& u) const;
    void clear_scratch();

    class ScratchGuard;
};

} // namespace Ctess

#endif // Ctess_NATURAL_NEIGHBOR_INTERPOLATOR_HPP
