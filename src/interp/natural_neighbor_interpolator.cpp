#include "natural_neighbor_interpolator.hpp"
#include "core/tess_exception.hpp"
#include "numerics/vector_unit.hpp"
#include <string>

namespace Ctess {

class NaturalNeighborInterpolator::ScratchGuard {
public:
    explicit ScratchGuard(NaturalNeighborInterpolator& owner) : m_owner(owner) {}
    ~ScratchGuard() { m_owner.clear_scratch(); }
    ScratchGuard(const ScratchGuard&) = delete;
    ScratchGuard& operator=(const ScratchGuard&) = delete;
private:
    NaturalNeighborInterpolator& m_owner;
};

NaturalNeighborInterpolator::NaturalNeighborInterpolator(const Grid& grid)
    : HorizontalInterpolator(grid),
      m_marked(static_cast<size_t>(grid.get_n_triangles()), false)
{
}

bool NaturalNeighborInterpolator::is_natural_neighbor(int triangle, const Vec3& u) const {
    const CircumCenter& cc = m_grid.get_circumcenter(triangle);
    return vector_unit::dot(cc.center, u) > cc.cos_radius;
}

void NaturalNeighborInterpolator::interpolate(int triangle, const Vec3& u,
                                              std::vector<int>& vertices,
                                              std::vector<real_t>& coefficients) {
    vertices.clear();
    coefficients.clear();
    m_last_region_size = 0;

    int hit = find_vertex_hit(triangle, u);
    if (hit != INVALID_INDEX) {
        vertices.push_back(hit);
        coefficients.push_back(1.0);
        return;
    }

    ScratchGuard guard(*this);
    collect_region(triangle, u);
    order_boundary();
    m_last_region_size = static_cast<int>(m_region.size());

    real_t total = 0.0;
    for (int spoke : m_ordered) {
        real_t area = stolen_area(spoke, u);
        vertices.push_back(m_grid.get_spoke(spoke).vj);
        coefficients.push_back(area);
        total += area;
    }
    if (!(total > 0.0)) {
        vertices.clear();
        coefficients.clear();
        throw GeometryException("Natural-neighbor weights around triangle " + std::to_string(triangle) +
                                " sum to zero.");
    }
    for (auto& c : coefficients) c /= total;
}

void NaturalNeighborInterpolator::collect_region(int seed, const Vec3& u) {
    // The containing triangle's circumcircle always contains u.
    m_marked[seed] = true;
    m_region.push_back(seed);
    for (size_t head = 0; head < m_region.size(); ++head) {
        int t = m_region[head];
        for (int i = 0; i < 3; ++i) {
            int n = m_grid.get_neighbor(t, i);
            if (!m_marked[n] && is_natural_neighbor(n, u)) {
                m_marked[n] = true;
                m_region.push_back(n);
            }
        }
    }

    for (int t : m_region) {
        for (int i = 0; i < 3; ++i) {
            if (m_marked[m_grid.get_neighbor(t, i)]) continue;
            // The spoke of t along the edge opposite corner i has t on its
            // left; its twin has the region on its right.
            int spoke = m_grid.get_spoke(m_grid.get_triangle_spoke(t, (i + 1) % 3)).twin;
            int hub = m_grid.get_spoke(spoke).vj;
            if (!m_spoke_from.emplace(hub, spoke).second) {
                throw GeometryException("Natural-neighbor boundary passes through vertex " + std::to_string(hub) +
                                        " more than once (seed triangle " + std::to_string(seed) + ").");
            }
            m_boundary.push_back(spoke);
        }
    }
}

void NaturalNeighborInterpolator::order_boundary() {
    if (m_boundary.size() < 3) {
        throw GeometryException("Natural-neighbor boundary has only " + std::to_string(m_boundary.size()) + " edges.");
    }
    const int start = m_boundary.front();
    int spoke = start;
    do {
        m_ordered.push_back(spoke);
        auto it = m_spoke_from.find(m_grid.get_spoke(spoke).vk);
        if (it == m_spoke_from.end()) {
            throw GeometryException("Natural-neighbor boundary edges are out of order: no edge starts at vertex " +
                                    std::to_string(m_grid.get_spoke(spoke).vk) + ".");
        }
        spoke = it->second;
    } while (spoke != start && m_ordered.size() <= m_boundary.size());

    if (spoke != start || m_ordered.size() != m_boundary.size()) {
        throw GeometryException("Natural-neighbor boundary edges do not form a single closed loop (" +
                                std::to_string(m_ordered.size()) + " of " + std::to_string(m_boundary.size()) +
                                " edges chained).");
    }
}

// Area of the part of vj's Voronoi cell taken over by u, where spoke is the
// boundary edge vj -> vk. The cell part is a convex polygon fanned from the
// virtual Voronoi vertex of (u, vj, vk) through the circumcenters of the
// region's triangles around vj, clockwise, to the virtual Voronoi vertex of
// (u, vh, vj) on the incoming boundary edge vh -> vj.
real_t NaturalNeighborInterpolator::stolen_area(int spoke, const Vec3& u) const {
    const Spoke& first = m_grid.get_spoke(spoke);
    const Vec3& vertex = m_grid.get_vertex(first.vj);
    Vec3 ip1 = vector_unit::circumcenter(u, vertex, m_grid.get_vertex(first.vk));
    Vec3 ip2 = m_grid.get_circumcenter(first.t_right).center;

    real_t area = 0.0;
    int s = first.next;
    while (s != spoke) {
        const Spoke& current = m_grid.get_spoke(s);
        if (m_marked[current.t_right]) {
            const Vec3& ip3 = m_grid.get_circumcenter(current.t_right).center;
            area += vector_unit::triangle_area(ip1, ip2, ip3);
            ip2 = ip3;
        } else {
            Vec3 ip3 = vector_unit::circumcenter(u, m_grid.get_vertex(current.vk), vertex);
            return area + vector_unit::triangle_area(ip1, ip2, ip3);
        }
        s = current.next;
    }
    throw GeometryException("Every triangle around vertex " + std::to_string(first.vj) +
                            " is a natural neighbor; the region has no boundary there.");
}

bool NaturalNeighborInterpolator::is_scratch_clear() const {
    if (!m_region.empty() || !m_boundary.empty() || !m_ordered.empty() || !m_spoke_from.empty()) return false;
    for (bool marked : m_marked) {
        if (marked) return false;
    }
    return true;
}

void NaturalNeighborInterpolator::clear_scratch() {
    for (int t : m_region) m_marked[t] = false;
    m_region.clear();
    m_boundary.clear();
    m_ordered.clear();
    m_spoke_from.clear();
}

} // namespace Ctess
