#include "grid.hpp"
#include "core/tess_exception.hpp"
#include "numerics/vector_unit.hpp"
#include <cmath>        // For std::sqrt
#include <cstdint>
#include <cstdio>       // For std::snprintf
#include <utility>      // For std::move, std::pair
#include <algorithm>    // For std::max
#include <unordered_map>
#include <stdexcept>

namespace Ctess {

namespace {

// Key of an undirected edge.
std::uint64_t edge_key(int a, int b) {
    std::uint64_t lo = static_cast<std::uint32_t>(std::min(a, b));
    std::uint64_t hi = static_cast<std::uint32_t>(std::max(a, b));
    return (hi << 32) | lo;
}

int corner_of(const std::array<int, 3>& tri, int vertex) {
    for (int i = 0; i < 3; ++i) {
        if (tri[i] == vertex) return i;
    }
    return INVALID_INDEX;
}

// FNV-1a, 64 bit.
class ContentHash {
public:
    void add(const void* data, size_t n) {
        const unsigned char* p = static_cast<const unsigned char*>(data);
        for (size_t i = 0; i < n; ++i) {
            m_hash ^= p[i];
            m_hash *= 1099511628211ULL;
        }
    }
    template<typename T>
    void add_value(const T& value) { add(&value, sizeof(T)); }
    std::uint64_t value() const { return m_hash; }
private:
    std::uint64_t m_hash = 14695981039346656037ULL;
};

} // anonymous namespace

Grid::Grid(std::vector<Vec3> vertices,
           std::vector<std::array<int, 3>> triangles,
           std::vector<std::array<int, 2>> levels,
           std::vector<std::vector<int>> tessellations,
           const std::string& grid_id,
           const std::string& description)
    : m_grid_id(grid_id),
      m_description(description),
      m_vertices(std::move(vertices)),
      m_triangles(std::move(triangles)),
      m_levels(std::move(levels)),
      m_tessellations(std::move(tessellations))
{
    validate_structure();
    build_neighbors();
    build_spokes();
    build_descendants();
    build_connectivity();
    if (m_grid_id.empty()) {
        m_grid_id = compute_grid_id(m_vertices, m_triangles, m_levels, m_tessellations);
    }
}

std::string Grid::compute_grid_id(const std::vector<Vec3>& vertices,
                                  const std::vector<std::array<int, 3>>& triangles,
                                  const std::vector<std::array<int, 2>>& levels,
                                  const std::vector<std::vector<int>>& tessellations) {
    ContentHash hash;
    hash.add_value(static_cast<std::uint64_t>(vertices.size()));
    for (const auto& v : vertices) hash.add(v.data(), sizeof(real_t) * 3);
    hash.add_value(static_cast<std::uint64_t>(triangles.size()));
    for (const auto& t : triangles) {
        for (int c : t) hash.add_value(static_cast<std::int32_t>(c));
    }
    hash.add_value(static_cast<std::uint64_t>(levels.size()));
    for (const auto& l : levels) {
        hash.add_value(static_cast<std::int32_t>(l[0]));
        hash.add_value(static_cast<std::int32_t>(l[1]));
    }
    hash.add_value(static_cast<std::uint64_t>(tessellations.size()));
    for (const auto& tess : tessellations) {
        hash.add_value(static_cast<std::uint64_t>(tess.size()));
        for (int l : tess) hash.add_value(static_cast<std::int32_t>(l));
    }
    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llX", static_cast<unsigned long long>(hash.value()));
    return std::string(buffer);
}

// --- Levels and tessellations ---

int Grid::get_n_levels(int tess) const {
    if (tess < 0 || tess >= get_n_tessellations()) {
        throw std::out_of_range("Tessellation index " + std::to_string(tess) + " out of range.");
    }
    return static_cast<int>(m_tessellations[tess].size());
}

int Grid::get_level(int tess, int relative_level) const {
    if (relative_level < 0 || relative_level >= get_n_levels(tess)) {
        throw std::out_of_range("Level " + std::to_string(relative_level) +
                                " out of range for tessellation " + std::to_string(tess) + ".");
    }
    return m_tessellations[tess][relative_level];
}

int Grid::get_top_level(int tess) const {
    return m_tessellations[tess][get_n_levels(tess) - 1];
}

int Grid::get_first_triangle(int level) const {
    if (level < 0 || level >= get_n_levels()) {
        throw std::out_of_range("Level index " + std::to_string(level) + " out of range.");
    }
    return m_levels[level][0];
}

int Grid::get_last_triangle(int level) const {
    if (level < 0 || level >= get_n_levels()) {
        throw std::out_of_range("Level index " + std::to_string(level) + " out of range.");
    }
    return m_levels[level][1];
}

// --- Geometry ---

real_t Grid::get_edge_side(int triangle, int side, const Vec3& u) const {
    return vector_unit::dot(m_edge_normals[triangle][side], u);
}

bool Grid::contains(int triangle, const Vec3& u) const {
    for (int i = 0; i < 3; ++i) {
        if (get_edge_side(triangle, i, u) < 0.0) return false;
    }
    return true;
}

// --- Point location ---

int Grid::find_triangle(int start_triangle, const Vec3& u) const {
    if (start_triangle < 0 || start_triangle >= get_n_triangles()) {
        throw std::out_of_range("Start triangle " + std::to_string(start_triangle) + " out of range.");
    }
    int level = m_triangle_level[start_triangle];
    real_t n_level = static_cast<real_t>(m_levels[level][1] - m_levels[level][0]);
    int max_steps = std::max(64, static_cast<int>(16.0 * std::sqrt(n_level)));

    int triangle = start_triangle;
    for (int step = 0; step < max_steps; ++step) {
        int worst_side = INVALID_INDEX;
        real_t worst = 0.0;
        for (int i = 0; i < 3; ++i) {
            real_t side = get_edge_side(triangle, i, u);
            if (side < worst) {
                worst = side;
                worst_side = i;
            }
        }
        if (worst_side == INVALID_INDEX) return triangle;
        triangle = m_neighbors[triangle][worst_side];
    }
    throw GeometryException("Triangle walk did not converge after " + std::to_string(max_steps) +
                            " steps on level " + std::to_string(level) + " of grid " + m_grid_id +
                            " (start triangle " + std::to_string(start_triangle) + ").");
}

int Grid::find_triangle(int tess, int relative_level, const Vec3& u, int hint) const {
    int target = get_level(tess, relative_level);
    if (hint >= 0 && hint < get_n_triangles() && m_triangle_level[hint] == target) {
        return find_triangle(hint, u);
    }
    int triangle = find_triangle(m_levels[get_level(tess, 0)][0], u);
    for (int r = 1; r <= relative_level; ++r) {
        triangle = find_triangle(m_descendants[triangle], u);
    }
    return triangle;
}

// --- Natural-neighbor support ---

const CircumCenter& Grid::get_circumcenter(int triangle) const {
    std::call_once(m_circumcenter_flag, [this]() { compute_circumcenters(); });
    return m_circumcenters[triangle];
}

void Grid::compute_circumcenters() const {
    m_circumcenters.resize(m_triangles.size());
    for (size_t t = 0; t < m_triangles.size(); ++t) {
        const Vec3& a = m_vertices[m_triangles[t][0]];
        const Vec3& b = m_vertices[m_triangles[t][1]];
        const Vec3& c = m_vertices[m_triangles[t][2]];
        CircumCenter& cc = m_circumcenters[t];
        cc.center = vector_unit::circumcenter(a, b, c);
        cc.cos_radius = vector_unit::dot(cc.center, a);
    }
}

int Grid::get_vertex_spoke(int level, int vertex) const {
    if (level < 0 || level >= get_n_levels()) {
        throw std::out_of_range("Level index " + std::to_string(level) + " out of range.");
    }
    if (vertex < 0 || vertex >= get_n_vertices()) {
        throw std::out_of_range("Vertex index " + std::to_string(vertex) + " out of range.");
    }
    return m_vertex_spokes[level][vertex];
}

std::vector<int> Grid::get_vertex_triangles(int level, int vertex) const {
    std::vector<int> result;
    int first = get_vertex_spoke(level, vertex);
    if (first == INVALID_INDEX) return result;
    int s = first;
    do {
        result.push_back(m_spokes[s].t_left);
        s = m_spokes[s].next;
    } while (s != first);
    return result;
}

// --- Construction ---

void Grid::validate_structure() {
    const int n_vertices = get_n_vertices();
    const int n_triangles = get_n_triangles();
    if (n_vertices < 4 || n_triangles < 4 || m_levels.empty() || m_tessellations.empty()) {
        throw GeometryException("Grid must have at least 4 vertices, 4 triangles, one level and one tessellation.");
    }

    for (int t = 0; t < n_triangles; ++t) {
        for (int c : m_triangles[t]) {
            if (c < 0 || c >= n_vertices) {
                throw GeometryException("Triangle " + std::to_string(t) + " references vertex " +
                                        std::to_string(c) + " which is out of range.");
            }
        }
        const auto& tri = m_triangles[t];
        if (vector_unit::scalar_triple_product(m_vertices[tri[0]], m_vertices[tri[1]], m_vertices[tri[2]]) <= 0.0) {
            throw GeometryException("Triangle " + std::to_string(t) +
                                    " is degenerate or not counter-clockwise seen from outside the sphere.");
        }
    }

    m_triangle_level.assign(n_triangles, INVALID_INDEX);
    int expected_first = 0;
    for (int l = 0; l < get_n_levels(); ++l) {
        const auto& range = m_levels[l];
        if (range[0] != expected_first || range[1] <= range[0] || range[1] > n_triangles) {
            throw GeometryException("Level " + std::to_string(l) +
                                    " is not a non-empty contiguous triangle range following the previous level.");
        }
        for (int t = range[0]; t < range[1]; ++t) m_triangle_level[t] = l;
        expected_first = range[1];
    }
    if (expected_first != n_triangles) {
        throw GeometryException("Levels do not cover all " + std::to_string(n_triangles) + " triangles.");
    }

    m_level_tess.assign(m_levels.size(), INVALID_INDEX);
    for (int tess = 0; tess < get_n_tessellations(); ++tess) {
        if (m_tessellations[tess].empty()) {
            throw GeometryException("Tessellation " + std::to_string(tess) + " has no levels.");
        }
        for (int l : m_tessellations[tess]) {
            if (l < 0 || l >= get_n_levels()) {
                throw GeometryException("Tessellation " + std::to_string(tess) + " references level " +
                                        std::to_string(l) + " which is out of range.");
            }
            if (m_level_tess[l] != INVALID_INDEX) {
                throw GeometryException("Level " + std::to_string(l) + " belongs to more than one tessellation.");
            }
            m_level_tess[l] = tess;
        }
    }
}

void Grid::build_neighbors() {
    m_neighbors.assign(m_triangles.size(), {INVALID_INDEX, INVALID_INDEX, INVALID_INDEX});
    m_edge_normals.resize(m_triangles.size());

    for (int l = 0; l < get_n_levels(); ++l) {
        // edge -> (triangle, side) of the first triangle seen with that edge
        std::unordered_map<std::uint64_t, std::pair<int, int>> open_edges;
        open_edges.reserve(static_cast<size_t>(3 * (m_levels[l][1] - m_levels[l][0])));

        for (int t = m_levels[l][0]; t < m_levels[l][1]; ++t) {
            const auto& tri = m_triangles[t];
            for (int i = 0; i < 3; ++i) {
                int a = tri[(i + 1) % 3];
                int b = tri[(i + 2) % 3];
                m_edge_normals[t][i] = vector_unit::cross(m_vertices[a], m_vertices[b]);

                auto it = open_edges.find(edge_key(a, b));
                if (it == open_edges.end()) {
                    open_edges.emplace(edge_key(a, b), std::make_pair(t, i));
                    continue;
                }
                int other = it->second.first;
                int other_side = it->second.second;
                if (other == INVALID_INDEX) {
                    throw GeometryException("Edge " + std::to_string(a) + "-" + std::to_string(b) +
                                            " is shared by more than two triangles on level " + std::to_string(l) + ".");
                }
                // Consistent winding: the other triangle traverses the edge b -> a.
                const auto& otri = m_triangles[other];
                if (otri[(other_side + 1) % 3] != b || otri[(other_side + 2) % 3] != a) {
                    throw GeometryException("Triangles " + std::to_string(other) + " and " + std::to_string(t) +
                                            " have inconsistent winding.");
                }
                m_neighbors[t][i] = other;
                m_neighbors[other][other_side] = t;
                it->second.first = INVALID_INDEX;
            }
        }

        for (const auto& entry : open_edges) {
            if (entry.second.first != INVALID_INDEX) {
                throw GeometryException("Level " + std::to_string(l) + " is not closed: triangle " +
                                        std::to_string(entry.second.first) + " has no neighbor on side " +
                                        std::to_string(entry.second.second) + ".");
            }
        }
    }
}

void Grid::build_spokes() {
    const int n_triangles = get_n_triangles();
    m_spokes.resize(static_cast<size_t>(3 * n_triangles));
    m_vertex_spokes.assign(m_levels.size(), std::vector<int>(m_vertices.size(), INVALID_INDEX));

    for (int t = 0; t < n_triangles; ++t) {
        const auto& tri = m_triangles[t];
        for (int i = 0; i < 3; ++i) {
            Spoke& s = m_spokes[3 * t + i];
            s.vj = tri[i];
            s.vk = tri[(i + 1) % 3];
            s.t_left = t;
            s.corner = i;
            // edge vj -> vk is opposite corner i + 2
            s.t_right = m_neighbors[t][(i + 2) % 3];

            const auto& rtri = m_triangles[s.t_right];
            int k = corner_of(rtri, s.vk);
            int m = corner_of(rtri, s.vj);
            if (k == INVALID_INDEX || m == INVALID_INDEX) {
                throw GeometryException("Neighbor " + std::to_string(s.t_right) + " of triangle " +
                                        std::to_string(t) + " does not share its edge.");
            }
            s.twin = 3 * s.t_right + k;
            s.next = 3 * s.t_right + m;
            m_vertex_spokes[m_triangle_level[t]][s.vj] = 3 * t + i;
        }
    }
}

void Grid::build_descendants() {
    m_descendants.assign(m_triangles.size(), INVALID_INDEX);
    for (const auto& tess : m_tessellations) {
        for (size_t r = 0; r + 1 < tess.size(); ++r) {
            const auto& coarse = m_levels[tess[r]];
            int hint = m_levels[tess[r + 1]][0];
            for (int t = coarse[0]; t < coarse[1]; ++t) {
                const auto& tri = m_triangles[t];
                Vec3 centroid = vector_unit::center(m_vertices[tri[0]], m_vertices[tri[1]], m_vertices[tri[2]]);
                hint = find_triangle(hint, centroid);
                m_descendants[t] = hint;
            }
        }
    }
}

void Grid::build_connectivity() {
    m_connected.assign(m_tessellations.size(), std::vector<bool>(m_vertices.size(), false));
    for (int tess = 0; tess < get_n_tessellations(); ++tess) {
        const auto& top = m_levels[get_top_level(tess)];
        for (int t = top[0]; t < top[1]; ++t) {
            for (int c : m_triangles[t]) m_connected[tess][c] = true;
        }
    }
}

} // namespace Ctess
