#ifndef Ctess_GRID_HPP
#define Ctess_GRID_HPP

#include "core/tess_types.hpp"
#include "core/tess_constants.hpp"
#include <array>
#include <vector>
#include <string>
#include <mutex> // For std::once_flag

namespace Ctess {

// Directed edge vj -> vk of one tessellation level, as seen from outside
// the sphere. Spokes of the same hub vertex form a circular list ordered
// clockwise, so that get_spoke(s.next).t_left == s.t_right.
struct Spoke {
    int vj = INVALID_INDEX;      // hub vertex
    int vk = INVALID_INDEX;      // far vertex
    int t_left = INVALID_INDEX;  // triangle to the left of vj -> vk
    int t_right = INVALID_INDEX; // triangle to the right of vj -> vk
    int corner = INVALID_INDEX;  // corner index of vj in t_left
    int twin = INVALID_INDEX;    // spoke vk -> vj
    int next = INVALID_INDEX;    // next spoke clockwise around vj
};

// Circle through the three corners of a triangle. A unit vector u lies
// inside the circle when dot(center, u) > cos_radius.
struct CircumCenter {
    Vec3 center = {0.0, 0.0, 0.0};
    real_t cos_radius = 1.0;
};

// Multi-level, multi-tessellation triangulation of the unit sphere.
//
// Triangles are indexed globally; a level is a contiguous range of them
// [first, last) that covers the whole sphere, and a tessellation is an
// ordered list of levels, coarsest first, each a refinement of the one
// before. Corners are counter-clockwise seen from outside the sphere.
// Neighbor i of a triangle lies across the edge opposite corner i.
//
// A Grid is immutable once constructed and is meant to be shared between
// models (see GridRegistry) and between threads.
class Grid {
public:
    Grid(std::vector<Vec3> vertices,
         std::vector<std::array<int, 3>> triangles,
         std::vector<std::array<int, 2>> levels,
         std::vector<std::vector<int>> tessellations,
         const std::string& grid_id = "",
         const std::string& description = "");

    Grid(const Grid&) = delete;
    Grid& operator=(const Grid&) = delete;

    // --- Identity ---
    const std::string& get_grid_id() const { return m_grid_id; }
    const std::string& get_description() const { return m_description; }

    // 64-bit content hash of the topology, as 16 hex digits.
    static std::string compute_grid_id(const std::vector<Vec3>& vertices,
                                       const std::vector<std::array<int, 3>>& triangles,
                                       const std::vector<std::array<int, 2>>& levels,
                                       const std::vector<std::vector<int>>& tessellations);

    // --- Sizes ---
    int get_n_vertices() const { return static_cast<int>(m_vertices.size()); }
    int get_n_triangles() const { return static_cast<int>(m_triangles.size()); }
    int get_n_levels() const { return static_cast<int>(m_levels.size()); }
    int get_n_tessellations() const { return static_cast<int>(m_tessellations.size()); }
    int get_n_levels(int tess) const;

    // --- Levels and tessellations ---
    // Global level index of level relative_level of tessellation tess.
    int get_level(int tess, int relative_level) const;
    int get_top_level(int tess) const;
    int get_first_triangle(int level) const;
    int get_last_triangle(int level) const; // one past the last
    int get_level_of_triangle(int triangle) const { return m_triangle_level[triangle]; }
    int get_tessellation_of_level(int level) const { return m_level_tess[level]; }

    // --- Geometry and topology ---
    const Vec3& get_vertex(int vertex) const { return m_vertices[vertex]; }
    const std::vector<Vec3>& get_vertices() const { return m_vertices; }
    const std::array<int, 3>& get_triangle_vertices(int triangle) const { return m_triangles[triangle]; }
    const std::vector<std::array<int, 3>>& get_triangles() const { return m_triangles; }
    const std::vector<std::array<int, 2>>& get_levels() const { return m_levels; }
    const std::vector<std::vector<int>>& get_tessellations() const { return m_tessellations; }
    int get_neighbor(int triangle, int side) const { return m_neighbors[triangle][side]; }
    // Triangle of the next finer level containing this triangle's center,
    // or INVALID_INDEX on the top level of a tessellation.
    int get_descendant(int triangle) const { return m_descendants[triangle]; }

    // Great-circle side test: dot of u with the normal of the edge opposite
    // corner `side`. Non-negative on the triangle's side of that edge.
    real_t get_edge_side(int triangle, int side, const Vec3& u) const;
    bool contains(int triangle, const Vec3& u) const;

    // Vertices used by the top level of tessellation tess.
    const std::vector<bool>& get_connected_vertices(int tess) const { return m_connected[tess]; }

    // --- Point location ---
    // Walking-triangle search within the level of start_triangle.
    // Throws GeometryException if the walk does not converge.
    int find_triangle(int start_triangle, const Vec3& u) const;

    // Search on relative_level of tessellation tess. The walk starts from
    // hint when hint is a triangle of that level, otherwise it descends from
    // level 0 of the tessellation.
    int find_triangle(int tess, int relative_level, const Vec3& u, int hint) const;

    // --- Natural-neighbor support ---
    // Computed for every triangle on first use, once, safely across threads.
    const CircumCenter& get_circumcenter(int triangle) const;

    const Spoke& get_spoke(int spoke) const { return m_spokes[spoke]; }
    // Spoke from corner `corner` of triangle to the following corner; the
    // triangle is on its left.
    int get_triangle_spoke(int triangle, int corner) const { return 3 * triangle + corner; }
    // Some spoke whose hub is vertex on the given level, or INVALID_INDEX.
    int get_vertex_spoke(int level, int vertex) const;
    // Triangles of the given level incident to vertex, clockwise.
    std::vector<int> get_vertex_triangles(int level, int vertex) const;

private:
    std::string m_grid_id;
    std::string m_description;

    std::vector<Vec3> m_vertices;
    std::vector<std::array<int, 3>> m_triangles;
    std::vector<std::array<int, 2>> m_levels;
    std::vector<std::vector<int>> m_tessellations;

    std::vector<int> m_triangle_level;
    std::vector<int> m_level_tess;
    std::vector<std::array<int, 3>> m_neighbors;
    std::vector<std::array<Vec3, 3>> m_edge_normals;
    std::vector<int> m_descendants;
    std::vector<Spoke> m_spokes;
    std::vector<std::vector<int>> m_vertex_spokes; // [level][vertex]
    std::vector<std::vector<bool>> m_connected;    // [tess][vertex]

    mutable std::once_flag m_circumcenter_flag;
    mutable std::vector<CircumCenter> m_circumcenters;

    void validate_structure();
    void build_neighbors();
    void build_spokes();
    void build_descendants();
    void build_connectivity();
    void compute_circumcenters() const;
};

} // namespace Ctess

#endif // Ctess_GRID_HPP
