#include "grid_registry.hpp"
#include <stdexcept>

namespace Ctess {

GridRegistry::GridPtr GridRegistry::find(const std::string& grid_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_grids.find(grid_id);
    return it == m_grids.end() ? nullptr : it->second;
}

GridRegistry::GridPtr GridRegistry::insert_if_absent(GridPtr grid) {
    if (!grid) {
        throw std::invalid_argument("GridRegistry: cannot register a null grid.");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    auto result = m_grids.emplace(grid->get_grid_id(), grid);
    return result.first->second;
}

GridRegistry::GridPtr GridRegistry::get_or_load(const std::string& grid_id, const Loader& loader) {
    GridPtr grid = find(grid_id);
    if (grid) return grid;

    grid = loader();
    if (!grid) {
        throw std::runtime_error("GridRegistry: loader returned no grid for id " + grid_id + ".");
    }
    if (grid->get_grid_id() != grid_id) {
        throw std::runtime_error("GridRegistry: expected grid id " + grid_id +
                                 " but the loaded grid has id " + grid->get_grid_id() + ".");
    }
    return insert_if_absent(grid);
}

size_t GridRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_grids.size();
}

void GridRegistry::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_grids.clear();
}

} // namespace Ctess
