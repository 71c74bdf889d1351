#ifndef Ctess_GRID_REGISTRY_HPP
#define Ctess_GRID_REGISTRY_HPP

#include "grid.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace Ctess {

// Caller-owned cache of grids keyed by grid id, so that models built on the
// same grid share one copy. Safe for concurrent use.
class GridRegistry {
public:
    using GridPtr = std::shared_ptr<const Grid>;
    using Loader = std::function<GridPtr()>;

    GridRegistry() = default;
    GridRegistry(const GridRegistry&) = delete;
    GridRegistry& operator=(const GridRegistry&) = delete;

    // nullptr when no grid with that id is registered.
    GridPtr find(const std::string& grid_id) const;

    // Registers grid under its own id unless that id is taken, and returns
    // the registered instance (grid itself, or the one already present).
    GridPtr insert_if_absent(GridPtr grid);

    // Registered grid with id grid_id, calling loader to produce it when
    // absent. The loader runs without the lock held; if two threads load the
    // same id concurrently the first one to register wins.
    // Throws std::runtime_error if the loaded grid carries a different id.
    GridPtr get_or_load(const std::string& grid_id, const Loader& loader);

    size_t size() const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::map<std::string, GridPtr> m_grids;
};

} // namespace Ctess

#endif // Ctess_GRID_REGISTRY_HPP
