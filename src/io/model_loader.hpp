#ifndef Ctess_MODEL_LOADER_HPP
#define Ctess_MODEL_LOADER_HPP

#include "config_parser.hpp"
#include "model_serializer.hpp"
#include "grid/grid_registry.hpp"
#include "model/model.hpp"
#include "interp/position.hpp"
#include <memory>
#include <string>

namespace Ctess {
namespace io {

// Turns a ModelConfig into a loaded Model and Positions set up the way the
// configuration asks. Grids go through the caller's registry.
class ModelLoader {
public:
    explicit ModelLoader(GridRegistry& registry) : m_registry(registry) {}

    std::shared_ptr<Model> load(const ModelConfig& config) const;
    // Parses the configuration file first.
    std::shared_ptr<Model> load(const std::string& config_path, ModelConfig& config) const;

    std::unique_ptr<Position> make_position(const Model& model, const ModelConfig& config) const;

private:
    GridRegistry& m_registry;
    BinaryModelSerializer m_serializer;
};

} // namespace io
} // namespace Ctess

#endif // Ctess_MODEL_LOADER_HPP
