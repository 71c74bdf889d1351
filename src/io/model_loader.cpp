#include "model_loader.hpp"
#include <iostream>

namespace Ctess {
namespace io {

std::shared_ptr<Model> ModelLoader::load(const std::string& config_path, ModelConfig& config) const {
    ConfigParser parser;
    config = parser.parse(config_path);
    if (config.verbose) {
        std::cout << "ModelLoader: config file '" << config_path << "' parsed successfully." << std::endl;
    }
    return load(config);
}

std::shared_ptr<Model> ModelLoader::load(const ModelConfig& config) const {
    if (config.verbose) {
        std::cout << "ModelLoader: loading model " << config.model_path;
        if (!config.grid_directory.empty()) std::cout << " (grid directory " << config.grid_directory << ")";
        std::cout << std::endl;
    }

    size_t grids_before = m_registry.size();
    std::shared_ptr<Model> model = m_serializer.load_model(config.model_path, m_registry,
                                                           config.grid_directory, config.verbose);

    if (config.verbose) {
        const Grid& grid = model->get_grid();
        const ModelMetaData& md = model->get_metadata();
        std::cout << "ModelLoader: grid " << grid.get_grid_id()
                  << (m_registry.size() > grids_before ? " loaded" : " reused from registry")
                  << ": " << grid.get_n_vertices() << " vertices, " << grid.get_n_triangles()
                  << " triangles, " << grid.get_n_tessellations() << " tessellation(s)" << std::endl;
        std::cout << "ModelLoader: " << md.get_n_layers() << " layer(s), " << md.get_n_attributes()
                  << " attribute(s) of type " << to_string(md.get_data_type())
                  << ", earth shape " << to_string(md.get_earth_shape()) << std::endl;
    }
    return model;
}

std::unique_ptr<Position> ModelLoader::make_position(const Model& model, const ModelConfig& config) const {
    std::unique_ptr<Position> position = model.get_position(config.horizontal, config.radial);
    position->set_radius_out_of_range_allowed(config.radius_out_of_range_allowed);
    if (config.max_tess_level >= 0) {
        position->set_max_tess_level(config.max_tess_level);
    }
    if (config.verbose) {
        std::cout << "ModelLoader: position uses " << to_string(config.horizontal) << " horizontal and "
                  << to_string(config.radial) << " radial interpolation" << std::endl;
    }
    return position;
}

} // namespace io
} // namespace Ctess
