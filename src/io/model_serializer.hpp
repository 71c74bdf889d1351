#ifndef Ctess_MODEL_SERIALIZER_HPP
#define Ctess_MODEL_SERIALIZER_HPP

#include "grid/grid.hpp"
#include "grid/grid_registry.hpp"
#include "model/model.hpp"
#include <cstdint>
#include <fstream> // For file streams
#include <memory>
#include <string>
#include <vector>

namespace Ctess {
namespace io {

// Binary grid (.ctg) and model (.ctm) files in host byte order.
//
// A model file either embeds its grid or names a separate grid file
// (relative to a grid directory) together with the grid's id. Grids are
// resolved through a GridRegistry so that models on the same grid share it.
class BinaryModelSerializer {
public:
    void save_grid(const Grid& grid, const std::string& path) const;
    std::shared_ptr<const Grid> load_grid(const std::string& path) const;

    // With an empty grid_file the grid is embedded in the model file;
    // otherwise only grid_file and the grid id are recorded and the grid
    // must be saved separately with save_grid.
    void save_model(const Model& model, const std::string& path,
                    const std::string& grid_file = "") const;

    // grid_directory defaults to the directory of path. The loaded model
    // has passed Model::test_model_integrity (repairs logged when verbose).
    std::shared_ptr<Model> load_model(const std::string& path, GridRegistry& registry,
                                      const std::string& grid_directory = "",
                                      bool verbose = false) const;

private:
    void write_grid_body(std::ofstream& out, const Grid& grid) const;
    std::shared_ptr<const Grid> read_grid_body(std::ifstream& in, const std::string& path) const;

    void write_profile(std::ofstream& out, const Profile& profile) const;
    Profile read_profile(std::ifstream& in, DataType type, int n_attributes, const std::string& path) const;

    // Helper to write basic types
    template<typename T>
    void write_binary(std::ofstream& out, const T& value) const {
        out.write(reinterpret_cast<const char*>(&value), sizeof(T));
    }

    template<typename T>
    void read_binary(std::ifstream& in, T& value) const {
        in.read(reinterpret_cast<char*>(&value), sizeof(T));
    }

    void write_string(std::ofstream& out, const std::string& s) const {
        write_binary(out, static_cast<std::uint32_t>(s.size()));
        out.write(s.data(), static_cast<std::streamsize>(s.size()));
    }
    std::string read_string(std::ifstream& in, const std::string& path) const;

    // Count prefix of an array; throws on a read failure or a count beyond
    // what any sane file holds.
    std::uint32_t read_count(std::ifstream& in, const std::string& path, const char* what) const;
};

} // namespace io
} // namespace Ctess

#endif // Ctess_MODEL_SERIALIZER_HPP
