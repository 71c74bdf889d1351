#include "model_serializer.hpp"
#include <filesystem>
#include <stdexcept> // For runtime_error

namespace Ctess {
namespace io {

namespace {

const std::uint32_t MAGIC_NUMBER_GRID = 0x47535443;  // "CTSG"
const std::uint32_t MAGIC_NUMBER_MODEL = 0x4D535443; // "CTSM"
const std::uint16_t FILE_FORMAT_VERSION = 1;
const std::uint32_t MAX_COUNT = 1u << 28;
const char* EMBEDDED_GRID = "*";

void check_stream(const std::ios& stream, const std::string& path, const char* what) {
    if (!stream.good()) {
        throw std::runtime_error(std::string("Error occurred while ") + what + ": " + path);
    }
}

} // anonymous namespace

std::string BinaryModelSerializer::read_string(std::ifstream& in, const std::string& path) const {
    std::uint32_t size = read_count(in, path, "string");
    std::string s(size, '\0');
    in.read(&s[0], static_cast<std::streamsize>(size));
    check_stream(in, path, "reading a string");
    return s;
}

std::uint32_t BinaryModelSerializer::read_count(std::ifstream& in, const std::string& path, const char* what) const {
    std::uint32_t count = 0;
    read_binary(in, count);
    check_stream(in, path, "reading an array size");
    if (count > MAX_COUNT) {
        throw std::runtime_error("Corrupt file (" + std::string(what) + " count " + std::to_string(count) + "): " + path);
    }
    return count;
}

// --- Grid ---

void BinaryModelSerializer::save_grid(const Grid& grid, const std::string& path) const {
    std::ofstream outfile(path, std::ios::binary | std::ios::trunc);
    if (!outfile.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    write_binary(outfile, MAGIC_NUMBER_GRID);
    write_binary(outfile, FILE_FORMAT_VERSION);
    write_grid_body(outfile, grid);
    check_stream(outfile, path, "writing grid");
}

std::shared_ptr<const Grid> BinaryModelSerializer::load_grid(const std::string& path) const {
    std::ifstream infile(path, std::ios::binary);
    if (!infile.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + path);
    }
    std::uint32_t magic = 0;
    std::uint16_t version = 0;
    read_binary(infile, magic);
    read_binary(infile, version);
    if (magic != MAGIC_NUMBER_GRID) {
        throw std::runtime_error("Invalid file format (magic number mismatch) for grid: " + path);
    }
    if (version != FILE_FORMAT_VERSION) {
        throw std::runtime_error("Unsupported file format version for grid: " + path);
    }
    return read_grid_body(infile, path);
}

void BinaryModelSerializer::write_grid_body(std::ofstream& out, const Grid& grid) const {
    write_string(out, grid.get_grid_id());
    write_string(out, grid.get_description());

    write_binary(out, static_cast<std::uint32_t>(grid.get_n_vertices()));
    for (const auto& v : grid.get_vertices()) {
        for (real_t x : v) write_binary(out, x);
    }
    write_binary(out, static_cast<std::uint32_t>(grid.get_n_triangles()));
    for (const auto& t : grid.get_triangles()) {
        for (int c : t) write_binary(out, static_cast<std::int32_t>(c));
    }
    write_binary(out, static_cast<std::uint32_t>(grid.get_n_levels()));
    for (const auto& l : grid.get_levels()) {
        write_binary(out, static_cast<std::int32_t>(l[0]));
        write_binary(out, static_cast<std::int32_t>(l[1]));
    }
    write_binary(out, static_cast<std::uint32_t>(grid.get_n_tessellations()));
    for (const auto& tess : grid.get_tessellations()) {
        write_binary(out, static_cast<std::uint32_t>(tess.size()));
        for (int l : tess) write_binary(out, static_cast<std::int32_t>(l));
    }
}

std::shared_ptr<const Grid> BinaryModelSerializer::read_grid_body(std::ifstream& in, const std::string& path) const {
    std::string grid_id = read_string(in, path);
    std::string description = read_string(in, path);

    std::vector<Vec3> vertices(read_count(in, path, "vertex"));
    for (auto& v : vertices) {
        for (real_t& x : v) read_binary(in, x);
    }
    std::vector<std::array<int, 3>> triangles(read_count(in, path, "triangle"));
    for (auto& t : triangles) {
        for (int& c : t) {
            std::int32_t value = 0;
            read_binary(in, value);
            c = value;
        }
    }
    std::vector<std::array<int, 2>> levels(read_count(in, path, "level"));
    for (auto& l : levels) {
        std::int32_t first = 0, last = 0;
        read_binary(in, first);
        read_binary(in, last);
        l = {first, last};
    }
    std::vector<std::vector<int>> tessellations(read_count(in, path, "tessellation"));
    for (auto& tess : tessellations) {
        tess.resize(read_count(in, path, "tessellation level"));
        for (int& l : tess) {
            std::int32_t value = 0;
            read_binary(in, value);
            l = value;
        }
    }
    check_stream(in, path, "reading grid");

    return std::make_shared<Grid>(std::move(vertices), std::move(triangles), std::move(levels),
                                  std::move(tessellations), grid_id, description);
}

// --- Profiles ---

void BinaryModelSerializer::write_profile(std::ofstream& out, const Profile& profile) const {
    write_binary(out, static_cast<std::int8_t>(profile.get_type()));
    write_binary(out, static_cast<std::uint32_t>(profile.get_n_radii()));
    for (float r : profile.get_radii()) write_binary(out, r);
    write_binary(out, static_cast<std::uint32_t>(profile.get_n_data()));
    for (const Data& data : profile.get_data()) {
        for (size_t a = 0; a < data.size(); ++a) {
            switch (data.get_data_type()) {
                case DataType::DOUBLE: write_binary(out, data.get_double(a)); break;
                case DataType::FLOAT: write_binary(out, data.get_float(a)); break;
                case DataType::LONG: write_binary(out, data.get_long(a)); break;
                case DataType::INT: write_binary(out, data.get_int(a)); break;
                case DataType::SHORT: write_binary(out, data.get_short(a)); break;
                case DataType::BYTE: write_binary(out, data.get_byte(a)); break;
            }
        }
    }
}

Profile BinaryModelSerializer::read_profile(std::ifstream& in, DataType type, int n_attributes,
                                            const std::string& path) const {
    std::int8_t type_tag = 0;
    read_binary(in, type_tag);
    if (type_tag < 0 || type_tag > static_cast<std::int8_t>(ProfileType::SURFACE_EMPTY)) {
        throw std::runtime_error("Corrupt file (profile type " + std::to_string(type_tag) + "): " + path);
    }
    std::vector<float> radii(read_count(in, path, "radius"));
    for (float& r : radii) read_binary(in, r);

    std::vector<Data> data;
    std::uint32_t n_data = read_count(in, path, "data");
    data.reserve(n_data);
    for (std::uint32_t k = 0; k < n_data; ++k) {
        Data d(type, static_cast<size_t>(n_attributes));
        for (int a = 0; a < n_attributes; ++a) {
            real_t value = 0.0;
            switch (type) {
                case DataType::DOUBLE: { double v; read_binary(in, v); value = v; break; }
                case DataType::FLOAT: { float v; read_binary(in, v); value = v; break; }
                case DataType::LONG: { std::int64_t v; read_binary(in, v); value = static_cast<real_t>(v); break; }
                case DataType::INT: { std::int32_t v; read_binary(in, v); value = v; break; }
                case DataType::SHORT: { std::int16_t v; read_binary(in, v); value = v; break; }
                case DataType::BYTE: { std::int8_t v; read_binary(in, v); value = v; break; }
            }
            d.set_value(static_cast<size_t>(a), value);
        }
        data.push_back(d);
    }
    check_stream(in, path, "reading a profile");

    try {
        return Profile::make(static_cast<ProfileType>(type_tag), std::move(radii), std::move(data));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid profile in " + path + ": " + e.what());
    }
}

// --- Model ---

void BinaryModelSerializer::save_model(const Model& model, const std::string& path,
                                       const std::string& grid_file) const {
    std::ofstream outfile(path, std::ios::binary | std::ios::trunc);
    if (!outfile.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }

    write_binary(outfile, MAGIC_NUMBER_MODEL);
    write_binary(outfile, FILE_FORMAT_VERSION);

    const ModelMetaData& md = model.get_metadata();
    write_string(outfile, md.get_description());
    write_binary(outfile, static_cast<std::uint32_t>(md.get_n_layers()));
    for (int l = 0; l < md.get_n_layers(); ++l) {
        write_string(outfile, md.get_layer_name(l));
        write_binary(outfile, static_cast<std::int32_t>(md.get_tessellation(l)));
    }
    write_binary(outfile, static_cast<std::uint32_t>(md.get_n_attributes()));
    for (int a = 0; a < md.get_n_attributes(); ++a) {
        write_string(outfile, md.get_attribute_name(a));
        write_string(outfile, md.get_attribute_unit(a));
    }
    write_binary(outfile, static_cast<std::int8_t>(md.get_data_type()));
    write_binary(outfile, static_cast<std::int8_t>(md.get_earth_shape()));
    write_string(outfile, md.get_model_software_version());
    write_string(outfile, md.get_model_generation_date());

    // Grid reference, then the embedded grid if any.
    write_string(outfile, grid_file.empty() ? std::string(EMBEDDED_GRID) : grid_file);
    write_string(outfile, model.get_grid().get_grid_id());
    if (grid_file.empty()) {
        write_grid_body(outfile, model.get_grid());
    }

    write_binary(outfile, static_cast<std::uint32_t>(model.get_n_vertices()));
    for (int v = 0; v < model.get_n_vertices(); ++v) {
        for (int l = 0; l < model.get_n_layers(); ++l) {
            write_profile(outfile, model.get_profile(v, l));
        }
    }
    check_stream(outfile, path, "writing model");
}

std::shared_ptr<Model> BinaryModelSerializer::load_model(const std::string& path, GridRegistry& registry,
                                                         const std::string& grid_directory,
                                                         bool verbose) const {
    std::ifstream infile(path, std::ios::binary);
    if (!infile.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + path);
    }
    std::uint32_t magic = 0;
    std::uint16_t version = 0;
    read_binary(infile, magic);
    read_binary(infile, version);
    if (magic != MAGIC_NUMBER_MODEL) {
        throw std::runtime_error("Invalid file format (magic number mismatch) for model: " + path);
    }
    if (version != FILE_FORMAT_VERSION) {
        throw std::runtime_error("Unsupported file format version for model: " + path);
    }

    ModelMetaData md;
    md.set_description(read_string(infile, path));
    std::vector<std::string> layer_names(read_count(infile, path, "layer"));
    std::vector<int> layer_tess(layer_names.size());
    for (size_t l = 0; l < layer_names.size(); ++l) {
        layer_names[l] = read_string(infile, path);
        std::int32_t tess = 0;
        read_binary(infile, tess);
        layer_tess[l] = tess;
    }
    md.set_layers(layer_names, layer_tess);
    std::vector<std::string> names(read_count(infile, path, "attribute"));
    std::vector<std::string> units(names.size());
    for (size_t a = 0; a < names.size(); ++a) {
        names[a] = read_string(infile, path);
        units[a] = read_string(infile, path);
    }
    md.set_attributes(names, units);
    std::int8_t data_type = 0, earth_shape = 0;
    read_binary(infile, data_type);
    read_binary(infile, earth_shape);
    check_stream(infile, path, "reading model metadata");
    if (data_type < 0 || data_type > static_cast<std::int8_t>(DataType::BYTE) ||
        earth_shape < 0 || earth_shape > static_cast<std::int8_t>(EarthShapeType::IERS2003_RCONST)) {
        throw std::runtime_error("Corrupt file (data type or earth shape): " + path);
    }
    md.set_data_type(static_cast<DataType>(data_type));
    md.set_earth_shape(static_cast<EarthShapeType>(earth_shape));
    md.set_model_software_version(read_string(infile, path));
    md.set_model_generation_date(read_string(infile, path));

    std::string grid_file = read_string(infile, path);
    std::string grid_id = read_string(infile, path);
    std::shared_ptr<const Grid> grid;
    if (grid_file == EMBEDDED_GRID) {
        std::shared_ptr<const Grid> embedded = read_grid_body(infile, path);
        if (embedded->get_grid_id() != grid_id) {
            throw std::runtime_error("Embedded grid id " + embedded->get_grid_id() +
                                     " does not match the recorded id " + grid_id + ": " + path);
        }
        grid = registry.insert_if_absent(embedded);
    } else {
        std::filesystem::path dir = grid_directory.empty()
            ? std::filesystem::path(path).parent_path()
            : std::filesystem::path(grid_directory);
        std::string grid_path = (dir / grid_file).string();
        grid = registry.get_or_load(grid_id, [this, &grid_path]() { return load_grid(grid_path); });
    }

    auto model = std::make_shared<Model>(grid, md);
    model->set_verbose(verbose);

    std::uint32_t n_vertices = read_count(infile, path, "vertex");
    if (static_cast<int>(n_vertices) != grid->get_n_vertices()) {
        throw std::runtime_error("Model has profiles for " + std::to_string(n_vertices) +
                                 " vertices but its grid has " + std::to_string(grid->get_n_vertices()) + ": " + path);
    }
    for (int v = 0; v < model->get_n_vertices(); ++v) {
        for (int l = 0; l < model->get_n_layers(); ++l) {
            model->set_profile(v, l, read_profile(infile, md.get_data_type(), md.get_n_attributes(), path));
        }
    }

    model->test_model_integrity();
    return model;
}

} // namespace io
} // namespace Ctess
