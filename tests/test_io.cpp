#include "test_fixtures.hpp"
#include "io/config_parser.hpp"
#include "io/model_loader.hpp"
#include "io/model_serializer.hpp"
#include "numerics/vector_unit.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace Ctess;
using namespace ctess_test;

namespace {

void expect_same_profiles(const Model& a, const Model& b) {
    ASSERT_EQ(a.get_n_vertices(), b.get_n_vertices());
    ASSERT_EQ(a.get_n_layers(), b.get_n_layers());
    for (int v = 0; v < a.get_n_vertices(); ++v) {
        for (int l = 0; l < a.get_n_layers(); ++l) {
            const Profile& pa = a.get_profile(v, l);
            const Profile& pb = b.get_profile(v, l);
            ASSERT_EQ(pa.get_type(), pb.get_type());
            EXPECT_EQ(pa.get_radii(), pb.get_radii());
            ASSERT_EQ(pa.get_n_data(), pb.get_n_data());
            for (int k = 0; k < pa.get_n_data(); ++k) EXPECT_EQ(pa.get_data(k), pb.get_data(k));
        }
    }
}

} // namespace

TEST(BinaryModelSerializer, GridRoundTrip) {
    io::BinaryModelSerializer serializer;
    auto grid = make_grid(2, true);
    std::string path = temp_path("grid.ctg");
    serializer.save_grid(*grid, path);
    auto loaded = serializer.load_grid(path);
    EXPECT_EQ(loaded->get_grid_id(), grid->get_grid_id());
    EXPECT_EQ(loaded->get_vertices(), grid->get_vertices());
    EXPECT_EQ(loaded->get_triangles(), grid->get_triangles());
    EXPECT_EQ(loaded->get_levels(), grid->get_levels());
    EXPECT_EQ(loaded->get_tessellations(), grid->get_tessellations());
}

TEST(BinaryModelSerializer, ModelWithEmbeddedGrid) {
    io::BinaryModelSerializer serializer;
    auto grid = make_grid(1);
    auto model = make_layered_model(grid, DataType::FLOAT);
    Data d(DataType::FLOAT, std::vector<real_t>{NaN, 3.5});
    model->set_profile(4, 2, Profile::make_constant(6341.f, 6371.f, d));
    model->set_profile(5, 2, Profile::make_empty(6341.f, 6371.f));
    std::string path = temp_path("embedded.ctm");
    serializer.save_model(*model, path);

    GridRegistry registry;
    auto loaded = serializer.load_model(path, registry);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(loaded->get_grid().get_grid_id(), grid->get_grid_id());
    EXPECT_EQ(loaded->get_metadata().get_layer_names(), model->get_metadata().get_layer_names());
    EXPECT_EQ(loaded->get_metadata().get_attribute_units(), model->get_metadata().get_attribute_units());
    EXPECT_EQ(loaded->get_metadata().get_data_type(), DataType::FLOAT);
    EXPECT_EQ(loaded->get_metadata().get_earth_shape(), EarthShapeType::SPHERE);
    expect_same_profiles(*model, *loaded);
    EXPECT_TRUE(std::isnan(loaded->get_value(4, 2, 0, 0)));

    // a second load shares the registered grid
    auto again = serializer.load_model(path, registry);
    EXPECT_EQ(again->get_grid_ptr(), loaded->get_grid_ptr());
}

TEST(BinaryModelSerializer, ModelWithExternalGridSharesRegistry) {
    io::BinaryModelSerializer serializer;
    auto grid = make_grid(1);
    std::string grid_path = temp_path("shared.ctg");
    serializer.save_grid(*grid, grid_path);
    std::string grid_name = std::filesystem::path(grid_path).filename().string();

    auto layered = make_layered_model(grid, DataType::SHORT);
    auto surface = make_surface_model(grid);
    std::string layered_path = temp_path("layered.ctm");
    std::string surface_path = temp_path("surface.ctm");
    serializer.save_model(*layered, layered_path, grid_name);
    serializer.save_model(*surface, surface_path, grid_name);

    GridRegistry registry;
    auto a = serializer.load_model(layered_path, registry);
    auto b = serializer.load_model(surface_path, registry);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(a->get_grid_ptr(), b->get_grid_ptr());
    expect_same_profiles(*layered, *a);
    expect_same_profiles(*surface, *b);
    EXPECT_EQ(a->get_data(3, 1, 2).get_data_type(), DataType::SHORT);

    std::filesystem::remove(grid_path);
    GridRegistry empty;
    EXPECT_THROW(serializer.load_model(layered_path, empty), std::runtime_error);
    // with the grid registered, the missing file is never opened
    EXPECT_NO_THROW(serializer.load_model(layered_path, registry));
}

TEST(BinaryModelSerializer, RejectsForeignFiles) {
    io::BinaryModelSerializer serializer;
    std::string path = temp_path("garbage.ctm");
    {
        std::ofstream out(path, std::ios::binary);
        out << "this is not a model file";
    }
    GridRegistry registry;
    EXPECT_THROW(serializer.load_model(path, registry), std::runtime_error);
    EXPECT_THROW(serializer.load_grid(path), std::runtime_error);
    EXPECT_THROW(serializer.load_grid(temp_path("does_not_exist.ctg")), std::runtime_error);

    auto grid = make_grid(0);
    std::string grid_path = temp_path("grid_as_model.ctg");
    serializer.save_grid(*grid, grid_path);
    EXPECT_THROW(serializer.load_model(grid_path, registry), std::runtime_error);
}

TEST(ConfigParser, ReadsAllSections) {
    std::istringstream input(
        "# model setup\n"
        "[Model]\n"
        "file_path = /data/model.ctm\n"
        "grid_directory = /data/grids\n"
        "\n"
        "[Interpolation]\n"
        "horizontal = Natural_Neighbor\n"
        "radial = cubic_spline\n"
        "radius_out_of_range_allowed = false\n"
        "max_tess_level = 4\n"
        "; quiet\n"
        "[Logging]\n"
        "verbose = yes\n");
    io::ConfigParser parser;
    io::ModelConfig config = parser.parse(input, "inline");
    EXPECT_EQ(config.model_path, "/data/model.ctm");
    EXPECT_EQ(config.grid_directory, "/data/grids");
    EXPECT_EQ(config.horizontal, InterpolatorType::NATURAL_NEIGHBOR);
    EXPECT_EQ(config.radial, InterpolatorType::CUBIC_SPLINE);
    EXPECT_FALSE(config.radius_out_of_range_allowed);
    EXPECT_EQ(config.max_tess_level, 4);
    EXPECT_TRUE(config.verbose);
}

TEST(ConfigParser, Defaults) {
    std::istringstream input("[Model]\nfile_path=m.ctm\n");
    io::ModelConfig config = io::ConfigParser().parse(input, "inline");
    EXPECT_EQ(config.grid_directory, "");
    EXPECT_EQ(config.horizontal, InterpolatorType::LINEAR);
    EXPECT_EQ(config.radial, InterpolatorType::LINEAR);
    EXPECT_TRUE(config.radius_out_of_range_allowed);
    EXPECT_EQ(config.max_tess_level, -1);
    EXPECT_FALSE(config.verbose);
}

TEST(ConfigParser, ReportsErrorsWithSource) {
    auto parse = [](const std::string& text) {
        std::istringstream input(text);
        return io::ConfigParser().parse(input, "bad.ini");
    };
    EXPECT_THROW(parse("[Interpolation]\nhorizontal = linear\n"), std::runtime_error);
    EXPECT_THROW(parse("[Model]\nfile_path = m\n[Interpolation]\nhorizontal = cubic_spline\n"), std::runtime_error);
    EXPECT_THROW(parse("[Model]\nfile_path = m\n[Interpolation]\nradial = natural_neighbor\n"), std::runtime_error);
    EXPECT_THROW(parse("[Model]\nfile_path = m\n[Interpolation]\nmax_tess_level = 3x\n"), std::runtime_error);
    EXPECT_THROW(parse("[Model]\nfile_path = m\n[Logging]\nverbose = maybe\n"), std::runtime_error);
    EXPECT_THROW(parse("file_path = m\n"), std::runtime_error);
    try {
        parse("[Model]\nfile_path m\n");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("bad.ini"), std::string::npos);
        EXPECT_NE(message.find("line 2"), std::string::npos);
    }
    EXPECT_THROW(io::ConfigParser().parse(temp_path("missing.ini")), std::runtime_error);
}

TEST(ModelLoader, LoadsModelAndConfiguresPosition) {
    io::BinaryModelSerializer serializer;
    auto grid = make_grid(2);
    auto model = make_layered_model(grid);
    std::string grid_dir = temp_path("grids");
    std::filesystem::create_directories(grid_dir);
    serializer.save_grid(*grid, grid_dir + "/layered.ctg");
    std::string model_path = temp_path("loader.ctm");
    serializer.save_model(*model, model_path, "layered.ctg");

    std::string config_path = temp_path("loader.ini");
    {
        std::ofstream out(config_path);
        out << "[Model]\n"
            << "file_path = " << model_path << "\n"
            << "grid_directory = " << grid_dir << "\n"
            << "[Interpolation]\n"
            << "horizontal = natural_neighbor\n"
            << "radius_out_of_range_allowed = false\n"
            << "max_tess_level = 1\n"
            << "[Logging]\n"
            << "verbose = true\n";
    }

    GridRegistry registry;
    io::ModelLoader loader(registry);
    io::ModelConfig config;
    testing::internal::CaptureStdout();
    std::shared_ptr<Model> loaded = loader.load(config_path, config);
    std::unique_ptr<Position> position = loader.make_position(*loaded, config);
    std::string log = testing::internal::GetCapturedStdout();
    EXPECT_NE(log.find("ModelLoader: grid " + grid->get_grid_id() + " loaded"), std::string::npos);

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(position->get_horizontal_type(), InterpolatorType::NATURAL_NEIGHBOR);
    EXPECT_FALSE(position->is_radius_out_of_range_allowed());
    EXPECT_EQ(position->get_max_tess_level(0), 1);

    Vec3 u = vector_unit::vector_degrees(30.0, 60.0);
    position->set(u, 5000.0);
    EXPECT_EQ(position->get_tess_level(), 1);
    EXPECT_NEAR(position->get_value(0), layered_vp(1, 5000.0), 1e-9);

    config.verbose = false;
    std::shared_ptr<Model> second = loader.load(config);
    EXPECT_EQ(second->get_grid_ptr(), loaded->get_grid_ptr());
}
