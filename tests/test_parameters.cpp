#include "core/parameters.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

using namespace arp;

class ParametersTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a temporary directory for test files
        const std::string test_name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        temp_dir_ = std::filesystem::temp_directory_path() / ("arplace_parameters_" + test_name);
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        // Clean up temporary directory
        if (std::filesystem::exists(temp_dir_)) {
            std::filesystem::remove_all(temp_dir_);
        }
    }

    std::filesystem::path writeFile(const std::string& name, const std::string& content) {
        auto path = temp_dir_ / name;
        std::ofstream file(path);
        file << content;
        return path;
    }

    std::filesystem::path temp_dir_;
};

TEST_F(ParametersTest, DefaultsMatchPlacementBehavior) {
    param::PlacementParameters params;
    EXPECT_FLOAT_EQ(params.free_form_distance, 0.2f);
    EXPECT_FLOAT_EQ(params.drag_threshold, 40.0f);
    EXPECT_FALSE(params.show_surfaces);
    EXPECT_FLOAT_EQ(params.surface_opacity, 0.25f);
    EXPECT_EQ(params.initial_mode, PlacementMode::FreeForm);
    EXPECT_EQ(params.reference_image_group, "AR Resources");
}

TEST_F(ParametersTest, WriteReadCompare) {
    param::AppParameters original;
    original.placement.free_form_distance = 0.5f;
    original.placement.drag_threshold = 25.0f;
    original.placement.show_surfaces = true;
    original.placement.initial_mode = PlacementMode::Marker;
    original.placement.reference_image_group = "Posters";
    original.placement.reference_images = {"a", "b", "c"};
    original.placement.models = {"chair"};
    original.simulation.viewport_width = 640;
    original.simulation.viewport_height = 480;
    original.simulation.vertical_fov = 75.0f;

    auto path = temp_dir_ / "nested" / "config.json";
    auto saved = param::save_app_params_to_json(original, path);
    ASSERT_TRUE(saved.has_value()) << saved.error();
    ASSERT_TRUE(std::filesystem::exists(path));

    auto loaded = param::read_app_params_from_json(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error();

    const auto& p = loaded->placement;
    EXPECT_FLOAT_EQ(p.free_form_distance, 0.5f);
    EXPECT_FLOAT_EQ(p.drag_threshold, 25.0f);
    EXPECT_TRUE(p.show_surfaces);
    EXPECT_EQ(p.initial_mode, PlacementMode::Marker);
    EXPECT_EQ(p.reference_image_group, "Posters");
    EXPECT_EQ(p.reference_images, original.placement.reference_images);
    EXPECT_EQ(p.models, original.placement.models);
    EXPECT_EQ(loaded->simulation.viewport_width, 640);
    EXPECT_EQ(loaded->simulation.viewport_height, 480);
    EXPECT_FLOAT_EQ(loaded->simulation.vertical_fov, 75.0f);
    EXPECT_EQ(loaded->config_file, path);

    // Verify file structure
    std::ifstream file(path);
    nlohmann::json json_content;
    file >> json_content;
    EXPECT_TRUE(json_content.contains("placement")) << "Missing placement field";
    EXPECT_TRUE(json_content.contains("simulation")) << "Missing simulation field";
    EXPECT_EQ(json_content["placement"]["initial_mode"].get<std::string>(), "marker");
}

TEST_F(ParametersTest, MissingFieldsKeepDefaults) {
    auto path = writeFile("partial.json", R"({"placement": {"show_surfaces": true}})");

    auto loaded = param::read_app_params_from_json(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    EXPECT_TRUE(loaded->placement.show_surfaces);
    EXPECT_FLOAT_EQ(loaded->placement.drag_threshold, 40.0f);
    EXPECT_EQ(loaded->simulation.viewport_width, param::SimulationParameters{}.viewport_width);
}

TEST_F(ParametersTest, InvalidValuesFallBackToDefaults) {
    auto path = writeFile("invalid.json", R"({
        "placement": {"initial_mode": "sideways", "drag_threshold": -3,
                      "free_form_distance": -0.5, "surface_opacity": 1.5},
        "simulation": {"viewport_width": 0, "vertical_fov": 200}
    })");

    auto loaded = param::read_app_params_from_json(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    EXPECT_EQ(loaded->placement.initial_mode, PlacementMode::FreeForm);
    EXPECT_FLOAT_EQ(loaded->placement.drag_threshold, 40.0f);
    EXPECT_FLOAT_EQ(loaded->placement.free_form_distance, 0.2f);
    EXPECT_FLOAT_EQ(loaded->placement.surface_opacity, 0.25f);
    EXPECT_EQ(loaded->simulation.viewport_width, param::SimulationParameters{}.viewport_width);
    EXPECT_FLOAT_EQ(loaded->simulation.vertical_fov, param::SimulationParameters{}.vertical_fov);
}

TEST_F(ParametersTest, ModeAliasesAccepted) {
    auto path = writeFile("alias.json", R"({"placement": {"initial_mode": "Plane"}})");
    auto loaded = param::read_app_params_from_json(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->placement.initial_mode, PlacementMode::Surface);
}

TEST_F(ParametersTest, MissingFileIsError) {
    auto loaded = param::read_app_params_from_json(temp_dir_ / "does_not_exist.json");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_NE(loaded.error().find("does not exist"), std::string::npos);
}

TEST_F(ParametersTest, MalformedJsonIsError) {
    auto path = writeFile("broken.json", "{ \"placement\": ");
    auto loaded = param::read_app_params_from_json(path);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_NE(loaded.error().find("JSON parsing error"), std::string::npos);
}

TEST_F(ParametersTest, WrongTypeIsError) {
    auto path = writeFile("wrong_type.json", R"({"placement": {"drag_threshold": "far"}})");
    auto loaded = param::read_app_params_from_json(path);
    EXPECT_FALSE(loaded.has_value());
}

TEST(PlacementModeTest, ParseAndPrint) {
    for (auto mode : {PlacementMode::FreeForm, PlacementMode::Surface, PlacementMode::Marker}) {
        auto parsed = parse_placement_mode(to_string(mode));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, mode);
    }
    EXPECT_EQ(parse_placement_mode("IMAGE"), PlacementMode::Marker);
    EXPECT_EQ(parse_placement_mode("free"), PlacementMode::FreeForm);
    EXPECT_FALSE(parse_placement_mode("").has_value());
    EXPECT_FALSE(parse_placement_mode("orbit").has_value());
}

TEST(LogLevelTest, ParseLogLevel) {
    EXPECT_EQ(core::parse_log_level("warning"), core::LogLevel::Warn);
    EXPECT_EQ(core::parse_log_level("off"), core::LogLevel::Off);
    EXPECT_FALSE(core::parse_log_level("loud").has_value());

    EXPECT_EQ(core::parse_log_module("tracking"), core::LogModule::Tracking);
    EXPECT_EQ(core::parse_log_module("session"), core::LogModule::Session);
    EXPECT_FALSE(core::parse_log_module("renderer").has_value());
}
