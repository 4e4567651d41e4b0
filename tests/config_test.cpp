#include "core/config.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>

using namespace cityfuse;
using core::PipelineConfig;
using nlohmann::json;

TEST(ConfigTest, DefaultsMatchTheDocumentedValues) {
    PipelineConfig config;
    EXPECT_EQ(config.reader.lod_prefix, "2");
    EXPECT_TRUE(config.reader.fold_building_parts);
    EXPECT_DOUBLE_EQ(config.match.search_radius_m, 25.0);
    EXPECT_EQ(config.match.max_candidates, 0u);
    EXPECT_EQ(config.merge.cityjson_key_prefix, "cityjson:");
    EXPECT_EQ(config.output.directory, std::filesystem::path("out"));
    EXPECT_EQ(config.output.record_suffix, "_bld");
    EXPECT_EQ(config.output.mesh_extension, ".glb");
    EXPECT_EQ(config.output.workers, 0u);
}

TEST(ConfigTest, OverridesOnlyTheNamedValues) {
    PipelineConfig config;
    std::string error;
    json document = {
        {"reader", {{"lod_prefix", "2.2"}}},
        {"match", {{"search_radius_m", 40.0}, {"max_candidates", 3}}},
        {"mesh", {{"roof_color", {0.5, 0.1, 0.1}}}},
        {"output", {{"directory", "results"}, {"workers", 4}}},
    };
    ASSERT_TRUE(core::apply_config(document, config, error)) << error;

    EXPECT_EQ(config.reader.lod_prefix, "2.2");
    EXPECT_DOUBLE_EQ(config.match.search_radius_m, 40.0);
    EXPECT_EQ(config.match.max_candidates, 3u);
    EXPECT_TRUE(config.match.select_all_containing);
    EXPECT_FLOAT_EQ(config.mesh.roof_color.r, 0.5f);
    EXPECT_FLOAT_EQ(config.mesh.roof_color.a, 1.0f);
    EXPECT_EQ(config.output.directory, std::filesystem::path("results"));
    EXPECT_EQ(config.output.workers, 4u);
    EXPECT_TRUE(config.output.write_summary);
}

TEST(ConfigTest, UnknownKeysAreIgnored) {
    PipelineConfig config;
    std::string error;
    json document = {
        {"match", {{"search_radius", 99.0}}},
        {"viewer", {{"fov", 60}}},
    };
    ASSERT_TRUE(core::apply_config(document, config, error)) << error;
    EXPECT_DOUBLE_EQ(config.match.search_radius_m, 25.0);
}

TEST(ConfigTest, BadValuesLeaveTheConfigUntouched) {
    PipelineConfig config;
    std::string error;

    json wrong_type = {
        {"match", {{"search_radius_m", 10.0}}},
        {"reader", {{"fold_building_parts", "yes"}}},
    };
    EXPECT_FALSE(core::apply_config(wrong_type, config, error));
    EXPECT_NE(error.find("reader.fold_building_parts"), std::string::npos);
    EXPECT_DOUBLE_EQ(config.match.search_radius_m, 25.0);

    EXPECT_FALSE(core::apply_config({{"match", {{"search_radius_m", 0.0}}}}, config, error));
    EXPECT_FALSE(core::apply_config({{"mesh", {{"weld_tolerance_m", -1.0}}}}, config, error));
    EXPECT_FALSE(core::apply_config({{"mesh", {{"wall_color", {1.0, 0.0}}}}}, config, error));
    EXPECT_FALSE(core::apply_config({{"output", 3}}, config, error));
    EXPECT_FALSE(core::apply_config(json::array(), config, error));
}

TEST(ConfigTest, LoadsFiles) {
    test::TempDir dir;
    PipelineConfig config;
    std::string error;

    const auto good = dir.write("cityfuse.json", R"({"merge": {"cityjson_key_prefix": "lod2:"}})");
    ASSERT_TRUE(core::load_config_file(good, config, error)) << error;
    EXPECT_EQ(config.merge.cityjson_key_prefix, "lod2:");

    EXPECT_FALSE(core::load_config_file(dir.write("bad.json", "{"), config, error));
    EXPECT_FALSE(core::load_config_file(dir.path() / "missing.json", config, error));
    EXPECT_EQ(config.merge.cityjson_key_prefix, "lod2:");
}
