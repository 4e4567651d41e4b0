#include "cityjson/reader.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>

using namespace cityfuse;
using cityjson::CityJsonReader;
using nlohmann::json;

namespace {

// A unit cube at (1000, 2000) in millimetre integers, split into a
// building with one LOD2 solid and a part with its own solid.
json two_object_document() {
    return json::parse(R"({
        "type": "CityJSON",
        "version": "2.0",
        "transform": {"scale": [0.001, 0.001, 0.001], "translate": [1000.0, 2000.0, 100.0]},
        "metadata": {
            "referenceSystem": "https://www.opengis.net/def/crs/EPSG/0/25832",
            "geographicalExtent": [1000.0, 2000.0, 100.0, 1001.0, 2001.0, 101.0]
        },
        "vertices": [
            [0, 0, 0], [1000, 0, 0], [1000, 1000, 0], [0, 1000, 0],
            [0, 0, 1000], [1000, 0, 1000], [1000, 1000, 1000], [0, 1000, 1000]
        ],
        "CityObjects": {
            "DEBW_1": {
                "type": "Building",
                "attributes": {"measuredHeight": 1.0, "roofType": "1000"},
                "children": ["DEBW_1_part"],
                "geometry": [
                    {"type": "MultiSurface", "lod": "1", "boundaries": [[[0, 1, 2, 3]]]},
                    {
                        "type": "Solid",
                        "lod": "2",
                        "boundaries": [[
                            [[0, 3, 2, 1]], [[0, 1, 5, 4]], [[1, 2, 6, 5]],
                            [[2, 3, 7, 6]], [[3, 0, 4, 7]], [[4, 5, 6, 7]]
                        ]],
                        "semantics": {
                            "surfaces": [
                                {"type": "GroundSurface"},
                                {"type": "WallSurface"},
                                {"type": "RoofSurface"}
                            ],
                            "values": [[0, 1, 1, 1, 1, 2]]
                        }
                    }
                ]
            },
            "DEBW_1_part": {
                "type": "BuildingPart",
                "parents": ["DEBW_1"],
                "geometry": [
                    {"type": "MultiSurface", "lod": 2, "boundaries": [[[4, 5, 6, 7]]]}
                ]
            },
            "DEBW_2": {
                "type": "Building",
                "geometry": [
                    {"type": "MultiSurface", "lod": "1", "boundaries": [[[0, 1, 2, 3]]]}
                ]
            },
            "tree_1": {
                "type": "SolitaryVegetationObject",
                "geometry": []
            }
        }
    })");
}

} // namespace

TEST(CityJsonReaderTest, AppliesTransformAndReadsSemantics) {
    CityJsonReader reader;
    ASSERT_TRUE(reader.read_document(two_object_document(), "tile_a.city.json")) << reader.get_error();

    ASSERT_EQ(reader.epsg(), 25832);
    const auto& buildings = reader.get_buildings();
    ASSERT_EQ(buildings.size(), 2u);

    const auto& building = buildings[0];
    EXPECT_EQ(building.id, "DEBW_1");
    EXPECT_EQ(building.tile, "tile_a.city.json");
    EXPECT_EQ(building.epsg, 25832);
    EXPECT_EQ(building.attributes.value("roofType", ""), "1000");

    // LOD2 solid plus the folded part; the LOD1 surface is not selected
    ASSERT_EQ(building.solids.size(), 2u);
    const auto& solid = building.solids[0];
    EXPECT_EQ(solid.lod, "2");
    ASSERT_EQ(solid.surfaces.size(), 6u);
    EXPECT_EQ(solid.surfaces[0].role, cityjson::SurfaceRole::Ground);
    EXPECT_EQ(solid.surfaces[1].role, cityjson::SurfaceRole::Wall);
    EXPECT_EQ(solid.surfaces[5].role, cityjson::SurfaceRole::Roof);
    EXPECT_EQ(solid.surfaces[5].semantic_type, "RoofSurface");

    const auto& corner = solid.surfaces[5].outer[2];
    EXPECT_NEAR(corner.x, 1001.0, 1e-9);
    EXPECT_NEAR(corner.y, 2001.0, 1e-9);
    EXPECT_NEAR(corner.z, 101.0, 1e-9);

    EXPECT_EQ(building.surface_count(), 7u);
}

TEST(CityJsonReaderTest, CountsBuildingsWithoutSelectedLod) {
    CityJsonReader reader;
    ASSERT_TRUE(reader.read_document(two_object_document(), "tile_a.city.json"));

    EXPECT_EQ(reader.buildings_without_lod(), 1u);
    EXPECT_EQ(reader.get_buildings()[1].id, "DEBW_2");
    EXPECT_TRUE(reader.get_buildings()[1].solids.empty());
}

TEST(CityJsonReaderTest, KeepsPartsSeparateWhenFoldingIsOff) {
    CityJsonReader reader;
    cityjson::ReaderConfig config;
    config.fold_building_parts = false;
    reader.set_config(config);
    ASSERT_TRUE(reader.read_document(two_object_document(), "tile_a.city.json"));

    const auto& buildings = reader.get_buildings();
    ASSERT_EQ(buildings.size(), 3u);
    EXPECT_EQ(buildings[0].solids.size(), 1u);
    EXPECT_EQ(buildings[2].id, "DEBW_1_part");
    EXPECT_EQ(buildings[2].solids.size(), 1u);
}

TEST(CityJsonReaderTest, LodPrefixSelectsOtherLevels) {
    CityJsonReader reader;
    cityjson::ReaderConfig config;
    config.lod_prefix = "1";
    reader.set_config(config);
    ASSERT_TRUE(reader.read_document(two_object_document(), "tile_a.city.json"));

    // Both buildings have an LOD1 footprint; the part has none
    EXPECT_EQ(reader.buildings_without_lod(), 0u);
    EXPECT_EQ(reader.get_buildings()[0].solids.size(), 1u);
    EXPECT_EQ(reader.get_buildings()[0].solids[0].lod, "1");
}

TEST(CityJsonReaderTest, RejectsOtherDocuments) {
    CityJsonReader reader;
    EXPECT_FALSE(reader.read_document(json{{"type", "FeatureCollection"}}, "x.json"));
    EXPECT_FALSE(reader.get_error().empty());

    json broken = two_object_document();
    broken["vertices"] = json::array({json::array({0, 0, 0})});
    EXPECT_FALSE(reader.read_document(broken, "broken.json"));
    EXPECT_TRUE(reader.get_buildings().empty());
}

TEST(CityJsonReaderTest, ReadsFromDisk) {
    test::TempDir dir;
    auto path = dir.write("tile_b.city.json", two_object_document().dump());

    CityJsonReader reader;
    ASSERT_TRUE(reader.read(path));
    EXPECT_EQ(reader.get_buildings()[0].tile, "tile_b.city.json");

    EXPECT_FALSE(reader.read(dir.path() / "missing.json"));
    EXPECT_FALSE(reader.read(dir.write("garbage.json", "{ not json")));
}

TEST(CityJsonReaderTest, ExtentFromMetadataOrVertices) {
    json document = two_object_document();

    auto declared = CityJsonReader::read_extent(document);
    ASSERT_TRUE(declared.has_value());
    EXPECT_DOUBLE_EQ((*declared)[3], 1001.0);

    document["metadata"].erase("geographicalExtent");
    EXPECT_FALSE(CityJsonReader::read_extent(document).has_value());

    auto computed = CityJsonReader::compute_extent(document);
    ASSERT_TRUE(computed.has_value());
    EXPECT_NEAR((*computed)[0], 1000.0, 1e-9);
    EXPECT_NEAR((*computed)[4], 2001.0, 1e-9);
    EXPECT_NEAR((*computed)[5], 101.0, 1e-9);
}
