#include "cityjson/tile_catalog.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>

using namespace cityfuse;
using nlohmann::json;

namespace {

// One flat square building per tile, spanning [x0, x0 + 10] x [y0, y0 + 10]
std::string tile_document(const std::string& building_id, double x0, double y0,
                          const std::string& reference_system, bool with_extent) {
    json document = {
        {"type", "CityJSON"},
        {"version", "2.0"},
        {"metadata", {{"referenceSystem", reference_system}}},
        {"vertices", {{x0, y0, 0.0}, {x0 + 10, y0, 0.0}, {x0 + 10, y0 + 10, 0.0}, {x0, y0 + 10, 0.0},
                      {x0, y0, 5.0}, {x0 + 10, y0, 5.0}, {x0 + 10, y0 + 10, 5.0}, {x0, y0 + 10, 5.0}}},
    };
    if (with_extent) {
        document["metadata"]["geographicalExtent"] = {x0, y0, 0.0, x0 + 10, y0 + 10, 5.0};
    }
    document["CityObjects"][building_id] = {
        {"type", "Building"},
        {"geometry", {{
            {"type", "MultiSurface"},
            {"lod", "2"},
            {"boundaries", {{{0, 3, 2, 1}}, {{4, 5, 6, 7}}}},
            {"semantics", {
                {"surfaces", {{{"type", "GroundSurface"}}, {{"type", "RoofSurface"}}}},
                {"values", {0, 1}},
            }},
        }}},
    };
    return document.dump();
}

const char* kEpsg25832 = "https://www.opengis.net/def/crs/EPSG/0/25832";

} // namespace

TEST(TileCatalogTest, ScansTilesAndSkipsOutputs) {
    test::TempDir dir;
    dir.write("a.city.json", tile_document("A", 0.0, 0.0, kEpsg25832, true));
    dir.write("b.city.json", tile_document("B", 1000.0, 0.0, kEpsg25832, false));
    dir.write("node_1_bld.json", tile_document("X", 0.0, 0.0, kEpsg25832, true));
    dir.write("run_summary.json", R"({"total": 0})");
    dir.write("notes.txt", "not a tile");
    dir.write("other.json", R"({"type": "FeatureCollection", "features": []})");

    cityjson::TileCatalog catalog;
    ASSERT_EQ(catalog.scan(dir.path()), 2u);

    const auto& tiles = catalog.tiles();
    EXPECT_EQ(tiles[0].name, "a.city.json");
    EXPECT_EQ(tiles[1].name, "b.city.json");
    EXPECT_EQ(tiles[0].epsg, 25832);

    // b declares no extent, so it is computed from its vertices
    EXPECT_DOUBLE_EQ(tiles[1].extent[0], 1000.0);
    EXPECT_DOUBLE_EQ(tiles[1].extent[3], 1010.0);
    EXPECT_DOUBLE_EQ(tiles[1].extent[5], 5.0);

    EXPECT_EQ(catalog.common_epsg(), 25832);
}

TEST(TileCatalogTest, SelectsTilesCoveringAPoint) {
    test::TempDir dir;
    dir.write("a.city.json", tile_document("A", 0.0, 0.0, kEpsg25832, true));
    dir.write("b.city.json", tile_document("B", 1000.0, 0.0, kEpsg25832, true));

    cityjson::TileCatalog catalog;
    ASSERT_EQ(catalog.scan(dir.path()), 2u);

    auto inside = catalog.tiles_covering({5.0, 5.0}, 0.0);
    ASSERT_EQ(inside.size(), 1u);
    EXPECT_EQ(inside[0]->name, "a.city.json");

    EXPECT_TRUE(catalog.tiles_covering({30.0, 5.0}, 10.0).empty());
    EXPECT_EQ(catalog.tiles_covering({30.0, 5.0}, 25.0).size(), 1u);
    EXPECT_EQ(catalog.tiles_covering({500.0, 5.0}, 500.0).size(), 2u);
}

TEST(TileCatalogTest, LoadsSelectedTilesOnce) {
    test::TempDir dir;
    dir.write("a.city.json", tile_document("A", 0.0, 0.0, kEpsg25832, true));
    dir.write("b.city.json", tile_document("B", 1000.0, 0.0, kEpsg25832, true));

    cityjson::TileCatalog catalog;
    ASSERT_EQ(catalog.scan(dir.path()), 2u);

    auto first = catalog.load(catalog.tiles_covering({1005.0, 5.0}, 0.0));
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].id, "B");
    EXPECT_EQ(first[0].tile, "b.city.json");
    EXPECT_EQ(first[0].surface_count(), 2u);

    auto all = catalog.load_all();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id, "A");
    EXPECT_EQ(all[1].id, "B");
    EXPECT_EQ(catalog.failed_tiles(), 0u);
}

TEST(TileCatalogTest, BoundedReadersKeepTileOrder) {
    test::TempDir dir;
    for (int i = 0; i < 5; ++i) {
        dir.write("t" + std::to_string(i) + ".city.json",
                  tile_document("B" + std::to_string(i), i * 100.0, 0.0, kEpsg25832, true));
    }

    cityjson::TileCatalog catalog;
    catalog.set_max_parallel_loads(2);
    ASSERT_EQ(catalog.scan(dir.path()), 5u);

    std::vector<const cityjson::TileInfo*> reversed;
    for (auto it = catalog.tiles().rbegin(); it != catalog.tiles().rend(); ++it) {
        reversed.push_back(&*it);
    }
    auto buildings = catalog.load(reversed);
    ASSERT_EQ(buildings.size(), 5u);
    for (size_t i = 0; i < buildings.size(); ++i) {
        EXPECT_EQ(buildings[i].tile, reversed[i]->name);
    }
    EXPECT_EQ(catalog.cached_tiles(), 5u);

    catalog.release_cache();
    EXPECT_EQ(catalog.cached_tiles(), 0u);
    EXPECT_EQ(catalog.tile_count(), 5u);

    // Released tiles are read again on demand
    EXPECT_EQ(catalog.load_all().size(), 5u);
}

TEST(TileCatalogTest, DisagreeingReferenceSystemsHaveNoCommonEpsg) {
    test::TempDir dir;
    dir.write("a.city.json", tile_document("A", 0.0, 0.0, kEpsg25832, true));
    dir.write("b.city.json", tile_document("B", 0.0, 0.0, "urn:ogc:def:crs:EPSG::25833", true));

    cityjson::TileCatalog catalog;
    ASSERT_EQ(catalog.scan(dir.path()), 2u);
    EXPECT_FALSE(catalog.common_epsg().has_value());
}

TEST(TileCatalogTest, MissingDirectoryYieldsNoTiles) {
    test::TempDir dir;
    cityjson::TileCatalog catalog;
    EXPECT_EQ(catalog.scan(dir.path() / "does_not_exist"), 0u);
    EXPECT_EQ(catalog.scan(dir.path()), 0u);
}
