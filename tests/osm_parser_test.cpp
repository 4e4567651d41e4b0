#include "osm/parser.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>

using namespace cityfuse;
using osm::OSMParser;
using nlohmann::json;

TEST(OsmParserTest, ReadsFetchOutput) {
    json document = json::parse(R"([
        {"osm_id": 101, "osm_type": "node", "lat": 49.014, "lon": 8.404,
         "tags": {"amenity": "pharmacy", "wheelchair": "yes", "level": 0},
         "accessibility": {"wheelchair": "yes"}},
        {"osm_id": 202, "osm_type": "way", "lat": 49.01, "lon": 8.41,
         "tags": {"amenity": "school", "toilets:wheelchair": "no"}},
        {"osm_id": 303, "osm_type": "node", "tags": {"amenity": "cafe"}}
    ])");

    OSMParser parser;
    ASSERT_TRUE(parser.parse_json(document)) << parser.get_error();

    const auto& objects = parser.get_objects();
    ASSERT_EQ(objects.size(), 2u);

    EXPECT_EQ(objects[0].identifier(), "node/101");
    EXPECT_DOUBLE_EQ(objects[0].lat, 49.014);
    EXPECT_DOUBLE_EQ(objects[0].lon, 8.404);
    EXPECT_EQ(objects[0].tags.at("amenity"), "pharmacy");
    EXPECT_EQ(objects[0].tags.at("level"), "0");
    EXPECT_EQ(objects[0].accessibility.at("wheelchair"), "yes");

    EXPECT_EQ(objects[1].type, osm::ElementType::Way);
    EXPECT_EQ(objects[1].file_stem(), "way_202");
    // No accessibility member: taken from the tags
    EXPECT_EQ(objects[1].accessibility.at("toilets:wheelchair"), "no");

    EXPECT_EQ(parser.get_stats().total_elements, 3u);
    EXPECT_EQ(parser.get_stats().without_coordinates, 1u);
    EXPECT_EQ(parser.get_stats().objects, 2u);
}

TEST(OsmParserTest, ReadsOverpassOutputWithCenters) {
    json document = json::parse(R"({
        "version": 0.6,
        "elements": [
            {"type": "node", "id": 1, "lat": 49.0, "lon": 8.4, "tags": {"highway": "bus_stop"}},
            {"type": "way", "id": 2, "center": {"lat": 49.02, "lon": 8.42},
             "tags": {"amenity": "hospital"}},
            {"type": "relation", "id": 3, "tags": {"amenity": "university"}}
        ]
    })");

    OSMParser parser;
    ASSERT_TRUE(parser.parse_json(document));

    auto objects = parser.take_objects();
    ASSERT_EQ(objects.size(), 2u);
    EXPECT_TRUE(parser.get_objects().empty());

    EXPECT_EQ(objects[1].identifier(), "way/2");
    EXPECT_DOUBLE_EQ(objects[1].lat, 49.02);
    EXPECT_DOUBLE_EQ(objects[1].lon, 8.42);
    EXPECT_FALSE(objects[1].footprint.has_value());
    EXPECT_EQ(parser.get_stats().without_coordinates, 1u);
}

TEST(OsmParserTest, ClosedGeometryBecomesTheFootprint) {
    json document = json::parse(R"({"elements": [
        {"type": "way", "id": 9, "tags": {"amenity": "library"},
         "geometry": [
            {"lat": 49.0, "lon": 8.0}, {"lat": 49.0, "lon": 8.002},
            {"lat": 49.002, "lon": 8.002}, {"lat": 49.002, "lon": 8.0},
            {"lat": 49.0, "lon": 8.0}
         ]}
    ]})");

    OSMParser parser;
    ASSERT_TRUE(parser.parse_json(document));
    ASSERT_EQ(parser.get_objects().size(), 1u);

    const auto& library = parser.get_objects()[0];
    ASSERT_TRUE(library.footprint.has_value());
    EXPECT_EQ(library.footprint->size(), 5u);
    EXPECT_NEAR(library.lat, 49.001, 1e-12);
    EXPECT_NEAR(library.lon, 8.001, 1e-12);
}

TEST(OsmParserTest, BoundingBoxFilterDropsOutsiders) {
    json document = json::parse(R"([
        {"osm_id": 1, "osm_type": "node", "lat": 49.0, "lon": 8.4, "tags": {}},
        {"osm_id": 2, "osm_type": "node", "lat": 52.5, "lon": 13.4, "tags": {}}
    ])");

    osm::ParserConfig config;
    config.filter_bounds = osm::BoundingBox{48.9, 49.1, 8.3, 8.5};

    OSMParser parser;
    parser.set_config(config);
    ASSERT_TRUE(parser.parse_json(document));
    ASSERT_EQ(parser.get_objects().size(), 1u);
    EXPECT_EQ(parser.get_objects()[0].osm_id, 1);
    EXPECT_EQ(parser.get_stats().outside_bounds, 1u);
}

TEST(OsmParserTest, RejectsUnusableInput) {
    test::TempDir dir;
    OSMParser parser;

    EXPECT_FALSE(parser.parse(dir.path() / "missing.json"));
    EXPECT_FALSE(parser.get_error().empty());

    EXPECT_FALSE(parser.parse(dir.write("broken.json", "[{\"osm_id\": ")));
    EXPECT_FALSE(parser.parse(dir.write("scalar.json", "42")));
    EXPECT_TRUE(parser.get_objects().empty());
}

TEST(OsmParserTest, ElementsWithoutIdentifierAreSkipped) {
    json fetched = json::parse(R"([
        {"lat": 1.0, "lon": 2.0, "tags": {"amenity": "cafe"}},
        {"osm_id": "abc", "osm_type": "node", "lat": 1.0, "lon": 2.0},
        {"osm_id": 7, "osm_type": "node", "lat": 49.0, "lon": 8.4, "tags": {"amenity": "bank"}}
    ])");

    OSMParser parser;
    ASSERT_TRUE(parser.parse_json(fetched)) << parser.get_error();
    ASSERT_EQ(parser.get_objects().size(), 1u);
    EXPECT_EQ(parser.get_objects()[0].identifier(), "node/7");
    EXPECT_EQ(parser.get_stats().total_elements, 3u);
    EXPECT_EQ(parser.get_stats().without_identifier, 2u);

    json overpass = json::parse(R"({"elements": [
        {"type": "node", "lat": 49.0, "lon": 8.4},
        {"type": "node", "id": 8, "lat": 49.0, "lon": 8.4, "tags": {"amenity": "bank"}}
    ]})");
    ASSERT_TRUE(parser.parse_json(overpass));
    ASSERT_EQ(parser.get_objects().size(), 1u);
    EXPECT_EQ(parser.get_objects()[0].osm_id, 8);
    EXPECT_EQ(parser.get_stats().without_identifier, 1u);
}

TEST(OsmParserTest, ReadsJsonFromDisk) {
    test::TempDir dir;
    const auto path = dir.write("pois.json",
        R"([{"osm_id": 5, "osm_type": "node", "lat": 49.0, "lon": 8.4, "tags": {"amenity": "bank"}}])");

    OSMParser parser;
    ASSERT_TRUE(parser.parse(path));
    ASSERT_EQ(parser.get_objects().size(), 1u);
    EXPECT_GE(parser.get_stats().parse_time_ms, 0.0);
}

TEST(OsmParserTest, ReadsOsmXmlThroughLibosmium) {
    test::TempDir dir;
    const auto path = dir.write("extract.osm", R"(<?xml version="1.0" encoding="UTF-8"?>
<osm version="0.6" generator="test">
  <node id="1" lat="49.0" lon="8.0" version="1"/>
  <node id="2" lat="49.0" lon="8.002" version="1"/>
  <node id="3" lat="49.002" lon="8.002" version="1"/>
  <node id="4" lat="49.002" lon="8.0" version="1"/>
  <node id="10" lat="49.01" lon="8.01" version="1">
    <tag k="amenity" v="pharmacy"/>
    <tag k="wheelchair" v="limited"/>
  </node>
  <node id="11" lat="49.02" lon="8.02" version="1">
    <tag k="natural" v="tree"/>
  </node>
  <way id="20" version="1">
    <nd ref="1"/><nd ref="2"/><nd ref="3"/><nd ref="4"/><nd ref="1"/>
    <tag k="amenity" v="school"/>
    <tag k="building" v="yes"/>
  </way>
</osm>
)");

    OSMParser parser;
    ASSERT_TRUE(parser.parse(path)) << parser.get_error();

    const auto& objects = parser.get_objects();
    ASSERT_EQ(objects.size(), 2u);
    EXPECT_EQ(objects[0].identifier(), "node/10");
    EXPECT_EQ(objects[0].accessibility.at("wheelchair"), "limited");

    EXPECT_EQ(objects[1].identifier(), "way/20");
    ASSERT_TRUE(objects[1].footprint.has_value());
    EXPECT_EQ(objects[1].footprint->size(), 5u);
    EXPECT_NEAR(objects[1].lat, 49.001, 1e-7);
    EXPECT_NEAR(objects[1].lon, 8.001, 1e-7);

    EXPECT_EQ(parser.get_stats().not_of_interest, 1u);
}
