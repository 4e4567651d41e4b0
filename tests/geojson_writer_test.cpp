#include "osm/geojson_writer.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <fstream>

using namespace cityfuse;
using osm::GeoJsonWriter;
using osm::WheelchairClass;
using nlohmann::json;

namespace {

json read_json(const std::filesystem::path& path) {
    std::ifstream in(path);
    return json::parse(in);
}

osm::OsmObject poi(osm::ElementId id, const std::string& wheelchair) {
    osm::TagMap tags = {{"amenity", "pharmacy"}, {"opening_hours", "Mo-Fr 08:00-18:00"}};
    if (!wheelchair.empty()) tags["wheelchair"] = wheelchair;
    return test::osm_node(id, 8.4 + id * 0.001, 49.0, tags);
}

} // namespace

TEST(GeoJsonWriterTest, FeatureCarriesIdentityTypeAndAccessibility) {
    osm::OsmObject object = poi(7, "limited");
    object.tags["name"] = "Stadt-Apotheke";
    object.tags["ramp"] = "yes";
    object.accessibility = {{"wheelchair", "yes"}};

    json f = GeoJsonWriter::feature(object);
    EXPECT_EQ(f["type"], "Feature");
    EXPECT_EQ(f["geometry"]["type"], "Point");
    EXPECT_DOUBLE_EQ(f["geometry"]["coordinates"][0].get<double>(), object.lon);
    EXPECT_DOUBLE_EQ(f["geometry"]["coordinates"][1].get<double>(), 49.0);

    const auto& properties = f["properties"];
    EXPECT_EQ(properties["osm_id"], 7);
    EXPECT_EQ(properties["osm_type"], "node");
    EXPECT_EQ(properties["amenity"], "pharmacy");
    EXPECT_EQ(properties["name"], "Stadt-Apotheke");
    EXPECT_FALSE(properties.contains("opening_hours"));

    // The accessibility map wins over the raw tag
    EXPECT_EQ(properties["acc_wheelchair"], "yes");
    EXPECT_EQ(properties["acc_ramp"], "yes");
    EXPECT_FALSE(properties.contains("acc_step_free"));
}

TEST(GeoJsonWriterTest, ClassifiesWheelchairValues) {
    auto classify = [](const std::string& value) {
        return GeoJsonWriter::classify(GeoJsonWriter::feature(poi(1, value)));
    };
    EXPECT_EQ(classify("yes"), WheelchairClass::Yes);
    EXPECT_EQ(classify("Designated"), WheelchairClass::Yes);
    EXPECT_EQ(classify("limited"), WheelchairClass::Yes);
    EXPECT_EQ(classify("no"), WheelchairClass::No);
    EXPECT_EQ(classify("unknown"), WheelchairClass::No);
    EXPECT_EQ(classify(""), WheelchairClass::No);
    EXPECT_EQ(classify("only ground floor"), WheelchairClass::Other);

    json numeric = {{"properties", {{"acc_wheelchair", 1}}}};
    EXPECT_EQ(GeoJsonWriter::classify(numeric), WheelchairClass::Yes);
}

TEST(GeoJsonWriterTest, SubsetPathKeepsTheExtension) {
    EXPECT_EQ(GeoJsonWriter::subset_path("out/pois.geojson", "_acc_yes"),
              std::filesystem::path("out/pois_acc_yes.geojson"));
}

TEST(GeoJsonWriterTest, WritesCollectionAndNonEmptySubsets) {
    test::TempDir dir;
    const auto path = dir.path() / "pois.geojson";

    GeoJsonWriter writer;
    ASSERT_TRUE(writer.write({poi(1, "yes"), poi(2, "limited"), poi(3, "free text"), poi(4, "")}, path, true))
        << writer.get_error();

    json all = read_json(path);
    EXPECT_EQ(all["type"], "FeatureCollection");
    EXPECT_EQ(all["crs"]["properties"]["name"], "urn:ogc:def:crs:OGC:1.3:CRS84");
    EXPECT_EQ(all["features"].size(), 4u);

    json yes = read_json(dir.path() / "pois_acc_yes.geojson");
    EXPECT_EQ(yes["features"].size(), 2u);
    json no = read_json(dir.path() / "pois_acc_no.geojson");
    ASSERT_EQ(no["features"].size(), 1u);
    EXPECT_EQ(no["features"][0]["properties"]["osm_id"], 4);

    EXPECT_EQ(writer.get_stats().features, 4u);
    EXPECT_EQ(writer.get_stats().accessible, 2u);
    EXPECT_EQ(writer.get_stats().inaccessible, 1u);
}

TEST(GeoJsonWriterTest, SkipsSubsetsThatWouldBeEmpty) {
    test::TempDir dir;
    const auto path = dir.path() / "pois.geojson";

    GeoJsonWriter writer;
    ASSERT_TRUE(writer.write({poi(1, "yes"), poi(2, "designated")}, path, true));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "pois_acc_yes.geojson"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "pois_acc_no.geojson"));

    // Without any wheelchair value there is nothing to split on
    const auto untagged = dir.path() / "untagged.geojson";
    ASSERT_TRUE(writer.write({poi(3, ""), poi(4, "")}, untagged, true));
    EXPECT_TRUE(std::filesystem::exists(untagged));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "untagged_acc_no.geojson"));
}

TEST(GeoJsonWriterTest, ReplacesInvalidUtf8) {
    test::TempDir dir;
    const auto path = dir.path() / "pois.geojson";

    osm::OsmObject object = poi(1, "yes");
    object.tags["name"] = "Caf\xe9";

    GeoJsonWriter writer;
    ASSERT_TRUE(writer.write({object}, path, false)) << writer.get_error();
    json all = read_json(path);
    EXPECT_EQ(all["features"][0]["properties"]["name"], "Caf\xef\xbf\xbd");
}

TEST(GeoJsonWriterTest, FailsWithoutObjectsOrTarget) {
    test::TempDir dir;
    GeoJsonWriter writer;
    EXPECT_FALSE(writer.write({}, dir.path() / "empty.geojson", false));
    EXPECT_FALSE(writer.get_error().empty());

    EXPECT_FALSE(writer.write({poi(1, "yes")}, dir.path() / "missing" / "pois.geojson", false));
}
