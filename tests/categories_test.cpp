#include "osm/categories.hpp"
#include "osm/overpass_query.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace cityfuse::osm;

TEST(CategoriesTest, RecognisesPointsOfInterest) {
    EXPECT_TRUE(is_point_of_interest({{"amenity", "pharmacy"}}));
    EXPECT_TRUE(is_point_of_interest({{"healthcare", "physiotherapist"}, {"name", "Physio"}}));
    EXPECT_TRUE(is_point_of_interest({{"shop", "orthopaedics"}}));
    EXPECT_TRUE(is_point_of_interest({{"highway", "bus_stop"}}));
    EXPECT_TRUE(is_point_of_interest({{"railway", "tram_stop"}}));

    EXPECT_FALSE(is_point_of_interest({}));
    EXPECT_FALSE(is_point_of_interest({{"shop", "bakery"}}));
    EXPECT_FALSE(is_point_of_interest({{"building", "yes"}}));
}

TEST(CategoriesTest, CareFacilitiesNeedTheSocialFacilityAmenity) {
    EXPECT_FALSE(is_point_of_interest({{"social_facility:for", "senior"}}));
    EXPECT_TRUE(is_point_of_interest({{"social_facility:for", "senior"}, {"amenity", "social_facility"}}));
    EXPECT_FALSE(is_point_of_interest({{"social_facility:for", "senior"}, {"amenity", "bench"}}));
}

TEST(CategoriesTest, ExtractsAccessibilityTags) {
    TagMap tags = {
        {"amenity", "cafe"},
        {"wheelchair", "limited"},
        {"toilets:wheelchair", "yes"},
        {"ramp", "no"},
        {"name", "Eck"},
    };
    TagMap accessibility = extract_accessibility(tags);
    ASSERT_EQ(accessibility.size(), 3u);
    EXPECT_EQ(accessibility.at("wheelchair"), "limited");
    EXPECT_EQ(accessibility.at("toilets:wheelchair"), "yes");
    EXPECT_EQ(accessibility.at("ramp"), "no");
    EXPECT_EQ(accessibility_keys().size(), 9u);
}

TEST(OverpassQueryTest, AreaIdsForWaysAndRelations) {
    EXPECT_EQ(area_id_for(ElementType::Relation, 62518), 3600062518);
    EXPECT_EQ(area_id_for(ElementType::Way, 12), 2400000012);
    EXPECT_FALSE(area_id_for(ElementType::Node, 12).has_value());
}

TEST(OverpassQueryTest, ValueRegexIsAnchoredAndEscaped) {
    EXPECT_EQ(build_value_regex({"cafe"}), "^cafe$");
    EXPECT_EQ(build_value_regex({"cafe", "bar"}), "^(cafe|bar)$");
    EXPECT_EQ(build_value_regex({"a\"b", "c\\d"}), "^(a\\\"b|c\\\\d)$");
}

TEST(OverpassQueryTest, AreaQueryCoversEveryCategory) {
    SearchArea area;
    area.area_id = 3600062518;
    const std::string query = build_overpass_query(area, 90);

    EXPECT_EQ(query.rfind("[out:json][timeout:90];", 0), 0u);
    EXPECT_NE(query.find("area(3600062518)->.searchArea;"), std::string::npos);
    EXPECT_NE(query.find("node[\"amenity\"~\"^(restaurant|cafe|"), std::string::npos);
    EXPECT_NE(query.find("way[\"amenity\"=\"social_facility\"][\"social_facility:for\"~"), std::string::npos);
    EXPECT_NE(query.find("relation[\"railway\"~\"^(station|halt|stop|tram_stop|subway_entrance|platform)$\"]"
                         "(area.searchArea);"),
              std::string::npos);
    EXPECT_NE(query.find("out center meta;"), std::string::npos);

    // Three element types per category
    size_t statements = 0;
    for (size_t pos = query.find("(area.searchArea);"); pos != std::string::npos;
         pos = query.find("(area.searchArea);", pos + 1)) {
        statements++;
    }
    EXPECT_EQ(statements, poi_categories().size() * 3);
}

TEST(OverpassQueryTest, BoundingBoxQueryAndMissingArea) {
    SearchArea area;
    area.bbox = BoundingBox{48.9, 49.1, 8.3, 8.5};
    const std::string query = build_overpass_query(area);

    EXPECT_NE(query.find("[timeout:180]"), std::string::npos);
    EXPECT_NE(query.find("(48.9,8.3,49.1,8.5);"), std::string::npos);
    EXPECT_EQ(query.find("searchArea"), std::string::npos);

    EXPECT_THROW((void)build_overpass_query(SearchArea{}), std::invalid_argument);
}
