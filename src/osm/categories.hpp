/**
 * @file categories.hpp
 * @brief Point-of-interest categories and accessibility tags
 *
 * The categories describe which OSM objects the pipeline cares about:
 * general amenities, healthcare, medical shops, care facilities for
 * seniors and disabled people, and public transport stops. They drive
 * both the Overpass query text and the filtering of OSM files.
 */

#pragma once

#include "osm/types.hpp"
#include <string>
#include <vector>

namespace cityfuse::osm {

/**
 * @brief One tag filter: key=value for any of the values
 *
 * When required_key is set, the object must also carry
 * required_key=required_value.
 */
struct TagCategory {
    std::string name;                   ///< Human-readable label
    std::string key;
    std::vector<std::string> values;
    std::string required_key;
    std::string required_value;

    [[nodiscard]] bool matches(const TagMap& tags) const;
};

/**
 * @brief All point-of-interest categories, in query order
 */
[[nodiscard]] const std::vector<TagCategory>& poi_categories();

/**
 * @brief Check whether an object's tags fall into any category
 */
[[nodiscard]] bool is_point_of_interest(const TagMap& tags);

/**
 * @brief Tag keys surfaced as accessibility information
 */
[[nodiscard]] const std::vector<std::string>& accessibility_keys();

/**
 * @brief Copy the accessibility tags of an object
 */
[[nodiscard]] TagMap extract_accessibility(const TagMap& tags);

} // namespace cityfuse::osm
