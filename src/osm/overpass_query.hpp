#pragma once

#include "osm/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cityfuse::osm {

/**
 * @brief Where an Overpass query searches
 *
 * Exactly one of area_id and bbox is used; area_id wins when both are set.
 */
struct SearchArea {
    std::optional<int64_t> area_id;     ///< Overpass area id (see area_id_for())
    std::optional<BoundingBox> bbox;    ///< WGS84 box
};

/**
 * @brief Overpass area id of an OSM way or relation
 * @return nullopt for nodes and unknown types (they do not form areas)
 */
[[nodiscard]] std::optional<int64_t> area_id_for(ElementType type, ElementId id);

/**
 * @brief Anchored regular expression matching any of the values
 *
 * {"a"} -> "^a$", {"a", "b"} -> "^(a|b)$"; quotes and backslashes are escaped.
 */
[[nodiscard]] std::string build_value_regex(const std::vector<std::string>& values);

/**
 * @brief Overpass QL text fetching every point-of-interest category
 *
 * Ways and relations are returned with their center ("out center meta").
 *
 * @throws std::invalid_argument when the search area is empty
 */
[[nodiscard]] std::string build_overpass_query(const SearchArea& area, int timeout_seconds = 180);

} // namespace cityfuse::osm
