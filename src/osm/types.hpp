/**
 * @file types.hpp
 * @brief OSM data types used by cityfuse
 * @author cityfuse Team
 * @version 0.1.0
 * @date 2026
 *
 * This file contains the data structures describing OpenStreetMap objects
 * as they enter the merge pipeline: point-of-interest nodes and tagged
 * closed ways, already reduced to an identifier, a WGS84 position, a tag
 * set and an optional footprint polygon.
 */

#pragma once

#include <glm/glm.hpp>
#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cityfuse::osm {

// ============================================================================
// Type Aliases
// ============================================================================

/// Map of string key-value pairs for OSM tags (ordered for deterministic output)
using TagMap = std::map<std::string, std::string>;

/// OSM element ID type (signed 64-bit, can be negative for new elements)
using ElementId = int64_t;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief OSM element kind an object was extracted from
 */
enum class ElementType {
    Node,           ///< Tagged node (point)
    Way,            ///< Tagged way (closed ring -> footprint)
    Relation,       ///< Tagged relation (center point only)
    Unknown         ///< Unrecognized element type
};

// ============================================================================
// Geographic Bounds
// ============================================================================

/**
 * @brief Geographic bounding box in WGS84 coordinates
 */
struct BoundingBox {
    double min_lat = 90.0;      ///< Southern boundary
    double max_lat = -90.0;     ///< Northern boundary
    double min_lon = 180.0;     ///< Western boundary
    double max_lon = -180.0;    ///< Eastern boundary

    /**
     * @brief Expand bounds to include a point
     * @param lat Latitude in degrees
     * @param lon Longitude in degrees
     */
    void expand(double lat, double lon) {
        min_lat = std::min(min_lat, lat);
        max_lat = std::max(max_lat, lat);
        min_lon = std::min(min_lon, lon);
        max_lon = std::max(max_lon, lon);
    }

    /**
     * @brief Check whether a point lies inside the box (inclusive)
     */
    [[nodiscard]] bool contains(double lat, double lon) const {
        return lat >= min_lat && lat <= max_lat && lon >= min_lon && lon <= max_lon;
    }

    /**
     * @brief Check if bounds have been initialized with valid data
     * @return true if bounds contain at least one point
     */
    [[nodiscard]] bool is_valid() const {
        return min_lat <= max_lat && min_lon <= max_lon;
    }
};

// ============================================================================
// OSM Object
// ============================================================================

/**
 * @brief A point-of-interest object ready for matching
 *
 * Immutable once loaded. Positions are WGS84 degrees; the footprint,
 * when present, is an outer ring of (lon, lat) pairs.
 */
struct OsmObject {
    ElementType type = ElementType::Node;   ///< Source element kind
    ElementId osm_id = 0;                   ///< OSM element ID
    double lon = 0.0;                       ///< Longitude in WGS84 (degrees)
    double lat = 0.0;                       ///< Latitude in WGS84 (degrees)
    TagMap tags;                            ///< Key-value tags
    TagMap accessibility;                   ///< Accessibility tags surfaced from tags
    std::optional<std::vector<glm::dvec2>> footprint; ///< Outer ring as (lon, lat)

    /**
     * @brief Canonical identifier, e.g. "node/123"
     */
    [[nodiscard]] std::string identifier() const;

    /**
     * @brief Identifier usable as a file stem, e.g. "node_123"
     */
    [[nodiscard]] std::string file_stem() const;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Convert ElementType to the OSM API spelling ("node", "way", ...)
 */
[[nodiscard]] inline const char* element_type_name(ElementType type) {
    switch (type) {
        case ElementType::Node:     return "node";
        case ElementType::Way:      return "way";
        case ElementType::Relation: return "relation";
        case ElementType::Unknown:  return "unknown";
    }
    return "unknown";
}

/**
 * @brief Parse the OSM API spelling of an element type
 */
[[nodiscard]] inline ElementType parse_element_type(const std::string& name) {
    if (name == "node") return ElementType::Node;
    if (name == "way") return ElementType::Way;
    if (name == "relation") return ElementType::Relation;
    return ElementType::Unknown;
}

inline std::string OsmObject::identifier() const {
    return std::string(element_type_name(type)) + "/" + std::to_string(osm_id);
}

inline std::string OsmObject::file_stem() const {
    return std::string(element_type_name(type)) + "_" + std::to_string(osm_id);
}

} // namespace cityfuse::osm
