/**
 * @file merged_record.hpp
 * @brief Fused OSM + CityJSON record for one OSM object
 * @author cityfuse Team
 * @version 0.1.0
 * @date 2026
 *
 * A MergedRecord owns its geometry: the building solids are copied out of
 * the index, and every ring is stored closed (first point == last point).
 * Geometry problems are listed in issues, never silently repaired.
 */

#pragma once

#include "cityjson/types.hpp"
#include "match/matcher.hpp"
#include "osm/types.hpp"
#include <glm/glm.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace cityfuse::merge {

/**
 * @brief Source of a merged attribute
 */
enum class Provenance {
    Osm,        ///< OSM tag
    CityJson,   ///< CityJSON building attribute
    Derived     ///< Computed while merging
};

/**
 * @brief Attribute value with its origin
 */
struct Attribute {
    nlohmann::json value;
    Provenance origin = Provenance::Osm;

    bool operator==(const Attribute& other) const {
        return value == other.value && origin == other.origin;
    }
};

/// Ordered by key so serialization is deterministic
using AttributeMap = std::map<std::string, Attribute>;

/**
 * @brief A geometry defect found while merging
 */
struct GeometryIssue {
    enum class Kind {
        TooFewPoints,   ///< Ring with fewer than 3 distinct points
        NonPlanar,      ///< Ring deviates from its plane by more than the tolerance
        OpenShell       ///< Solid has boundary edges (does not enclose a volume)
    };

    Kind kind = Kind::NonPlanar;
    std::string building_id;
    size_t solid = 0;
    size_t surface = 0;                 ///< Unused for OpenShell
    double magnitude = 0.0;             ///< Deviation in m, or open edge count
};

struct MergedRecord {
    // Identity, threaded through to the record and mesh files
    std::string osm_identifier;         ///< "node/123"
    std::string stem;                   ///< "node_123"
    osm::ElementType osm_type = osm::ElementType::Node;
    osm::ElementId osm_id = 0;

    double lon = 0.0;
    double lat = 0.0;
    int epsg = 0;
    glm::dvec2 point{0.0};              ///< Representative point, projected

    std::vector<match::Candidate> candidates;
    AttributeMap attributes;
    std::vector<cityjson::CityBuilding> buildings;     ///< Selected buildings, closed rings
    std::vector<GeometryIssue> issues;

    [[nodiscard]] size_t surface_count() const {
        size_t count = 0;
        for (const auto& building : buildings) count += building.surface_count();
        return count;
    }
};

[[nodiscard]] inline const char* provenance_name(Provenance origin) {
    switch (origin) {
        case Provenance::Osm:      return "osm";
        case Provenance::CityJson: return "cityjson";
        case Provenance::Derived:  return "derived";
    }
    return "derived";
}

[[nodiscard]] inline Provenance parse_provenance(const std::string& name) {
    if (name == "osm") return Provenance::Osm;
    if (name == "cityjson") return Provenance::CityJson;
    return Provenance::Derived;
}

[[nodiscard]] inline const char* issue_kind_name(GeometryIssue::Kind kind) {
    switch (kind) {
        case GeometryIssue::Kind::TooFewPoints: return "too_few_points";
        case GeometryIssue::Kind::NonPlanar:    return "non_planar";
        case GeometryIssue::Kind::OpenShell:    return "open_shell";
    }
    return "non_planar";
}

[[nodiscard]] inline GeometryIssue::Kind parse_issue_kind(const std::string& name) {
    if (name == "too_few_points") return GeometryIssue::Kind::TooFewPoints;
    if (name == "open_shell") return GeometryIssue::Kind::OpenShell;
    return GeometryIssue::Kind::NonPlanar;
}

} // namespace cityfuse::merge
