/**
 * @file matcher.hpp
 * @brief Selects the CityJSON building(s) an OSM object belongs to
 * @author cityfuse Team
 * @version 0.1.0
 * @date 2026
 */

#pragma once

#include "index/geometry_index.hpp"
#include "osm/types.hpp"
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace cityfuse::match {

/**
 * @brief Matching options
 */
struct MatchConfig {
    double search_radius_m = 25.0;          ///< Buildings farther than this never match
    size_t max_candidates = 0;              ///< Keep at most this many candidates (0 = all)
    bool select_all_containing = true;      ///< Select every containing building, not only the best
    double distance_tie_epsilon_m = 1e-6;   ///< Distances closer than this count as equal
};

/**
 * @brief One ranked candidate building
 */
struct Candidate {
    std::string building_id;
    std::string tile;                   ///< Source tile of the building
    double distance_m = 0.0;            ///< 0 when the point is inside the footprint
    bool contains = false;
    double footprint_area_m2 = 0.0;
    double confidence = 0.0;            ///< 1 for containment, else 1 - distance / radius
    bool selected = false;              ///< Geometry goes into the merged record
};

/**
 * @brief Candidates for one OSM object, best first
 *
 * An empty candidate list is a valid result (unmatched object).
 */
struct MatchResult {
    std::string osm_identifier;         ///< e.g. "node/123"
    int epsg = 0;                       ///< Reference system of point and candidates
    glm::dvec2 point{0.0};              ///< Representative point, projected
    std::vector<Candidate> candidates;

    [[nodiscard]] bool empty() const { return candidates.empty(); }

    /**
     * @brief Number of selected candidates
     */
    [[nodiscard]] size_t selected_count() const;
};

/**
 * @brief Matches OSM objects against the building index
 *
 * Ranking: buildings containing the point come first, then ascending
 * distance to the nearest footprint edge; equal distances go to the
 * smaller footprint, then the lower identifier. Containing buildings are
 * all selected (adjacent or split buildings); without containment the
 * nearest building is selected, together with any within the tie epsilon.
 */
class Matcher {
public:
    Matcher() = default;

    /**
     * @brief Match one object
     * @throws PipelineError (GeometryMismatch) when the index has no
     *         usable reference system
     * @throws IndexError (NotBuilt) when the index is not built
     */
    static MatchResult match(const osm::OsmObject& object,
                             const index::GeometryIndex& index,
                             const MatchConfig& config);

    /**
     * @brief Representative point of an object in a projected system
     *
     * The centroid of the projected footprint when there is one,
     * otherwise the object's own position.
     *
     * @throws PipelineError (GeometryMismatch) for unsupported EPSG codes
     */
    static glm::dvec2 representative_point(const osm::OsmObject& object, int epsg);

    /// Strict weak ordering used to rank candidates
    static bool ranks_before(const Candidate& a, const Candidate& b);
};

} // namespace cityfuse::match
