#pragma once

#include "index/geometry_index.hpp"
#include "match/matcher.hpp"
#include "merge/merged_record.hpp"
#include "osm/types.hpp"
#include <optional>
#include <string>

namespace cityfuse::merge {

/**
 * @brief Merge options
 */
struct MergeConfig {
    std::string cityjson_key_prefix = "cityjson:";  ///< Prefix of CityJSON values kept beside OSM ones
    double planarity_tolerance_m = 0.05;
    double closure_tolerance_m = 1e-6;
    bool verbatim_building_attributes = true;       ///< Copy unmapped building attributes (prefixed)
};

/**
 * @brief Fuses an OSM object with its matched buildings
 *
 * Attribute rules:
 * - OSM tags are copied as they are.
 * - measuredHeight, roofType, yearOfConstruction and storeysAboveGround
 *   map to height, roof:shape, start_date and building:levels. When the
 *   OSM object already has the key, its value wins and the CityJSON
 *   value goes under the prefixed key.
 * - Other building attributes are copied under the prefixed key.
 * - height is derived from the solids when neither source has one.
 *
 * The result is a pure function of its inputs.
 */
class Merger {
public:
    Merger() = default;

    /**
     * @brief Merge one object
     * @return The merged record, or nullopt (NoMatch) when the match has
     *         no candidates
     * @throws PipelineError (GeometryMismatch) when a selected building
     *         is not in the match's reference system
     */
    static std::optional<MergedRecord> merge(const osm::OsmObject& object,
                                             const match::MatchResult& result,
                                             const index::GeometryIndex& index,
                                             const MergeConfig& config);
};

} // namespace cityfuse::merge
