#include "match/matcher.hpp"
#include "core/errors.hpp"
#include "osm/coordinates.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace cityfuse::match {

size_t MatchResult::selected_count() const {
    return static_cast<size_t>(std::count_if(candidates.begin(), candidates.end(),
                                             [](const Candidate& c) { return c.selected; }));
}

glm::dvec2 Matcher::representative_point(const osm::OsmObject& object, int epsg) {
    osm::CoordinateConverter converter;
    if (!converter.set_projection(epsg)) {
        throw PipelineError(FailureKind::GeometryMismatch,
                            "unsupported reference system EPSG:" + std::to_string(epsg));
    }

    if (object.footprint && object.footprint->size() >= 3) {
        std::vector<glm::dvec2> ring;
        ring.reserve(object.footprint->size());
        for (const auto& lon_lat : *object.footprint) {
            ring.push_back(converter.wgs84_to_projected(lon_lat.y, lon_lat.x));
        }
        // Drop the closing point, the centroid counts every vertex once
        if (ring.size() > 3 && ring.front() == ring.back()) {
            ring.pop_back();
        }
        if (std::abs(osm::geometry::polygon_area(ring)) > 0.0) {
            return osm::geometry::centroid(ring);
        }
    }

    return converter.wgs84_to_projected(object.lat, object.lon);
}

MatchResult Matcher::match(const osm::OsmObject& object,
                           const index::GeometryIndex& index,
                           const MatchConfig& config) {
    if (!index.is_built()) {
        throw IndexError(IndexErrorKind::NotBuilt, "match before the index is built");
    }

    MatchResult result;
    result.osm_identifier = object.identifier();

    if (!index.epsg()) {
        throw PipelineError(FailureKind::GeometryMismatch,
                            "building reference system is missing or inconsistent");
    }
    result.epsg = *index.epsg();
    result.point = representative_point(object, result.epsg);

    const double radius = config.search_radius_m;
    for (const auto& hit : index.query_hits(result.point, radius)) {
        Candidate candidate;
        candidate.building_id = hit.building_id;
        candidate.distance_m = hit.distance;
        candidate.contains = hit.contains;
        candidate.footprint_area_m2 = hit.area;
        if (hit.contains) {
            candidate.confidence = 1.0;
        } else {
            candidate.confidence = radius > 0.0 ? std::max(0.0, 1.0 - hit.distance / radius) : 0.0;
        }
        if (const auto* entry = index.find(hit.building_id)) {
            candidate.tile = entry->building.tile;
        }
        result.candidates.push_back(std::move(candidate));
    }

    std::sort(result.candidates.begin(), result.candidates.end(), &Matcher::ranks_before);

    if (config.max_candidates > 0 && result.candidates.size() > config.max_candidates) {
        result.candidates.resize(config.max_candidates);
    }

    // The tie epsilon only widens the selection; ranking stays exact
    const double eps = config.distance_tie_epsilon_m;
    if (!result.candidates.empty()) {
        const Candidate& best = result.candidates.front();
        for (auto& candidate : result.candidates) {
            if (best.contains) {
                candidate.selected = candidate.contains &&
                                     (config.select_all_containing || &candidate == &best);
            } else {
                candidate.selected = std::abs(candidate.distance_m - best.distance_m) <= eps;
            }
        }
    }

    if (result.empty()) {
        spdlog::debug("Matcher: {} has no building within {:.1f} m", result.osm_identifier, radius);
    } else {
        spdlog::debug("Matcher: {} -> {} ({} candidates, {} selected, {:.2f} m)",
                      result.osm_identifier, result.candidates.front().building_id,
                      result.candidates.size(), result.selected_count(),
                      result.candidates.front().distance_m);
    }
    return result;
}

bool Matcher::ranks_before(const Candidate& a, const Candidate& b) {
    if (a.contains != b.contains) return a.contains;
    if (a.distance_m != b.distance_m) return a.distance_m < b.distance_m;
    if (a.footprint_area_m2 != b.footprint_area_m2) return a.footprint_area_m2 < b.footprint_area_m2;
    return a.building_id < b.building_id;
}

} // namespace cityfuse::match
