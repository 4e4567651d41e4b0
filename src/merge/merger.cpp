#include "merge/merger.hpp"
#include "core/errors.hpp"
#include "merge/geometry_check.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace cityfuse::merge {

namespace {

// CityJSON attribute -> OSM key
const std::pair<const char*, const char*> ATTRIBUTE_MAPPING[] = {
    {"measuredHeight",     "height"},
    {"roofType",           "roof:shape"},
    {"yearOfConstruction", "start_date"},
    {"storeysAboveGround", "building:levels"},
};

const char* mapped_key(const std::string& attribute) {
    for (const auto& [from, to] : ATTRIBUTE_MAPPING) {
        if (attribute == from) return to;
    }
    return nullptr;
}

void set_if_absent(AttributeMap& attributes, const std::string& key, nlohmann::json value, Provenance origin) {
    attributes.emplace(key, Attribute{std::move(value), origin});
}

double round_cm(double value) {
    return std::round(value * 100.0) / 100.0;
}

// Vertical extent of every solid of the record, in meters
std::optional<double> height_from_solids(const std::vector<cityjson::CityBuilding>& buildings) {
    double lo = std::numeric_limits<double>::max();
    double hi = std::numeric_limits<double>::lowest();
    for (const auto& building : buildings) {
        for (const auto& solid : building.solids) {
            for (const auto& surface : solid.surfaces) {
                for (const auto& p : surface.outer) {
                    lo = std::min(lo, p.z);
                    hi = std::max(hi, p.z);
                }
            }
        }
    }
    if (lo > hi) return std::nullopt;
    return hi - lo;
}

} // namespace

std::optional<MergedRecord> Merger::merge(const osm::OsmObject& object,
                                          const match::MatchResult& result,
                                          const index::GeometryIndex& index,
                                          const MergeConfig& config) {
    if (result.empty()) {
        spdlog::debug("Merger: {} has no candidates", object.identifier());
        return std::nullopt;
    }

    MergedRecord record;
    record.osm_identifier = object.identifier();
    record.stem = object.file_stem();
    record.osm_type = object.type;
    record.osm_id = object.osm_id;
    record.lon = object.lon;
    record.lat = object.lat;
    record.epsg = result.epsg;
    record.point = result.point;
    record.candidates = result.candidates;

    // Geometry: selected buildings, verbatim apart from ring closure
    for (const auto& candidate : result.candidates) {
        if (!candidate.selected) continue;

        const index::IndexedBuilding* entry = index.find(candidate.building_id);
        if (!entry) {
            throw PipelineError(FailureKind::GeometryMismatch,
                                "building " + candidate.building_id + " is not in the index");
        }
        const auto& building = entry->building;
        if (!building.epsg) {
            throw PipelineError(FailureKind::GeometryMismatch,
                                "building " + building.id + " has no reference system");
        }
        if (*building.epsg != result.epsg) {
            throw PipelineError(FailureKind::GeometryMismatch,
                                "building " + building.id + " is in EPSG:" + std::to_string(*building.epsg) +
                                ", match is in EPSG:" + std::to_string(result.epsg));
        }

        cityjson::CityBuilding copy = building;
        close_rings(copy, config.closure_tolerance_m);

        auto issues = check_building(copy, config.planarity_tolerance_m, config.closure_tolerance_m);
        record.issues.insert(record.issues.end(), issues.begin(), issues.end());
        record.buildings.push_back(std::move(copy));
    }

    // OSM tags always win
    for (const auto& [key, value] : object.tags) {
        record.attributes[key] = Attribute{value, Provenance::Osm};
    }

    const std::string& prefix = config.cityjson_key_prefix;
    for (const auto& building : record.buildings) {
        for (auto it = building.attributes.begin(); it != building.attributes.end(); ++it) {
            if (it.value().is_null()) continue;

            const char* target = mapped_key(it.key());
            if (!target) {
                if (config.verbatim_building_attributes) {
                    set_if_absent(record.attributes, prefix + it.key(), it.value(), Provenance::CityJson);
                }
                continue;
            }

            auto existing = record.attributes.find(target);
            if (existing != record.attributes.end() && existing->second.origin == Provenance::Osm) {
                set_if_absent(record.attributes, prefix + target, it.value(), Provenance::CityJson);
            } else {
                // First selected building (best ranked) wins between buildings
                set_if_absent(record.attributes, target, it.value(), Provenance::CityJson);
            }
        }
    }

    if (record.attributes.count("height") == 0) {
        if (auto height = height_from_solids(record.buildings)) {
            record.attributes["height"] = Attribute{round_cm(*height), Provenance::Derived};
        }
    }

    // Match summary, as derived attributes
    const match::Candidate& best = result.candidates.front();
    nlohmann::json building_ids = nlohmann::json::array();
    for (const auto& building : record.buildings) {
        building_ids.push_back(building.id);
    }
    set_if_absent(record.attributes, "match:building_id",
                  building_ids.size() == 1 ? building_ids[0] : building_ids, Provenance::Derived);
    set_if_absent(record.attributes, "match:tile", best.tile, Provenance::Derived);
    set_if_absent(record.attributes, "match:distance_m", best.distance_m, Provenance::Derived);
    set_if_absent(record.attributes, "match:confidence", best.confidence, Provenance::Derived);

    if (!record.issues.empty()) {
        spdlog::debug("Merger: {} has {} geometry issues", record.osm_identifier, record.issues.size());
    }
    spdlog::debug("Merger: {} -> {} buildings, {} surfaces, {} attributes",
                  record.osm_identifier, record.buildings.size(), record.surface_count(),
                  record.attributes.size());
    return record;
}

} // namespace cityfuse::merge
