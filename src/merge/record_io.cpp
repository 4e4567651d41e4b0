#include "merge/record_io.hpp"
#include "cityjson/reader.hpp"
#include "core/errors.hpp"
#include "core/file_utils.hpp"
#include "merge/geometry_check.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <map>
#include <unordered_map>

namespace cityfuse::merge {

using nlohmann::json;

namespace {

constexpr double VERTEX_SCALE = 0.001;

// Quantized vertex pool shared by every geometry of the document
class VertexPool {
public:
    explicit VertexPool(const glm::dvec3& translate) : m_translate(translate) {}

    size_t index_of(const glm::dvec3& p) {
        const std::array<int64_t, 3> q = {
            static_cast<int64_t>(std::llround((p.x - m_translate.x) / VERTEX_SCALE)),
            static_cast<int64_t>(std::llround((p.y - m_translate.y) / VERTEX_SCALE)),
            static_cast<int64_t>(std::llround((p.z - m_translate.z) / VERTEX_SCALE))};
        auto it = m_lookup.find(q);
        if (it != m_lookup.end()) return it->second;

        const size_t index = m_vertices.size();
        m_lookup.emplace(q, index);
        m_vertices.push_back(q);
        return index;
    }

    [[nodiscard]] json to_json() const {
        json vertices = json::array();
        for (const auto& q : m_vertices) {
            vertices.push_back({q[0], q[1], q[2]});
        }
        return vertices;
    }

private:
    glm::dvec3 m_translate;
    std::map<std::array<int64_t, 3>, size_t> m_lookup;
    std::vector<std::array<int64_t, 3>> m_vertices;
};

json ring_to_json(const std::vector<glm::dvec3>& ring, VertexPool& pool) {
    json indices = json::array();
    size_t n = ring.size();
    // CityJSON rings are written open
    if (n > 1 && ring.front() == ring.back()) n--;
    for (size_t i = 0; i < n; ++i) {
        indices.push_back(pool.index_of(ring[i]));
    }
    return indices;
}

json solid_to_json(const cityjson::Solid& solid, VertexPool& pool) {
    json boundaries = json::array();
    json semantic_surfaces = json::array();
    json values = json::array();
    std::map<std::string, size_t> semantic_index;

    for (const auto& surface : solid.surfaces) {
        json rings = json::array();
        rings.push_back(ring_to_json(surface.outer, pool));
        for (const auto& hole : surface.holes) {
            rings.push_back(ring_to_json(hole, pool));
        }
        boundaries.push_back(std::move(rings));

        if (surface.semantic_type.empty()) {
            values.push_back(nullptr);
            continue;
        }
        auto it = semantic_index.find(surface.semantic_type);
        if (it == semantic_index.end()) {
            it = semantic_index.emplace(surface.semantic_type, semantic_surfaces.size()).first;
            semantic_surfaces.push_back({{"type", surface.semantic_type}});
        }
        values.push_back(it->second);
    }

    json geometry = {
        {"type", "MultiSurface"},
        {"lod", solid.lod.empty() ? std::string("2") : solid.lod},
        {"boundaries", std::move(boundaries)},
    };
    if (!semantic_surfaces.empty()) {
        geometry["semantics"] = {{"surfaces", std::move(semantic_surfaces)}, {"values", std::move(values)}};
    }
    return geometry;
}

json candidate_to_json(const match::Candidate& candidate) {
    return {
        {"building_id", candidate.building_id},
        {"tile", candidate.tile},
        {"distance_m", candidate.distance_m},
        {"contains", candidate.contains},
        {"footprint_area_m2", candidate.footprint_area_m2},
        {"confidence", candidate.confidence},
        {"selected", candidate.selected},
    };
}

match::Candidate candidate_from_json(const json& j) {
    match::Candidate candidate;
    candidate.building_id = j.at("building_id").get<std::string>();
    candidate.tile = j.value("tile", "");
    candidate.distance_m = j.at("distance_m").get<double>();
    candidate.contains = j.value("contains", false);
    candidate.footprint_area_m2 = j.value("footprint_area_m2", 0.0);
    candidate.confidence = j.value("confidence", 0.0);
    candidate.selected = j.value("selected", false);
    return candidate;
}

} // namespace

std::string reference_system_uri(int epsg) {
    return "https://www.opengis.net/def/crs/EPSG/0/" + std::to_string(epsg);
}

json buildings_to_cityjson(const std::vector<cityjson::CityBuilding>& buildings, int epsg) {
    glm::dvec3 lo(std::numeric_limits<double>::max());
    glm::dvec3 hi(std::numeric_limits<double>::lowest());
    for (const auto& building : buildings) {
        for (const auto& solid : building.solids) {
            for (const auto& surface : solid.surfaces) {
                for (const auto& p : surface.outer) {
                    lo = glm::min(lo, p);
                    hi = glm::max(hi, p);
                }
            }
        }
    }
    if (lo.x > hi.x) {
        lo = glm::dvec3(0.0);
        hi = glm::dvec3(0.0);
    }

    VertexPool pool(lo);
    json objects = json::object();
    for (const auto& building : buildings) {
        json geometry = json::array();
        for (const auto& solid : building.solids) {
            geometry.push_back(solid_to_json(solid, pool));
        }
        json object = {{"type", "Building"}, {"geometry", std::move(geometry)}};
        if (!building.attributes.empty()) {
            object["attributes"] = building.attributes;
        }
        objects[building.id] = std::move(object);
    }

    return {
        {"type", "CityJSON"},
        {"version", "2.0"},
        {"transform", {{"scale", {VERTEX_SCALE, VERTEX_SCALE, VERTEX_SCALE}},
                       {"translate", {lo.x, lo.y, lo.z}}}},
        {"metadata", {{"referenceSystem", reference_system_uri(epsg)},
                      {"geographicalExtent", {lo.x, lo.y, lo.z, hi.x, hi.y, hi.z}}}},
        {"CityObjects", std::move(objects)},
        {"vertices", pool.to_json()},
    };
}

json record_to_json(const MergedRecord& record) {
    json candidates = json::array();
    for (const auto& candidate : record.candidates) {
        candidates.push_back(candidate_to_json(candidate));
    }

    json attributes = json::object();
    for (const auto& [key, attribute] : record.attributes) {
        attributes[key] = {{"value", attribute.value}, {"origin", provenance_name(attribute.origin)}};
    }

    json issues = json::array();
    for (const auto& issue : record.issues) {
        issues.push_back({
            {"kind", issue_kind_name(issue.kind)},
            {"building_id", issue.building_id},
            {"solid", issue.solid},
            {"surface", issue.surface},
            {"magnitude", issue.magnitude},
        });
    }

    // Flat summary of the best candidate, as earlier tooling expects it
    json best_id = nullptr;
    json best_tile = nullptr;
    json best_distance = nullptr;
    if (!record.candidates.empty()) {
        best_id = record.candidates.front().building_id;
        best_tile = record.candidates.front().tile;
        best_distance = record.candidates.front().distance_m;
    }

    return {
        {"osm_id", record.osm_identifier},
        {"osm_type", osm::element_type_name(record.osm_type)},
        {"osm_element_id", record.osm_id},
        {"stem", record.stem},
        {"lon", record.lon},
        {"lat", record.lat},
        {"epsg", record.epsg},
        {"point", {record.point.x, record.point.y}},
        {"cityjson_building_id", best_id},
        {"cityjson_tile", best_tile},
        {"distance_to_building_m", best_distance},
        {"candidates", std::move(candidates)},
        {"attributes", std::move(attributes)},
        {"geometry_issues", std::move(issues)},
        {"cityjson", buildings_to_cityjson(record.buildings, record.epsg)},
    };
}

MergedRecord record_from_json(const json& document) {
    MergedRecord record;
    try {
        record.osm_identifier = document.at("osm_id").get<std::string>();
        record.osm_type = osm::parse_element_type(document.at("osm_type").get<std::string>());
        record.osm_id = document.at("osm_element_id").get<osm::ElementId>();
        record.stem = document.at("stem").get<std::string>();
        record.lon = document.at("lon").get<double>();
        record.lat = document.at("lat").get<double>();
        record.epsg = document.at("epsg").get<int>();
        const auto& point = document.at("point");
        record.point = glm::dvec2(point.at(0).get<double>(), point.at(1).get<double>());

        for (const auto& candidate : document.at("candidates")) {
            record.candidates.push_back(candidate_from_json(candidate));
        }

        for (auto it = document.at("attributes").begin(); it != document.at("attributes").end(); ++it) {
            record.attributes[it.key()] = Attribute{it.value().at("value"),
                                                    parse_provenance(it.value().value("origin", "derived"))};
        }

        for (const auto& issue : document.value("geometry_issues", json::array())) {
            GeometryIssue parsed;
            parsed.kind = parse_issue_kind(issue.at("kind").get<std::string>());
            parsed.building_id = issue.value("building_id", "");
            parsed.solid = issue.value("solid", size_t{0});
            parsed.surface = issue.value("surface", size_t{0});
            parsed.magnitude = issue.value("magnitude", 0.0);
            record.issues.push_back(std::move(parsed));
        }
    } catch (const json::exception& e) {
        throw PipelineError(FailureKind::ReadError, std::string("malformed merged record: ") + e.what());
    }

    if (!document.contains("cityjson") || !document["cityjson"].is_object()) {
        throw PipelineError(FailureKind::ReadError, record.osm_identifier + ": merged record has no CityJSON");
    }

    cityjson::ReaderConfig reader_config;
    reader_config.lod_prefix = "";
    cityjson::CityJsonReader reader;
    reader.set_config(reader_config);
    if (!reader.read_document(document["cityjson"], record.stem)) {
        throw PipelineError(FailureKind::ReadError, reader.get_error());
    }
    if (reader.epsg() && *reader.epsg() != record.epsg) {
        throw PipelineError(FailureKind::ReadError,
                            record.osm_identifier + ": CityJSON reference system differs from the record");
    }

    // Restore selection order and source tiles
    std::unordered_map<std::string, size_t> rank;
    std::unordered_map<std::string, std::string> tiles;
    for (size_t i = 0; i < record.candidates.size(); ++i) {
        rank.emplace(record.candidates[i].building_id, i);
        tiles.emplace(record.candidates[i].building_id, record.candidates[i].tile);
    }
    record.buildings = reader.take_buildings();
    std::stable_sort(record.buildings.begin(), record.buildings.end(),
                     [&rank](const cityjson::CityBuilding& a, const cityjson::CityBuilding& b) {
                         auto ra = rank.find(a.id);
                         auto rb = rank.find(b.id);
                         const size_t ia = ra != rank.end() ? ra->second : rank.size();
                         const size_t ib = rb != rank.end() ? rb->second : rank.size();
                         return ia < ib;
                     });
    for (auto& building : record.buildings) {
        auto tile = tiles.find(building.id);
        building.tile = tile != tiles.end() ? tile->second : std::string();
        close_rings(building, 1e-6);
    }
    return record;
}

json point_feature(const osm::OsmObject& object, int epsg, const glm::dvec2& point) {
    json properties = json::object();
    for (const auto& [key, value] : object.tags) {
        properties[key] = value;
    }
    for (const auto& [key, value] : object.accessibility) {
        properties["acc_" + key] = value;
    }
    properties["lon"] = object.lon;
    properties["lat"] = object.lat;

    return {
        {"osm_id", object.identifier()},
        {"osm_type", osm::element_type_name(object.type)},
        {"epsg", epsg},
        {"geometry", {{"type", "Point"}, {"coordinates", {point.x, point.y}}}},
        {"properties", std::move(properties)},
    };
}

void write_json_file(const json& document, const std::filesystem::path& path) {
    core::write_text_file(path, document.dump(2, ' ', false, json::error_handler_t::replace) + "\n");
}

MergedRecord read_record(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        throw PipelineError(FailureKind::ReadError, "cannot open " + path.string());
    }

    json document;
    try {
        document = json::parse(input);
    } catch (const json::exception& e) {
        throw PipelineError(FailureKind::ReadError, path.filename().string() + ": " + e.what());
    }

    MergedRecord record = record_from_json(document);
    spdlog::debug("RecordIO: Read {} ({} buildings)", path.filename().string(), record.buildings.size());
    return record;
}

} // namespace cityfuse::merge
