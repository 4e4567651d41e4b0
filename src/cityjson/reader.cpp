/**
 * @file reader.cpp
 * @brief Implementation of the CityJSON tile reader
 */

#include "cityjson/reader.hpp"
#include "osm/coordinates.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <limits>
#include <unordered_map>

namespace cityfuse::cityjson {

using nlohmann::json;

namespace {

// Walk semantics.values along the boundary nesting; null when absent
json semantic_value_at(const json& values, std::initializer_list<size_t> path) {
    const json* current = &values;
    for (size_t index : path) {
        if (!current->is_array() || index >= current->size()) {
            return json();
        }
        current = &(*current)[index];
    }
    return *current;
}

} // namespace

void CityJsonReader::clear() {
    m_buildings.clear();
    m_vertices.clear();
    m_epsg.reset();
    m_without_lod = 0;
    m_error.clear();
}

std::vector<CityBuilding> CityJsonReader::take_buildings() {
    std::vector<CityBuilding> result = std::move(m_buildings);
    m_buildings.clear();
    return result;
}

bool CityJsonReader::read(const std::filesystem::path& filepath) {
    clear();

    if (!std::filesystem::exists(filepath)) {
        m_error = "File not found: " + filepath.string();
        spdlog::error("CityJSON Reader: {}", m_error);
        return false;
    }

    json document;
    try {
        std::ifstream input(filepath);
        if (!input) {
            m_error = "Cannot open " + filepath.string();
            spdlog::error("CityJSON Reader: {}", m_error);
            return false;
        }
        document = json::parse(input);
    } catch (const json::exception& e) {
        m_error = filepath.filename().string() + ": " + e.what();
        spdlog::error("CityJSON Reader: {}", m_error);
        return false;
    }

    return read_document(document, filepath.filename().string());
}

bool CityJsonReader::read_document(const json& document, const std::string& tile_name) {
    clear();

    try {
        if (document.value("type", "") != "CityJSON") {
            m_error = tile_name + ": not a CityJSON document";
            spdlog::error("CityJSON Reader: {}", m_error);
            return false;
        }

        m_epsg = read_epsg(document);
        if (!m_epsg) {
            spdlog::warn("CityJSON Reader: {} declares no EPSG reference system", tile_name);
        }

        // Vertices are integers scaled by the optional transform
        glm::dvec3 scale(1.0);
        glm::dvec3 translate(0.0);
        if (document.contains("transform")) {
            const auto& transform = document["transform"];
            const auto s = transform.at("scale").get<std::vector<double>>();
            const auto t = transform.at("translate").get<std::vector<double>>();
            if (s.size() != 3 || t.size() != 3) {
                m_error = tile_name + ": malformed transform";
                spdlog::error("CityJSON Reader: {}", m_error);
                return false;
            }
            scale = glm::dvec3(s[0], s[1], s[2]);
            translate = glm::dvec3(t[0], t[1], t[2]);
        }

        const auto& vertices = document.at("vertices");
        m_vertices.reserve(vertices.size());
        for (const auto& v : vertices) {
            glm::dvec3 raw(v.at(0).get<double>(), v.at(1).get<double>(), v.at(2).get<double>());
            m_vertices.push_back(raw * scale + translate);
        }

        const auto& objects = document.at("CityObjects");
        std::unordered_map<std::string, size_t> building_slots;

        // Buildings first, so parts can find their parent
        for (auto it = objects.begin(); it != objects.end(); ++it) {
            const auto& object = it.value();
            if (object.value("type", "") != "Building") continue;

            CityBuilding building;
            building.id = it.key();
            building.tile = tile_name;
            building.epsg = m_epsg;
            if (object.contains("attributes") && object["attributes"].is_object()) {
                building.attributes = object["attributes"];
            }
            for (const auto& geometry : object.value("geometry", json::array())) {
                if (lod_selected(geometry)) {
                    read_geometry(geometry, building.solids);
                }
            }

            building_slots[building.id] = m_buildings.size();
            m_buildings.push_back(std::move(building));
        }

        for (auto it = objects.begin(); it != objects.end(); ++it) {
            const auto& object = it.value();
            if (object.value("type", "") != "BuildingPart") continue;

            std::vector<Solid> part_solids;
            for (const auto& geometry : object.value("geometry", json::array())) {
                if (lod_selected(geometry)) {
                    read_geometry(geometry, part_solids);
                }
            }

            std::string parent_id;
            if (object.contains("parents") && object["parents"].is_array() && !object["parents"].empty()) {
                parent_id = object["parents"][0].get<std::string>();
            }

            auto parent = building_slots.find(parent_id);
            if (m_config.fold_building_parts && parent != building_slots.end()) {
                auto& solids = m_buildings[parent->second].solids;
                solids.insert(solids.end(),
                              std::make_move_iterator(part_solids.begin()),
                              std::make_move_iterator(part_solids.end()));
                continue;
            }

            CityBuilding building;
            building.id = it.key();
            building.tile = tile_name;
            building.epsg = m_epsg;
            if (object.contains("attributes") && object["attributes"].is_object()) {
                building.attributes = object["attributes"];
            }
            building.solids = std::move(part_solids);
            m_buildings.push_back(std::move(building));
        }

        for (const auto& building : m_buildings) {
            if (building.solids.empty()) {
                m_without_lod++;
            }
        }

        spdlog::info("CityJSON Reader: {} -> {} buildings ({} without LOD{} geometry)",
                     tile_name, m_buildings.size(), m_without_lod, m_config.lod_prefix);
        return true;

    } catch (const std::exception& e) {
        m_error = tile_name + ": " + e.what();
        spdlog::error("CityJSON Reader: {}", m_error);
        m_buildings.clear();
        return false;
    }
}

bool CityJsonReader::lod_selected(const json& geometry) const {
    if (!geometry.contains("lod")) {
        return false;
    }
    const auto& lod = geometry["lod"];
    std::string text = lod.is_string() ? lod.get<std::string>() : lod.dump();
    return text.rfind(m_config.lod_prefix, 0) == 0;
}

glm::dvec3 CityJsonReader::vertex(size_t index) const {
    if (index >= m_vertices.size()) {
        throw std::out_of_range("vertex index " + std::to_string(index) + " out of range");
    }
    return m_vertices[index];
}

Surface CityJsonReader::read_surface(const json& rings,
                                     const json& semantic_value,
                                     const json& semantic_surfaces) const {
    Surface surface;

    // Old exports wrap the semantic index in a list
    json index = semantic_value;
    if (index.is_array()) {
        index = index.empty() ? json() : index[0];
    }
    if (index.is_number_integer()) {
        const auto i = index.get<size_t>();
        if (i < semantic_surfaces.size()) {
            surface.semantic_type = semantic_surfaces[i].value("type", "");
        }
    }
    surface.role = classify_surface(surface.semantic_type);

    bool first = true;
    for (const auto& ring : rings) {
        std::vector<glm::dvec3> points;
        points.reserve(ring.size());
        for (const auto& idx : ring) {
            points.push_back(vertex(idx.get<size_t>()));
        }
        if (first) {
            surface.outer = std::move(points);
            first = false;
        } else if (points.size() >= 3) {
            surface.holes.push_back(std::move(points));
        }
    }
    return surface;
}

void CityJsonReader::read_geometry(const json& geometry, std::vector<Solid>& solids) const {
    const std::string type = geometry.value("type", "");
    const auto& boundaries = geometry.at("boundaries");
    const std::string lod = geometry["lod"].is_string() ? geometry["lod"].get<std::string>()
                                                        : geometry["lod"].dump();

    json semantic_surfaces = json::array();
    json values;
    if (geometry.contains("semantics") && geometry["semantics"].is_object()) {
        const auto& semantics = geometry["semantics"];
        semantic_surfaces = semantics.value("surfaces", json::array());
        if (semantics.contains("values")) {
            values = semantics["values"];
        }
    }

    auto keep = [](const Surface& surface) { return surface.outer.size() >= 3; };

    if (type == "MultiSurface" || type == "CompositeSurface") {
        Solid solid;
        solid.lod = lod;
        for (size_t i = 0; i < boundaries.size(); ++i) {
            Surface surface = read_surface(boundaries[i], semantic_value_at(values, {i}), semantic_surfaces);
            if (keep(surface)) solid.surfaces.push_back(std::move(surface));
        }
        if (!solid.surfaces.empty()) solids.push_back(std::move(solid));

    } else if (type == "Solid") {
        if (boundaries.empty()) return;
        if (boundaries.size() > 1) {
            spdlog::debug("CityJSON Reader: ignoring {} interior shells", boundaries.size() - 1);
        }
        Solid solid;
        solid.lod = lod;
        const auto& shell = boundaries[0];
        for (size_t j = 0; j < shell.size(); ++j) {
            Surface surface = read_surface(shell[j], semantic_value_at(values, {0, j}), semantic_surfaces);
            if (keep(surface)) solid.surfaces.push_back(std::move(surface));
        }
        if (!solid.surfaces.empty()) solids.push_back(std::move(solid));

    } else if (type == "MultiSolid" || type == "CompositeSolid") {
        for (size_t k = 0; k < boundaries.size(); ++k) {
            if (boundaries[k].empty()) continue;
            Solid solid;
            solid.lod = lod;
            const auto& shell = boundaries[k][0];
            for (size_t j = 0; j < shell.size(); ++j) {
                Surface surface = read_surface(shell[j], semantic_value_at(values, {k, 0, j}), semantic_surfaces);
                if (keep(surface)) solid.surfaces.push_back(std::move(surface));
            }
            if (!solid.surfaces.empty()) solids.push_back(std::move(solid));
        }

    } else {
        spdlog::debug("CityJSON Reader: skipping geometry type '{}'", type);
    }
}

std::optional<Extent> CityJsonReader::read_extent(const json& document) {
    if (!document.contains("metadata")) return std::nullopt;
    const auto& metadata = document["metadata"];
    if (!metadata.contains("geographicalExtent")) return std::nullopt;

    const auto& extent = metadata["geographicalExtent"];
    if (!extent.is_array() || extent.size() != 6) return std::nullopt;

    Extent result{};
    for (size_t i = 0; i < 6; ++i) {
        if (!extent[i].is_number()) return std::nullopt;
        result[i] = extent[i].get<double>();
    }
    return result;
}

std::optional<int> CityJsonReader::read_epsg(const json& document) {
    if (!document.contains("metadata")) return std::nullopt;
    const auto& metadata = document["metadata"];
    if (!metadata.contains("referenceSystem") || !metadata["referenceSystem"].is_string()) {
        return std::nullopt;
    }
    return osm::parse_epsg(metadata["referenceSystem"].get<std::string>());
}

std::optional<Extent> CityJsonReader::compute_extent(const json& document) {
    if (!document.contains("vertices") || document["vertices"].empty()) return std::nullopt;

    glm::dvec3 scale(1.0);
    glm::dvec3 translate(0.0);
    if (document.contains("transform")) {
        const auto s = document["transform"].at("scale").get<std::vector<double>>();
        const auto t = document["transform"].at("translate").get<std::vector<double>>();
        if (s.size() == 3 && t.size() == 3) {
            scale = glm::dvec3(s[0], s[1], s[2]);
            translate = glm::dvec3(t[0], t[1], t[2]);
        }
    }

    glm::dvec3 lo(std::numeric_limits<double>::max());
    glm::dvec3 hi(std::numeric_limits<double>::lowest());
    for (const auto& v : document["vertices"]) {
        glm::dvec3 p = glm::dvec3(v.at(0).get<double>(), v.at(1).get<double>(), v.at(2).get<double>())
                       * scale + translate;
        lo = glm::min(lo, p);
        hi = glm::max(hi, p);
    }
    return Extent{lo.x, lo.y, lo.z, hi.x, hi.y, hi.z};
}

} // namespace cityfuse::cityjson
