/**
 * @file parser.cpp
 * @brief Implementation of the OSM object loader (nlohmann/json and libosmium)
 */

#include "osm/parser.hpp"
#include "osm/categories.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <fstream>
#include <algorithm>
#include <cctype>

// libosmium includes
#include <osmium/io/any_input.hpp>
#include <osmium/handler.hpp>
#include <osmium/visitor.hpp>
#include <osmium/index/map/flex_mem.hpp>
#include <osmium/handler/node_locations_for_ways.hpp>

namespace cityfuse::osm {

// ============================================================================
// Type aliases for libosmium
// ============================================================================

using LocationIndex = osmium::index::map::FlexMem<
    osmium::unsigned_object_id_type,
    osmium::Location
>;

using LocationHandler = osmium::handler::NodeLocationsForWays<LocationIndex>;

namespace {

std::string to_tag_string(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return std::string();
    return value.dump();
}

TagMap read_tag_object(const nlohmann::json& object) {
    TagMap tags;
    if (!object.is_object()) return tags;
    for (auto it = object.begin(); it != object.end(); ++it) {
        tags[it.key()] = to_tag_string(it.value());
    }
    return tags;
}

bool read_number(const nlohmann::json& object, const char* key, double& out) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number()) return false;
    out = it->get<double>();
    return true;
}

bool has_extension(const std::filesystem::path& path, const char* ext) {
    std::string e = path.extension().string();
    std::transform(e.begin(), e.end(), e.begin(), [](unsigned char c) { return std::tolower(c); });
    return e == ext;
}

} // namespace

// ============================================================================
// Internal Handler
// ============================================================================

/**
 * @brief Internal handler turning tagged nodes and closed ways into objects
 */
class ObjectHandler : public osmium::handler::Handler {
public:
    ObjectHandler(std::vector<OsmObject>& objects, ParseStats& stats, const ParserConfig& config)
        : m_objects(objects), m_stats(stats), m_config(config) {}

    void node(const osmium::Node& node) {
        if (node.tags().empty()) return;
        m_stats.total_elements++;

        OsmObject object;
        object.type = ElementType::Node;
        object.osm_id = node.id();
        copy_tags(node.tags(), object.tags);
        if (!keep(object.tags)) return;

        if (!node.location().valid()) {
            m_stats.without_coordinates++;
            return;
        }
        object.lat = node.location().lat();
        object.lon = node.location().lon();
        m_objects.push_back(std::move(object));
    }

    void way(const osmium::Way& way) {
        if (!m_config.import_ways || way.tags().empty()) return;
        m_stats.total_elements++;

        OsmObject object;
        object.type = ElementType::Way;
        object.osm_id = way.id();
        copy_tags(way.tags(), object.tags);
        if (!keep(object.tags)) return;

        // Ring coordinates come from the LocationHandler
        std::vector<glm::dvec2> ring;
        ring.reserve(way.nodes().size());
        for (const auto& node_ref : way.nodes()) {
            if (node_ref.location().valid()) {
                ring.emplace_back(node_ref.location().lon(), node_ref.location().lat());
            }
        }

        if (!way.is_closed() || ring.size() < 4) {
            m_stats.without_coordinates++;
            return;
        }

        // Mean of the open ring stands in for Overpass' "center"
        glm::dvec2 sum(0.0);
        for (size_t i = 0; i + 1 < ring.size(); ++i) {
            sum += ring[i];
        }
        sum /= static_cast<double>(ring.size() - 1);
        object.lon = sum.x;
        object.lat = sum.y;
        object.footprint = std::move(ring);
        m_objects.push_back(std::move(object));
    }

private:
    static void copy_tags(const osmium::TagList& list, TagMap& tags) {
        for (const auto& tag : list) {
            tags[tag.key()] = tag.value();
        }
    }

    bool keep(const TagMap& tags) {
        if (m_config.require_poi_tags && !is_point_of_interest(tags)) {
            m_stats.not_of_interest++;
            return false;
        }
        return true;
    }

    std::vector<OsmObject>& m_objects;
    ParseStats& m_stats;
    const ParserConfig& m_config;
};

// ============================================================================
// OSMParser Implementation
// ============================================================================

bool OSMParser::parse(const std::filesystem::path& filepath) {
    using Clock = std::chrono::high_resolution_clock;

    clear();
    auto parse_start = Clock::now();

    if (!std::filesystem::exists(filepath)) {
        m_error = "File not found: " + filepath.string();
        spdlog::error("OSM Parser: {}", m_error);
        return false;
    }

    bool ok = false;
    if (has_extension(filepath, ".json")) {
        std::ifstream in(filepath);
        if (!in) {
            m_error = "Cannot open " + filepath.string();
            spdlog::error("OSM Parser: {}", m_error);
            return false;
        }
        nlohmann::json document = nlohmann::json::parse(in, nullptr, false);
        if (document.is_discarded()) {
            m_error = "Invalid JSON in " + filepath.string();
            spdlog::error("OSM Parser: {}", m_error);
            return false;
        }
        spdlog::info("OSM Parser: Detected JSON format for {}", filepath.filename().string());
        ok = parse_json(document);
    } else {
        ok = parse_osm_file(filepath);
    }

    m_stats.parse_time_ms = std::chrono::duration<double, std::milli>(
        Clock::now() - parse_start).count();

    if (ok) {
        spdlog::info("OSM Parser: Loaded {} objects from {} elements in {:.1f}ms",
                     m_stats.objects, m_stats.total_elements, m_stats.parse_time_ms);
    }
    return ok;
}

bool OSMParser::parse_json(const nlohmann::json& document) {
    m_objects.clear();
    m_stats = ParseStats{};
    m_error.clear();

    const nlohmann::json* elements = nullptr;
    bool overpass = false;
    if (document.is_array()) {
        elements = &document;
    } else if (document.is_object() && document.contains("elements") && document["elements"].is_array()) {
        elements = &document["elements"];
        overpass = true;
    } else {
        m_error = "Expected an array of objects or an Overpass document with \"elements\"";
        spdlog::error("OSM Parser: {}", m_error);
        return false;
    }

    try {
        for (const auto& element : *elements) {
            add_json_element(element, overpass);
        }
    } catch (const nlohmann::json::exception& e) {
        m_error = e.what();
        spdlog::error("OSM Parser error: {}", m_error);
        m_objects.clear();
        return false;
    }
    return true;
}

void OSMParser::add_json_element(const nlohmann::json& element, bool overpass) {
    if (!element.is_object()) return;
    m_stats.total_elements++;

    OsmObject object;
    const char* id_key = overpass ? "id" : "osm_id";
    const char* type_key = overpass ? "type" : "osm_type";

    auto id = element.find(id_key);
    if (id == element.end() || !id->is_number_integer()) {
        m_stats.without_identifier++;
        spdlog::debug("OSM Parser: Skipping element without \"{}\"", id_key);
        return;
    }

    object.type = parse_element_type(element.value(type_key, std::string("node")));
    object.osm_id = id->get<ElementId>();
    if (element.contains("tags")) {
        object.tags = read_tag_object(element["tags"]);
    }

    bool located = read_number(element, "lat", object.lat) && read_number(element, "lon", object.lon);
    if (!located && element.contains("center") && element["center"].is_object()) {
        const auto& center = element["center"];
        located = read_number(center, "lat", object.lat) && read_number(center, "lon", object.lon);
    }

    // Ways requested with "out geom" carry their node positions
    if (element.contains("geometry") && element["geometry"].is_array()) {
        std::vector<glm::dvec2> ring;
        for (const auto& p : element["geometry"]) {
            double lat = 0.0, lon = 0.0;
            if (p.is_object() && read_number(p, "lat", lat) && read_number(p, "lon", lon)) {
                ring.emplace_back(lon, lat);
            }
        }
        if (ring.size() >= 4 && ring.front() == ring.back()) {
            if (!located) {
                glm::dvec2 sum(0.0);
                for (size_t i = 0; i + 1 < ring.size(); ++i) sum += ring[i];
                sum /= static_cast<double>(ring.size() - 1);
                object.lon = sum.x;
                object.lat = sum.y;
                located = true;
            }
            object.footprint = std::move(ring);
        }
    }

    if (!located) {
        m_stats.without_coordinates++;
        return;
    }

    if (element.contains("accessibility") && element["accessibility"].is_object()) {
        object.accessibility = read_tag_object(element["accessibility"]);
    } else {
        object.accessibility = extract_accessibility(object.tags);
    }

    add_object(std::move(object));
}

bool OSMParser::parse_osm_file(const std::filesystem::path& filepath) {
    try {
        const osmium::io::File input_file{filepath.string()};

        std::string format_name;
        switch (input_file.format()) {
            case osmium::io::file_format::xml:  format_name = "XML"; break;
            case osmium::io::file_format::pbf:  format_name = "PBF"; break;
            case osmium::io::file_format::opl:  format_name = "OPL"; break;
            default: format_name = "Unknown"; break;
        }
        spdlog::info("OSM Parser: Detected {} format for {}", format_name, filepath.filename().string());

        osmium::io::Reader reader{input_file,
            osmium::osm_entity_bits::node |
            osmium::osm_entity_bits::way
        };

        LocationIndex index;
        LocationHandler location_handler{index};
        location_handler.ignore_errors();  // Don't fail on missing nodes

        std::vector<OsmObject> found;
        ObjectHandler object_handler(found, m_stats, m_config);

        osmium::apply(reader, location_handler, object_handler);
        reader.close();

        for (auto& object : found) {
            object.accessibility = extract_accessibility(object.tags);
            add_object(std::move(object));
        }
        return true;

    } catch (const std::exception& e) {
        m_error = e.what();
        spdlog::error("OSM Parser error: {}", m_error);
        m_objects.clear();
        return false;
    }
}

void OSMParser::add_object(OsmObject object) {
    if (m_config.filter_bounds && !m_config.filter_bounds->contains(object.lat, object.lon)) {
        m_stats.outside_bounds++;
        return;
    }
    m_objects.push_back(std::move(object));
    m_stats.objects = m_objects.size();
}

// ============================================================================
// Data Access
// ============================================================================

std::vector<OsmObject> OSMParser::take_objects() {
    std::vector<OsmObject> objects = std::move(m_objects);
    m_objects.clear();
    return objects;
}

void OSMParser::clear() {
    m_objects.clear();
    m_stats = ParseStats{};
    m_error.clear();
}

// ============================================================================
// Logging
// ============================================================================

void OSMParser::log_statistics() const {
    spdlog::info("=== OSM Load Statistics ===");
    spdlog::info("  Elements: {}", m_stats.total_elements);
    spdlog::info("  Objects: {}", m_stats.objects);
    spdlog::info("Skipped:");
    spdlog::info("  Without coordinates: {}", m_stats.without_coordinates);
    spdlog::info("  Without identifier: {}", m_stats.without_identifier);
    spdlog::info("  Outside bounds: {}", m_stats.outside_bounds);
    spdlog::info("  Not of interest: {}", m_stats.not_of_interest);
    spdlog::info("Timing:");
    spdlog::info("  Parse time: {:.1f}ms", m_stats.parse_time_ms);
}

} // namespace cityfuse::osm
