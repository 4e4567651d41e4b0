/**
 * @file parser.hpp
 * @brief Loader for OSM point-of-interest objects
 * @author cityfuse Team
 * @version 0.1.0
 * @date 2026
 *
 * This file provides the OSMParser class, which turns OpenStreetMap data
 * into OsmObject records for the merge pipeline.
 *
 * Supported inputs (detected by extension):
 *   - .json    - fetch output (array of simplified elements) or raw
 *                Overpass JSON ({"elements": [...]})
 *   - .osm     - XML format (libosmium)
 *   - .pbf     - Protobuf binary format (libosmium)
 *   - .osm.bz2 - Bzip2-compressed XML (libosmium)
 *   - .osm.gz  - Gzip-compressed XML (libosmium)
 */

#pragma once

#include "osm/types.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cityfuse::osm {

// ============================================================================
// Parser Configuration
// ============================================================================

/**
 * @brief Configuration options for OSM loading
 */
struct ParserConfig {
    bool require_poi_tags = true;       ///< OSM files: keep only point-of-interest objects
    bool import_ways = true;            ///< OSM files: closed ways become footprint objects
    std::optional<BoundingBox> filter_bounds; ///< Drop objects outside this box
};

/**
 * @brief Counters of one load
 */
struct ParseStats {
    size_t total_elements = 0;          ///< Elements seen
    size_t without_coordinates = 0;     ///< Skipped: no position
    size_t without_identifier = 0;      ///< Skipped: no usable id
    size_t outside_bounds = 0;          ///< Skipped: outside filter_bounds
    size_t not_of_interest = 0;         ///< Skipped: no point-of-interest tag
    size_t objects = 0;                 ///< Objects kept
    double parse_time_ms = 0.0;
};

// ============================================================================
// OSM Parser
// ============================================================================

/**
 * @brief Loads OSM objects from fetch output, Overpass JSON or OSM files
 *
 * Usage:
 * @code
 * cityfuse::osm::OSMParser parser;
 * if (parser.parse("karlsruhe_pois.json")) {
 *     auto objects = parser.take_objects();
 * }
 * @endcode
 */
class OSMParser {
public:
    OSMParser() = default;

    /**
     * @brief Set parser configuration
     */
    void set_config(const ParserConfig& config) { m_config = config; }

    [[nodiscard]] const ParserConfig& get_config() const { return m_config; }

    /**
     * @brief Load a file
     * @return true on success, false on failure (see get_error())
     */
    bool parse(const std::filesystem::path& filepath);

    /**
     * @brief Load an already parsed JSON document
     * @return true on success, false on failure (see get_error())
     */
    bool parse_json(const nlohmann::json& document);

    [[nodiscard]] const std::string& get_error() const { return m_error; }

    [[nodiscard]] const std::vector<OsmObject>& get_objects() const { return m_objects; }

    /**
     * @brief Take loaded objects (move semantics)
     */
    std::vector<OsmObject> take_objects();

    [[nodiscard]] const ParseStats& get_stats() const { return m_stats; }

    void clear();

    /**
     * @brief Log load statistics to spdlog
     */
    void log_statistics() const;

private:
    bool parse_osm_file(const std::filesystem::path& filepath);
    void add_object(OsmObject object);
    void add_json_element(const nlohmann::json& element, bool overpass);

    ParserConfig m_config;
    std::vector<OsmObject> m_objects;
    ParseStats m_stats;
    std::string m_error;
};

} // namespace cityfuse::osm
