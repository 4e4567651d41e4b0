/**
 * @file record_io.hpp
 * @brief Merged-record and point files
 *
 * Files per OSM object (stem "node_123"):
 *   node_123.json      OSM point in the projected system, tags as properties
 *   node_123_bld.json  merged record with a self-contained CityJSON document
 *
 * All writers go through a temporary file and a rename.
 */

#pragma once

#include "cityjson/types.hpp"
#include "merge/merged_record.hpp"
#include "osm/types.hpp"
#include <glm/glm.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace cityfuse::merge {

/**
 * @brief OGC URL of an EPSG reference system
 */
[[nodiscard]] std::string reference_system_uri(int epsg);

/**
 * @brief Serialize a merged record
 *
 * Output depends only on the record (no timestamps), keys are sorted.
 */
[[nodiscard]] nlohmann::json record_to_json(const MergedRecord& record);

/**
 * @brief Parse a merged record
 * @throws PipelineError (ReadError) on missing or malformed members
 */
[[nodiscard]] MergedRecord record_from_json(const nlohmann::json& document);

/**
 * @brief CityJSON 2.0 document holding only the given buildings
 *
 * Only the vertices used by the buildings are written, on a 1 mm grid
 * (transform scale 0.001).
 */
[[nodiscard]] nlohmann::json buildings_to_cityjson(const std::vector<cityjson::CityBuilding>& buildings,
                                                   int epsg);

/**
 * @brief GeoJSON-like point file of one OSM object
 */
[[nodiscard]] nlohmann::json point_feature(const osm::OsmObject& object, int epsg, const glm::dvec2& point);

/**
 * @brief Write a JSON document (2-space indent) atomically
 * @throws PipelineError (WriteError)
 */
void write_json_file(const nlohmann::json& document, const std::filesystem::path& path);

/**
 * @brief Read a merged-record file
 * @throws PipelineError (ReadError)
 */
[[nodiscard]] MergedRecord read_record(const std::filesystem::path& path);

} // namespace cityfuse::merge
