/**
 * @file config.hpp
 * @brief Pipeline configuration
 * @author cityfuse Team
 * @version 0.1.0
 * @date 2026
 *
 * Aggregates the per-stage configuration structs. Every value has a
 * default; a JSON config file overrides the values it names:
 *
 * @code
 * {
 *   "reader": { "lod_prefix": "2", "fold_building_parts": true },
 *   "match":  { "search_radius_m": 25.0, "max_candidates": 0 },
 *   "merge":  { "cityjson_key_prefix": "cityjson:" },
 *   "mesh":   { "weld_tolerance_m": 0.001, "roof_color": [0.7, 0.25, 0.2, 1.0] },
 *   "output": { "directory": "out", "workers": 0 }
 * }
 * @endcode
 */

#pragma once

#include "cityjson/reader.hpp"
#include "match/matcher.hpp"
#include "merge/merger.hpp"
#include "mesh/mesh_builder.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

namespace cityfuse::core {

/**
 * @brief Where and what the batch writes
 */
struct OutputConfig {
    std::filesystem::path directory = "out";
    std::string record_suffix = "_bld";     ///< node_123_bld.json
    std::string mesh_extension = ".glb";    ///< node_123.glb
    bool write_point_files = true;          ///< node_123.json
    bool write_summary = true;              ///< run_summary.json
    unsigned workers = 0;                   ///< 0 = hardware concurrency, 1 = sequential
};

/**
 * @brief Complete configuration of a run
 */
struct PipelineConfig {
    cityjson::ReaderConfig reader;
    match::MatchConfig match;
    merge::MergeConfig merge;
    mesh::MeshConfig mesh;
    OutputConfig output;
};

/**
 * @brief Apply the values of a JSON config document
 *
 * Missing keys keep their current value, unknown keys are logged and
 * ignored.
 *
 * @return false with error set when a value has the wrong type
 */
bool apply_config(const nlohmann::json& document, PipelineConfig& config, std::string& error);

/**
 * @brief Load a JSON config file on top of config
 * @return false with error set when the file is unreadable or invalid
 */
bool load_config_file(const std::filesystem::path& path, PipelineConfig& config, std::string& error);

} // namespace cityfuse::core
