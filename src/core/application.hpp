/**
 * @file application.hpp
 * @brief Batch driver of the merge pipeline
 * @author cityfuse Team
 * @version 0.1.0
 * @date 2026
 *
 * This file contains the Application class, which loads the inputs,
 * builds the shared geometry index once and then runs
 * match -> merge -> mesh -> export for every OSM object.
 */

#pragma once

#include "core/config.hpp"
#include "core/errors.hpp"
#include "cityjson/tile_catalog.hpp"
#include "index/geometry_index.hpp"
#include "osm/types.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * @namespace cityfuse
 * @brief Root namespace for all cityfuse code
 */
namespace cityfuse::core {

/**
 * @brief One object the pipeline could not carry to a mesh file
 */
struct ObjectFailure {
    std::string osm_identifier;
    FailureKind kind = FailureKind::NoMatch;
    std::string message;
};

/**
 * @brief Counts of one run
 *
 * failed counts every failure kind, NoMatch included (equal to unmatched).
 */
struct RunSummary {
    size_t total = 0;           ///< Objects read, with or without coordinates
    size_t skipped = 0;         ///< Objects without coordinates
    size_t matched = 0;         ///< At least one candidate
    size_t unmatched = 0;       ///< NoMatch
    size_t merged = 0;
    size_t meshed = 0;
    size_t exported = 0;
    std::map<FailureKind, size_t> failed;
    std::vector<ObjectFailure> failures;    ///< Sorted by identifier after run()
    double elapsed_ms = 0.0;

    [[nodiscard]] size_t failed_count() const;
    [[nodiscard]] nlohmann::json to_json() const;
    void log() const;
};

/**
 * @brief Batch driver coordinating all pipeline stages
 *
 * Typical usage:
 * @code
 * cityfuse::core::Application app(config);
 * if (!app.init("pois.json", "tiles/")) {
 *     return 1;
 * }
 * app.run();
 * @endcode
 *
 * Objects are processed by output.workers parallel workers; the index is
 * read-only after init() and the summary is the only shared mutable state.
 */
class Application {
public:
    explicit Application(PipelineConfig config = PipelineConfig{});

    /// @name Deleted Copy Operations
    /// @{
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    /// @}

    /**
     * @brief Load OSM objects and the CityJSON tiles around them
     *
     * Only tiles whose extent covers an object (grown by the search
     * radius) are loaded; all tiles are loaded when no tile is selected
     * or the tiles do not share a reference system.
     *
     * @return false when an input cannot be read or the index cannot be
     *         built (see get_error())
     */
    bool init(const std::filesystem::path& osm_input, const std::filesystem::path& cityjson_dir);

    /**
     * @brief Use in-memory objects and buildings
     * @return false when the index cannot be built (see get_error())
     */
    bool init(std::vector<osm::OsmObject> objects, std::vector<cityjson::CityBuilding> buildings,
              size_t skipped = 0);

    /**
     * @brief Process every object and write the run summary
     * @pre init() returned true
     * @return false on a fatal error (see get_error())
     */
    bool run();

    [[nodiscard]] const RunSummary& get_summary() const { return m_summary; }
    [[nodiscard]] const index::GeometryIndex& get_index() const { return m_index; }
    [[nodiscard]] const cityjson::TileCatalog& get_catalog() const { return m_catalog; }
    [[nodiscard]] const std::vector<osm::OsmObject>& get_objects() const { return m_objects; }
    [[nodiscard]] const PipelineConfig& get_config() const { return m_config; }
    [[nodiscard]] const std::string& get_error() const { return m_error; }

    /**
     * @brief Output paths of one object
     */
    [[nodiscard]] std::filesystem::path point_path(const osm::OsmObject& object) const;
    [[nodiscard]] std::filesystem::path record_path(const osm::OsmObject& object) const;
    [[nodiscard]] std::filesystem::path mesh_path(const osm::OsmObject& object) const;

    /**
     * @brief Rebuild the mesh file of a merged-record file
     * @throws PipelineError (ReadError, DegenerateSolid, WriteError)
     */
    static void mesh_record(const std::filesystem::path& record_file,
                            const std::filesystem::path& destination,
                            const mesh::MeshConfig& config = mesh::MeshConfig{});

private:
    /**
     * @brief Per-object progress, folded into the summary at the end
     */
    struct ObjectReport {
        bool matched = false;
        bool merged = false;
        bool meshed = false;
        bool exported = false;
        bool failed = false;
        ObjectFailure failure;
    };

    bool build_index(std::vector<cityjson::CityBuilding> buildings);
    std::vector<cityjson::CityBuilding> load_tiles_for_objects();
    ObjectReport process_object(const osm::OsmObject& object) const;
    void record(const ObjectReport& report);

    PipelineConfig m_config;
    cityjson::TileCatalog m_catalog;
    index::GeometryIndex m_index;
    std::vector<osm::OsmObject> m_objects;
    size_t m_skipped = 0;

    RunSummary m_summary;
    std::mutex m_summary_mutex;     ///< Guards m_summary during run()
    std::string m_error;
};

} // namespace cityfuse::core
