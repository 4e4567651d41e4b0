#include "core/application.hpp"
#include "export/glb_exporter.hpp"
#include "match/matcher.hpp"
#include "merge/merger.hpp"
#include "merge/record_io.hpp"
#include "mesh/mesh_builder.hpp"
#include "osm/parser.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <thread>

namespace cityfuse::core {

// ============================================================================
// RunSummary
// ============================================================================

size_t RunSummary::failed_count() const {
    size_t count = 0;
    for (const auto& [kind, n] : failed) {
        count += n;
    }
    return count;
}

nlohmann::json RunSummary::to_json() const {
    nlohmann::json by_kind = nlohmann::json::object();
    for (const auto& [kind, n] : failed) {
        by_kind[failure_kind_name(kind)] = n;
    }

    nlohmann::json list = nlohmann::json::array();
    for (const auto& failure : failures) {
        list.push_back({
            {"osm_id", failure.osm_identifier},
            {"kind", failure_kind_name(failure.kind)},
            {"message", failure.message},
        });
    }

    return {
        {"total", total},
        {"skipped", skipped},
        {"matched", matched},
        {"unmatched", unmatched},
        {"merged", merged},
        {"meshed", meshed},
        {"exported", exported},
        {"failed", std::move(by_kind)},
        {"failures", std::move(list)},
    };
}

void RunSummary::log() const {
    spdlog::info("=== Run Summary ===");
    spdlog::info("  Objects: {} ({} skipped without coordinates)", total, skipped);
    spdlog::info("  Matched: {}", matched);
    spdlog::info("  Unmatched: {}", unmatched);
    spdlog::info("  Merged: {}", merged);
    spdlog::info("  Meshed: {}", meshed);
    spdlog::info("  Exported: {}", exported);
    spdlog::info("  Failed: {}", failed_count());
    for (const auto& [kind, n] : failed) {
        spdlog::info("    {}: {}", failure_kind_name(kind), n);
    }
    spdlog::info("  Time: {:.1f}ms", elapsed_ms);
}

// ============================================================================
// Application
// ============================================================================

Application::Application(PipelineConfig config)
    : m_config(std::move(config)) {}

bool Application::init(const std::filesystem::path& osm_input, const std::filesystem::path& cityjson_dir) {
    osm::OSMParser parser;
    if (!parser.parse(osm_input)) {
        m_error = "Failed to load OSM input: " + parser.get_error();
        return false;
    }
    parser.log_statistics();
    m_skipped = parser.get_stats().without_coordinates;
    m_objects = parser.take_objects();

    m_catalog.set_reader_config(m_config.reader);
    m_catalog.set_max_parallel_loads(m_config.output.workers);
    if (m_catalog.scan(cityjson_dir) == 0) {
        m_error = "No CityJSON tiles found in " + cityjson_dir.string();
        spdlog::error("Application: {}", m_error);
        return false;
    }

    const bool built = build_index(load_tiles_for_objects());
    // The index owns its copies now
    m_catalog.release_cache();
    return built;
}

bool Application::init(std::vector<osm::OsmObject> objects, std::vector<cityjson::CityBuilding> buildings,
                       size_t skipped) {
    m_objects = std::move(objects);
    m_skipped = skipped;
    return build_index(std::move(buildings));
}

std::vector<cityjson::CityBuilding> Application::load_tiles_for_objects() {
    std::optional<int> epsg = m_catalog.common_epsg();
    if (!epsg) {
        spdlog::warn("Application: Tiles do not share a reference system, loading all {} tiles",
                     m_catalog.tile_count());
        return m_catalog.load_all();
    }

    std::set<const cityjson::TileInfo*> covering;
    for (const auto& object : m_objects) {
        try {
            glm::dvec2 point = match::Matcher::representative_point(object, *epsg);
            for (const auto* tile : m_catalog.tiles_covering(point, m_config.match.search_radius_m)) {
                covering.insert(tile);
            }
        } catch (const PipelineError& e) {
            // Reported again per object during run()
            spdlog::debug("Application: {}: {}", object.identifier(), e.what());
        }
    }

    // Keep catalog order so the index sees buildings in a stable order
    std::vector<const cityjson::TileInfo*> selected;
    for (const auto& tile : m_catalog.tiles()) {
        if (covering.count(&tile) > 0) selected.push_back(&tile);
    }

    if (selected.empty()) {
        spdlog::warn("Application: No tile covers any object, loading all {} tiles", m_catalog.tile_count());
        return m_catalog.load_all();
    }

    spdlog::info("Application: {} of {} tiles cover the objects", selected.size(), m_catalog.tile_count());
    return m_catalog.load(selected);
}

bool Application::build_index(std::vector<cityjson::CityBuilding> buildings) {
    try {
        m_index.build(std::move(buildings));
    } catch (const IndexError& e) {
        m_error = e.what();
        spdlog::error("Application: Cannot build the geometry index: {}", m_error);
        return false;
    }
    return true;
}

std::filesystem::path Application::point_path(const osm::OsmObject& object) const {
    return m_config.output.directory / (object.file_stem() + ".json");
}

std::filesystem::path Application::record_path(const osm::OsmObject& object) const {
    return m_config.output.directory / (object.file_stem() + m_config.output.record_suffix + ".json");
}

std::filesystem::path Application::mesh_path(const osm::OsmObject& object) const {
    return m_config.output.directory / (object.file_stem() + m_config.output.mesh_extension);
}

bool Application::run() {
    using Clock = std::chrono::high_resolution_clock;
    auto start = Clock::now();

    m_summary = RunSummary{};
    m_summary.total = m_objects.size() + m_skipped;
    m_summary.skipped = m_skipped;

    if (!m_index.is_built()) {
        m_error = "run() called before a successful init()";
        spdlog::error("Application: {}", m_error);
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(m_config.output.directory, ec);
    if (ec) {
        m_error = "Cannot create " + m_config.output.directory.string() + ": " + ec.message();
        spdlog::error("Application: {}", m_error);
        return false;
    }

    size_t workers = m_config.output.workers;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    workers = std::max<size_t>(1, std::min(workers, m_objects.size()));
    spdlog::info("Application: Processing {} objects with {} worker(s)", m_objects.size(), workers);

    std::atomic<size_t> next{0};
    auto worker = [this, &next]() {
        for (size_t i = next++; i < m_objects.size(); i = next++) {
            record(process_object(m_objects[i]));
        }
    };

    try {
        if (workers == 1) {
            worker();
        } else {
            std::vector<std::future<void>> futures;
            futures.reserve(workers);
            for (size_t i = 0; i < workers; ++i) {
                futures.push_back(std::async(std::launch::async, worker));
            }
            // Join every worker before rethrowing
            std::exception_ptr fatal;
            for (auto& future : futures) {
                try {
                    future.get();
                } catch (...) {
                    if (!fatal) fatal = std::current_exception();
                }
            }
            if (fatal) std::rethrow_exception(fatal);
        }
    } catch (const IndexError& e) {
        m_error = e.what();
        spdlog::error("Application: {}", m_error);
        return false;
    }

    std::sort(m_summary.failures.begin(), m_summary.failures.end(),
              [](const ObjectFailure& a, const ObjectFailure& b) { return a.osm_identifier < b.osm_identifier; });

    m_summary.elapsed_ms = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    m_summary.log();

    if (m_config.output.write_summary) {
        try {
            merge::write_json_file(m_summary.to_json(), m_config.output.directory / "run_summary.json");
        } catch (const PipelineError& e) {
            m_error = e.what();
            spdlog::error("Application: Cannot write the run summary: {}", m_error);
            return false;
        }
    }
    return true;
}

Application::ObjectReport Application::process_object(const osm::OsmObject& object) const {
    ObjectReport report;
    report.failure.osm_identifier = object.identifier();

    try {
        match::MatchResult result = match::Matcher::match(object, m_index, m_config.match);
        report.matched = !result.empty();

        if (m_config.output.write_point_files) {
            merge::write_json_file(merge::point_feature(object, result.epsg, result.point), point_path(object));
        }

        std::optional<merge::MergedRecord> record =
            merge::Merger::merge(object, result, m_index, m_config.merge);
        if (!record) {
            report.failed = true;
            report.failure.kind = FailureKind::NoMatch;
            report.failure.message = fmt::format("no building within {} m", m_config.match.search_radius_m);
            spdlog::debug("Application: {}: {}", report.failure.osm_identifier, report.failure.message);
            return report;
        }
        report.merged = true;
        merge::write_json_file(merge::record_to_json(*record), record_path(object));

        mesh::Mesh mesh = mesh::MeshBuilder::build(*record, m_config.mesh);
        report.meshed = true;

        exporter::GlbExporter::export_mesh(mesh, mesh_path(object));
        report.exported = true;

        spdlog::debug("Application: {} -> {} ({} faces)", report.failure.osm_identifier,
                      mesh_path(object).filename().string(), mesh.face_count());

    } catch (const PipelineError& e) {
        report.failed = true;
        report.failure.kind = e.kind();
        report.failure.message = e.what();
        spdlog::warn("Application: {} failed ({}): {}", report.failure.osm_identifier,
                     failure_kind_name(e.kind()), e.what());
    } catch (const IndexError&) {
        throw;
    } catch (const std::exception& e) {
        // Anything else stays confined to this object
        report.failed = true;
        report.failure.kind = FailureKind::WriteError;
        report.failure.message = e.what();
        spdlog::warn("Application: {} failed: {}", report.failure.osm_identifier, e.what());
    }
    return report;
}

void Application::record(const ObjectReport& report) {
    std::lock_guard<std::mutex> lock(m_summary_mutex);
    if (report.matched) m_summary.matched++;
    if (report.merged) m_summary.merged++;
    if (report.meshed) m_summary.meshed++;
    if (report.exported) m_summary.exported++;
    if (report.failed) {
        if (report.failure.kind == FailureKind::NoMatch) m_summary.unmatched++;
        m_summary.failed[report.failure.kind]++;
        m_summary.failures.push_back(report.failure);
    }
}

void Application::mesh_record(const std::filesystem::path& record_file,
                              const std::filesystem::path& destination,
                              const mesh::MeshConfig& config) {
    merge::MergedRecord record = merge::read_record(record_file);
    mesh::Mesh mesh = mesh::MeshBuilder::build(record, config);
    exporter::GlbExporter::export_mesh(mesh, destination);
    spdlog::info("Application: Wrote {} ({} vertices, {} faces)", destination.string(),
                 mesh.vertices.size(), mesh.face_count());
}

} // namespace cityfuse::core
