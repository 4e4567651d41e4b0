#include "cityjson/tile_catalog.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <fstream>
#include <future>
#include <set>
#include <thread>

namespace cityfuse::cityjson {

using nlohmann::json;

namespace {

bool is_tile_file(const std::filesystem::path& path) {
    if (path.extension() != ".json") return false;
    const std::string name = path.filename().string();
    // Output of a previous run living next to the tiles
    if (name.size() > 9 && name.compare(name.size() - 9, 9, "_bld.json") == 0) return false;
    return name != "run_summary.json";
}

// Parse a document keeping only the top-level members that are not listed
json parse_without(const std::filesystem::path& path, const std::set<std::string>& skipped) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("cannot open " + path.string());
    }
    json::parser_callback_t filter = [&skipped](int depth, json::parse_event_t event, json& parsed) {
        if (depth == 1 && event == json::parse_event_t::key) {
            return skipped.count(parsed.get<std::string>()) == 0;
        }
        return true;
    };
    return json::parse(input, filter);
}

} // namespace

void TileCatalog::clear() {
    m_tiles.clear();
    std::lock_guard<std::mutex> lock(m_cache_mutex);
    m_cache.clear();
    m_failed = 0;
}

void TileCatalog::release_cache() {
    std::lock_guard<std::mutex> lock(m_cache_mutex);
    m_cache.clear();
}

size_t TileCatalog::cached_tiles() const {
    std::lock_guard<std::mutex> lock(m_cache_mutex);
    return m_cache.size();
}

bool TileCatalog::read_header(const std::filesystem::path& path, TileInfo& info) const {
    try {
        json header = parse_without(path, {"CityObjects", "vertices", "appearance", "geometry-templates"});
        if (header.value("type", "") != "CityJSON") {
            spdlog::debug("TileCatalog: {} is not CityJSON, skipped", path.filename().string());
            return false;
        }

        info.path = path;
        info.name = path.filename().string();
        info.epsg = CityJsonReader::read_epsg(header);

        auto extent = CityJsonReader::read_extent(header);
        if (!extent) {
            // No declared extent: scan the vertex list instead
            json with_vertices = parse_without(path, {"CityObjects", "appearance", "geometry-templates"});
            extent = CityJsonReader::compute_extent(with_vertices);
        }
        if (!extent) {
            spdlog::warn("TileCatalog: {} has no extent and no vertices, skipped", info.name);
            return false;
        }
        info.extent = *extent;
        return true;

    } catch (const std::exception& e) {
        spdlog::warn("TileCatalog: Failed to read header of {}: {}", path.filename().string(), e.what());
        return false;
    }
}

size_t TileCatalog::scan(const std::filesystem::path& directory) {
    clear();

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        spdlog::error("TileCatalog: {} is not a directory", directory.string());
        return 0;
    }

    std::vector<std::filesystem::path> candidates;
    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        if (entry.is_regular_file() && is_tile_file(entry.path())) {
            candidates.push_back(entry.path());
        }
    }
    std::sort(candidates.begin(), candidates.end());

    for (const auto& path : candidates) {
        TileInfo info;
        if (read_header(path, info)) {
            m_tiles.push_back(std::move(info));
        }
    }

    spdlog::info("TileCatalog: Found {} tiles in {}", m_tiles.size(), directory.string());
    return m_tiles.size();
}

std::vector<const TileInfo*> TileCatalog::tiles_covering(const glm::dvec2& point, double margin) const {
    std::vector<const TileInfo*> result;
    for (const auto& tile : m_tiles) {
        if (tile.covers(point, margin)) {
            result.push_back(&tile);
        }
    }
    return result;
}

std::optional<int> TileCatalog::common_epsg() const {
    std::optional<int> epsg;
    for (const auto& tile : m_tiles) {
        if (!tile.epsg) continue;
        if (epsg && *epsg != *tile.epsg) {
            spdlog::warn("TileCatalog: Tiles disagree on reference system (EPSG:{} vs EPSG:{})",
                         *epsg, *tile.epsg);
            return std::nullopt;
        }
        epsg = tile.epsg;
    }
    return epsg;
}

TileCatalog::BuildingList TileCatalog::load_tile(const TileInfo& tile) {
    {
        std::lock_guard<std::mutex> lock(m_cache_mutex);
        auto it = m_cache.find(tile.name);
        if (it != m_cache.end()) {
            return it->second;
        }
    }

    CityJsonReader reader;
    reader.set_config(m_reader_config);
    BuildingList buildings;
    if (reader.read(tile.path)) {
        buildings = std::make_shared<const std::vector<CityBuilding>>(reader.take_buildings());
    } else {
        buildings = std::make_shared<const std::vector<CityBuilding>>();
    }

    std::lock_guard<std::mutex> lock(m_cache_mutex);
    if (buildings->empty() && !reader.get_error().empty()) {
        m_failed++;
    }
    // Another worker may have read the same tile meanwhile; keep the first
    auto inserted = m_cache.emplace(tile.name, buildings);
    return inserted.first->second;
}

std::vector<CityBuilding> TileCatalog::load(const std::vector<const TileInfo*>& tiles) {
    size_t workers = m_max_parallel_loads;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    workers = std::max<size_t>(1, std::min(workers, tiles.size()));

    // Workers pull tile indexes; each slot is written by exactly one worker
    std::vector<BuildingList> lists(tiles.size());
    std::atomic<size_t> next{0};
    auto worker = [this, &tiles, &lists, &next]() {
        for (size_t i = next++; i < tiles.size(); i = next++) {
            lists[i] = load_tile(*tiles[i]);
        }
    };

    if (workers == 1) {
        worker();
    } else {
        std::vector<std::future<void>> pending;
        pending.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            pending.push_back(std::async(std::launch::async, worker));
        }
        for (auto& future : pending) {
            future.get();
        }
    }

    size_t count = 0;
    for (const auto& list : lists) count += list->size();

    std::vector<CityBuilding> result;
    result.reserve(count);
    for (const auto& list : lists) {
        result.insert(result.end(), list->begin(), list->end());
    }

    spdlog::info("TileCatalog: Loaded {} buildings from {} tiles ({} reader(s))",
                 result.size(), tiles.size(), workers);
    return result;
}

std::vector<CityBuilding> TileCatalog::load_all() {
    std::vector<const TileInfo*> all;
    all.reserve(m_tiles.size());
    for (const auto& tile : m_tiles) {
        all.push_back(&tile);
    }
    return load(all);
}

} // namespace cityfuse::cityjson
