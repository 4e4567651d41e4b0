#pragma once

#include "cityjson/reader.hpp"
#include "cityjson/types.hpp"
#include <glm/glm.hpp>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cityfuse::cityjson {

/**
 * @brief Header information of one CityJSON tile on disk
 */
struct TileInfo {
    std::filesystem::path path;
    std::string name;                   ///< File name, recorded on every building
    Extent extent{};                    ///< [minx, miny, minz, maxx, maxy, maxz]
    std::optional<int> epsg;

    /**
     * @brief Check whether the tile's XY extent, grown by margin, covers a point
     */
    [[nodiscard]] bool covers(const glm::dvec2& point, double margin) const {
        return point.x >= extent[0] - margin && point.x <= extent[3] + margin &&
               point.y >= extent[1] - margin && point.y <= extent[4] + margin;
    }
};

/**
 * @brief Catalog of the tiles of a tiled CityJSON export
 *
 * Tiles are scanned once for their extent and reference system. Building
 * data is only read for the tiles a run actually needs, and every tile is
 * read at most once per catalog.
 */
class TileCatalog {
public:
    TileCatalog() = default;

    void set_reader_config(const ReaderConfig& config) { m_reader_config = config; }

    /// Upper bound on tiles read at once, 0 for the hardware concurrency
    void set_max_parallel_loads(size_t count) { m_max_parallel_loads = count; }

    /**
     * @brief Scan a directory for *.json / *.city.json tiles
     * @return Number of tiles found
     */
    size_t scan(const std::filesystem::path& directory);

    /**
     * @brief Clear all tiles and cached buildings
     */
    void clear();

    [[nodiscard]] const std::vector<TileInfo>& tiles() const { return m_tiles; }
    [[nodiscard]] size_t tile_count() const { return m_tiles.size(); }

    /**
     * @brief Tiles whose extent (grown by margin) covers a projected point
     */
    [[nodiscard]] std::vector<const TileInfo*> tiles_covering(const glm::dvec2& point,
                                                              double margin) const;

    /**
     * @brief Reference system shared by every tile
     * @return EPSG code, or nullopt when tiles disagree or none declares one
     */
    [[nodiscard]] std::optional<int> common_epsg() const;

    /**
     * @brief Drop the cached buildings, keeping the scanned tiles
     */
    void release_cache();

    [[nodiscard]] size_t cached_tiles() const;

    /**
     * @brief Load the buildings of the given tiles (parallel, cached)
     *
     * Tiles that fail to read are logged and contribute nothing.
     */
    std::vector<CityBuilding> load(const std::vector<const TileInfo*>& tiles);

    /**
     * @brief Load every tile in the catalog
     */
    std::vector<CityBuilding> load_all();

    /**
     * @brief Number of tiles that failed to read
     */
    [[nodiscard]] size_t failed_tiles() const { return m_failed; }

private:
    using BuildingList = std::shared_ptr<const std::vector<CityBuilding>>;

    bool read_header(const std::filesystem::path& path, TileInfo& info) const;
    BuildingList load_tile(const TileInfo& tile);

    ReaderConfig m_reader_config;
    std::vector<TileInfo> m_tiles;

    size_t m_max_parallel_loads = 0;

    std::unordered_map<std::string, BuildingList> m_cache;
    mutable std::mutex m_cache_mutex;
    size_t m_failed = 0;
};

} // namespace cityfuse::cityjson
