/**
 * @file reader.hpp
 * @brief CityJSON tile reader
 * @author cityfuse Team
 * @version 0.1.0
 * @date 2026
 *
 * This file provides the CityJsonReader class for loading Building and
 * BuildingPart objects from CityJSON documents (versions 1.0, 1.1, 2.0).
 *
 * Supported geometry types:
 *   - MultiSurface, CompositeSurface
 *   - Solid (exterior shell)
 *   - MultiSolid, CompositeSolid
 */

#pragma once

#include "cityjson/types.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cityfuse::cityjson {

/// Geographical extent as [minx, miny, minz, maxx, maxy, maxz]
using Extent = std::array<double, 6>;

/**
 * @brief Configuration options for CityJSON reading
 */
struct ReaderConfig {
    std::string lod_prefix = "2";           ///< Keep geometries whose lod starts with this
    bool fold_building_parts = true;        ///< Append BuildingPart solids to their parent
};

/**
 * @brief Reader for CityJSON building tiles
 *
 * Usage:
 * @code
 * cityfuse::cityjson::CityJsonReader reader;
 * if (reader.read("gebaeude_lod2_456_5428.json")) {
 *     auto buildings = reader.take_buildings();
 * }
 * @endcode
 */
class CityJsonReader {
public:
    CityJsonReader() = default;

    /**
     * @brief Set reader configuration
     */
    void set_config(const ReaderConfig& config) { m_config = config; }

    /**
     * @brief Read a CityJSON file
     * @param filepath Path to the tile
     * @return true on success, false on failure (see get_error())
     */
    bool read(const std::filesystem::path& filepath);

    /**
     * @brief Read an already parsed CityJSON document
     * @param document Parsed JSON
     * @param tile_name Name recorded as the buildings' source tile
     * @return true on success, false on failure (see get_error())
     */
    bool read_document(const nlohmann::json& document, const std::string& tile_name);

    /**
     * @brief Get last error message
     */
    [[nodiscard]] const std::string& get_error() const { return m_error; }

    /**
     * @brief Reference system declared in the document metadata
     */
    [[nodiscard]] std::optional<int> epsg() const { return m_epsg; }

    /**
     * @brief Get loaded buildings (const reference)
     */
    [[nodiscard]] const std::vector<CityBuilding>& get_buildings() const { return m_buildings; }

    /**
     * @brief Take loaded buildings (move semantics)
     */
    std::vector<CityBuilding> take_buildings();

    /**
     * @brief Number of Building objects without any geometry of the selected LOD
     */
    [[nodiscard]] size_t buildings_without_lod() const { return m_without_lod; }

    /**
     * @brief Read metadata.geographicalExtent
     */
    [[nodiscard]] static std::optional<Extent> read_extent(const nlohmann::json& document);

    /**
     * @brief Read the EPSG code from metadata.referenceSystem
     */
    [[nodiscard]] static std::optional<int> read_epsg(const nlohmann::json& document);

    /**
     * @brief Compute the extent of the transformed vertex list
     */
    [[nodiscard]] static std::optional<Extent> compute_extent(const nlohmann::json& document);

private:
    void clear();
    void read_geometry(const nlohmann::json& geometry, std::vector<Solid>& solids) const;
    [[nodiscard]] bool lod_selected(const nlohmann::json& geometry) const;
    [[nodiscard]] glm::dvec3 vertex(size_t index) const;
    [[nodiscard]] Surface read_surface(const nlohmann::json& rings,
                                       const nlohmann::json& semantic_value,
                                       const nlohmann::json& semantic_surfaces) const;

    ReaderConfig m_config;
    std::vector<CityBuilding> m_buildings;
    std::vector<glm::dvec3> m_vertices;
    std::optional<int> m_epsg;
    size_t m_without_lod = 0;
    std::string m_error;
};

} // namespace cityfuse::cityjson
