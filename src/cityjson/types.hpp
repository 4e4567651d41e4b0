/**
 * @file types.hpp
 * @brief CityJSON building data types for cityfuse
 * @author cityfuse Team
 * @version 0.1.0
 * @date 2026
 *
 * Buildings loaded from a tiled CityJSON cadastral export. Coordinates are
 * real-world projected meters (the CityJSON transform already applied);
 * rings are stored open, as CityJSON writes them.
 */

#pragma once

#include <glm/glm.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cityfuse::cityjson {

/**
 * @brief Semantic role of a building surface
 */
enum class SurfaceRole {
    Roof,       ///< RoofSurface
    Wall,       ///< WallSurface and every other vertical or unknown surface
    Ground      ///< GroundSurface, OuterFloorSurface
};

/**
 * @brief One planar boundary surface of a solid
 */
struct Surface {
    SurfaceRole role = SurfaceRole::Wall;           ///< Material class
    std::string semantic_type;                      ///< CityJSON semantic type, empty if none
    std::vector<glm::dvec3> outer;                  ///< Outer ring (open)
    std::vector<std::vector<glm::dvec3>> holes;     ///< Inner rings (open)
};

/**
 * @brief A set of surfaces bounding one volume
 */
struct Solid {
    std::string lod;                    ///< Level of detail, e.g. "2" or "2.2"
    std::vector<Surface> surfaces;      ///< Exterior shell surfaces
};

/**
 * @brief A building from one CityJSON tile
 */
struct CityBuilding {
    std::string id;                         ///< CityObject identifier
    std::string tile;                       ///< Source tile file name
    std::optional<int> epsg;                ///< Reference system of the tile
    nlohmann::json attributes = nlohmann::json::object(); ///< Verbatim attributes
    std::vector<Solid> solids;              ///< LOD2 solids (parts folded in)

    /**
     * @brief Total number of surfaces over all solids
     */
    [[nodiscard]] size_t surface_count() const {
        size_t count = 0;
        for (const auto& solid : solids) count += solid.surfaces.size();
        return count;
    }

    /**
     * @brief Total number of ring vertices over all solids
     */
    [[nodiscard]] size_t vertex_count() const {
        size_t count = 0;
        for (const auto& solid : solids) {
            for (const auto& surface : solid.surfaces) {
                count += surface.outer.size();
                for (const auto& hole : surface.holes) count += hole.size();
            }
        }
        return count;
    }
};

/**
 * @brief Map a CityJSON semantic surface type to its material class
 */
[[nodiscard]] inline SurfaceRole classify_surface(const std::string& semantic_type) {
    if (semantic_type == "RoofSurface") return SurfaceRole::Roof;
    if (semantic_type == "GroundSurface" || semantic_type == "OuterFloorSurface") return SurfaceRole::Ground;
    return SurfaceRole::Wall;
}

/**
 * @brief Convert SurfaceRole to a human-readable string
 */
[[nodiscard]] inline const char* surface_role_name(SurfaceRole role) {
    switch (role) {
        case SurfaceRole::Roof:   return "roof";
        case SurfaceRole::Wall:   return "wall";
        case SurfaceRole::Ground: return "ground";
    }
    return "wall";
}

/**
 * @brief Parse a material class name written by surface_role_name()
 */
[[nodiscard]] inline SurfaceRole parse_surface_role(const std::string& name) {
    if (name == "roof") return SurfaceRole::Roof;
    if (name == "ground") return SurfaceRole::Ground;
    return SurfaceRole::Wall;
}

} // namespace cityfuse::cityjson
