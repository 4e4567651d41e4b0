#pragma once

#include "cityjson/types.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace cityfuse::mesh {

/// Material class of a face, the semantic role of its source surface
using MaterialClass = cityjson::SurfaceRole;

/**
 * @brief Fixed look of a material class
 */
struct Material {
    MaterialClass material_class = MaterialClass::Wall;
    std::string name;                   ///< "roof", "wall", "ground"
    glm::vec4 color{1.0f};              ///< Linear RGBA base color
};

/**
 * @brief Consecutive faces sharing one material
 */
struct FaceRange {
    Material material;
    uint32_t first_face = 0;
    uint32_t face_count = 0;
};

struct BoundingBox3D {
    glm::dvec3 min{std::numeric_limits<double>::max()};
    glm::dvec3 max{std::numeric_limits<double>::lowest()};

    void expand(const glm::dvec3& point) {
        min = glm::min(min, point);
        max = glm::max(max, point);
    }

    glm::dvec3 center() const { return (min + max) * 0.5; }

    bool is_valid() const { return min.x <= max.x; }
};

/**
 * @brief Triangle mesh of one merged record
 *
 * Vertices are welded and stored relative to origin (projected meters,
 * Z up). Faces are grouped by material; ranges cover every face exactly
 * once, in order. Built once, exported, then discarded.
 */
class Mesh {
public:
    std::string identifier;             ///< OSM identifier of the record ("node/123")
    int epsg = 0;                       ///< Reference system of origin
    glm::dvec3 origin{0.0};             ///< Offset to add to every vertex

    std::vector<glm::dvec3> vertices;
    std::vector<uint32_t> indices;      ///< 3 per face
    std::vector<FaceRange> ranges;
    BoundingBox3D bounds;               ///< Of vertices (relative to origin)

    size_t surface_count = 0;           ///< Source surfaces that produced faces

    void clear() {
        vertices.clear();
        indices.clear();
        ranges.clear();
        bounds = BoundingBox3D{};
        surface_count = 0;
    }

    [[nodiscard]] bool is_valid() const {
        return !vertices.empty() && !indices.empty();
    }

    [[nodiscard]] size_t face_count() const { return indices.size() / 3; }

    void compute_bounds() {
        bounds = BoundingBox3D{};
        for (const auto& v : vertices) {
            bounds.expand(v);
        }
    }

    /**
     * @brief Unnormalized face normal (length = 2 * area)
     */
    [[nodiscard]] glm::dvec3 face_normal(size_t face) const {
        const glm::dvec3& a = vertices[indices[face * 3]];
        const glm::dvec3& b = vertices[indices[face * 3 + 1]];
        const glm::dvec3& c = vertices[indices[face * 3 + 2]];
        return glm::cross(b - a, c - a);
    }

    [[nodiscard]] double face_area(size_t face) const {
        return 0.5 * glm::length(face_normal(face));
    }

    /**
     * @brief Signed volume enclosed by the faces (positive for outward winding)
     */
    [[nodiscard]] double signed_volume() const {
        double volume = 0.0;
        for (size_t f = 0; f < face_count(); ++f) {
            const glm::dvec3& a = vertices[indices[f * 3]];
            const glm::dvec3& b = vertices[indices[f * 3 + 1]];
            const glm::dvec3& c = vertices[indices[f * 3 + 2]];
            volume += glm::dot(a, glm::cross(b, c));
        }
        return volume / 6.0;
    }
};

} // namespace cityfuse::mesh
