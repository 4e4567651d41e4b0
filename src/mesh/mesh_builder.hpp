#pragma once

#include "cityjson/types.hpp"
#include "merge/merged_record.hpp"
#include "mesh/mesh.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace cityfuse::mesh {

/**
 * @brief Mesh building options
 */
struct MeshConfig {
    double weld_tolerance_m = 1e-3;         ///< Vertices closer than this are merged
    double min_triangle_area_m2 = 1e-6;     ///< Smaller triangles are dropped
    bool rebase_to_origin = true;           ///< Store vertices relative to their centroid

    glm::vec4 roof_color{0.70f, 0.25f, 0.20f, 1.0f};
    glm::vec4 wall_color{0.85f, 0.82f, 0.75f, 1.0f};
    glm::vec4 ground_color{0.45f, 0.45f, 0.45f, 1.0f};

    [[nodiscard]] Material material(MaterialClass material_class) const;
};

class MeshBuilder {
public:
    MeshBuilder() = default;

    /**
     * @brief Triangulate every surface of a merged record
     *
     * Triangles follow their ring's orientation, then each solid is
     * turned outward: closed, consistently oriented solids by the sign
     * of their volume, anything else surface by surface.
     *
     * @throws PipelineError (DegenerateSolid) when no face survives
     */
    static Mesh build(const merge::MergedRecord& record, const MeshConfig& config = MeshConfig{});

    /**
     * @brief Triangulate one planar surface
     * @param outer Outer ring (open or closed)
     * @param holes Inner rings (open or closed)
     * @return Index triples into outer followed by the holes (open rings),
     *         oriented like the outer ring
     */
    static std::vector<uint32_t> triangulate(const std::vector<glm::dvec3>& outer,
                                             const std::vector<std::vector<glm::dvec3>>& holes);
};

} // namespace cityfuse::mesh
