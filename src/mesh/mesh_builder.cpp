#include "mesh/mesh_builder.hpp"
#include "core/errors.hpp"
#include "merge/geometry_check.hpp"
#include <mapbox/earcut.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <unordered_map>
#include <utility>

// Earcut adapter for glm::dvec2
namespace mapbox {
namespace util {

template <>
struct nth<0, glm::dvec2> {
    inline static double get(const glm::dvec2& t) { return t.x; }
};

template <>
struct nth<1, glm::dvec2> {
    inline static double get(const glm::dvec2& t) { return t.y; }
};

} // namespace util
} // namespace mapbox

namespace cityfuse::mesh {

namespace {

using GridKey = std::array<int64_t, 3>;

struct GridKeyHash {
    size_t operator()(const GridKey& k) const {
        size_t h = std::hash<int64_t>()(k[0]);
        h ^= std::hash<int64_t>()(k[1]) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= std::hash<int64_t>()(k[2]) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

GridKey grid_key(const glm::dvec3& p, double cell) {
    return {static_cast<int64_t>(std::floor(p.x / cell)),
            static_cast<int64_t>(std::floor(p.y / cell)),
            static_cast<int64_t>(std::floor(p.z / cell))};
}

// Merges vertices closer than the tolerance, searching neighbouring cells
class VertexWelder {
public:
    VertexWelder(double tolerance, std::vector<glm::dvec3>& vertices)
        : m_tolerance(std::max(tolerance, 1e-9))
        , m_vertices(vertices) {}

    uint32_t add(const glm::dvec3& p) {
        const GridKey key = grid_key(p, m_tolerance);
        for (int64_t dx = -1; dx <= 1; ++dx) {
            for (int64_t dy = -1; dy <= 1; ++dy) {
                for (int64_t dz = -1; dz <= 1; ++dz) {
                    auto it = m_cells.find({key[0] + dx, key[1] + dy, key[2] + dz});
                    if (it == m_cells.end()) continue;
                    for (uint32_t index : it->second) {
                        if (glm::length(m_vertices[index] - p) <= m_tolerance) {
                            return index;
                        }
                    }
                }
            }
        }
        const auto index = static_cast<uint32_t>(m_vertices.size());
        m_vertices.push_back(p);
        m_cells[key].push_back(index);
        return index;
    }

private:
    double m_tolerance;
    std::vector<glm::dvec3>& m_vertices;
    std::unordered_map<GridKey, std::vector<uint32_t>, GridKeyHash> m_cells;
};

using Triangle = std::array<uint32_t, 3>;

struct SurfaceTriangles {
    MaterialClass material_class = MaterialClass::Wall;
    std::vector<Triangle> triangles;
    glm::dvec3 normal{0.0};             ///< Newell normal of the outer ring
    glm::dvec3 centroid{0.0};
};

std::vector<glm::dvec3> open_ring(const std::vector<glm::dvec3>& ring) {
    std::vector<glm::dvec3> result = ring;
    if (result.size() > 1 && result.front() == result.back()) {
        result.pop_back();
    }
    return result;
}

// Outer ring first, then every hole with at least 3 points, all open
std::vector<std::vector<glm::dvec3>> open_rings(const std::vector<glm::dvec3>& outer,
                                                const std::vector<std::vector<glm::dvec3>>& holes) {
    std::vector<std::vector<glm::dvec3>> rings;
    rings.push_back(open_ring(outer));
    for (const auto& hole : holes) {
        auto ring = open_ring(hole);
        if (ring.size() >= 3) rings.push_back(std::move(ring));
    }
    return rings;
}

// Closed when every edge is shared by two rings, consistent when the two
// uses run in opposite directions
bool closed_and_consistent(const cityjson::Solid& solid, double tolerance) {
    std::map<std::pair<GridKey, GridKey>, int> directed;
    const double cell = std::max(tolerance, 1e-9);

    for (const auto& surface : solid.surfaces) {
        for (const auto& ring : open_rings(surface.outer, surface.holes)) {
            const size_t n = ring.size();
            for (size_t i = 0; i < n; ++i) {
                GridKey a = grid_key(ring[i], cell);
                GridKey b = grid_key(ring[(i + 1) % n], cell);
                if (a == b) continue;
                directed[{a, b}]++;
            }
        }
    }
    if (directed.empty()) return false;

    for (const auto& [edge, uses] : directed) {
        if (uses != 1) return false;
        auto reverse = directed.find({edge.second, edge.first});
        if (reverse == directed.end() || reverse->second != 1) return false;
    }
    return true;
}

// Surface-by-surface outward test for solids that are open or inconsistent
bool faces_outward(const SurfaceTriangles& surface, const glm::dvec3& solid_centroid) {
    const double length = glm::length(surface.normal);
    if (length <= 0.0) return true;

    // Roofs face up and grounds face down whenever they are not vertical
    const double up = surface.normal.z / length;
    if (surface.material_class == MaterialClass::Roof && std::abs(up) > 0.1) return up > 0.0;
    if (surface.material_class == MaterialClass::Ground && std::abs(up) > 0.1) return up < 0.0;

    return glm::dot(surface.normal, surface.centroid - solid_centroid) >= 0.0;
}

} // namespace

Material MeshConfig::material(MaterialClass material_class) const {
    switch (material_class) {
        case MaterialClass::Roof:   return {material_class, "roof", roof_color};
        case MaterialClass::Ground: return {material_class, "ground", ground_color};
        case MaterialClass::Wall:   return {material_class, "wall", wall_color};
    }
    return {MaterialClass::Wall, "wall", wall_color};
}

std::vector<uint32_t> MeshBuilder::triangulate(const std::vector<glm::dvec3>& outer,
                                               const std::vector<std::vector<glm::dvec3>>& holes) {
    const auto rings = open_rings(outer, holes);
    const auto& ring = rings.front();
    if (ring.size() < 3) return {};

    const glm::dvec3 normal = merge::newell_normal(ring);
    if (glm::length(normal) < 1e-12) return {};

    if (rings.size() == 1 && ring.size() == 3) {
        return {0, 1, 2};
    }

    // Drop the dominant axis of the normal to get a 2D polygon
    const glm::dvec3 a = glm::abs(normal);
    int u = 0;
    int v = 1;
    if (a.x >= a.y && a.x >= a.z) {
        u = 1; v = 2;
    } else if (a.y >= a.x && a.y >= a.z) {
        u = 0; v = 2;
    }

    const glm::dvec3 ref = ring[0];
    std::vector<std::vector<glm::dvec2>> polygon;
    std::vector<glm::dvec3> flat;
    for (const auto& r : rings) {
        std::vector<glm::dvec2> projected;
        projected.reserve(r.size());
        for (const auto& p : r) {
            const glm::dvec3 local = p - ref;
            projected.emplace_back(local[u], local[v]);
            flat.push_back(p);
        }
        polygon.push_back(std::move(projected));
    }

    std::vector<uint32_t> indices = mapbox::earcut<uint32_t>(polygon);

    // Earcut picks its own orientation; follow the ring's instead
    for (size_t i = 0; i + 2 < indices.size(); i += 3) {
        const glm::dvec3& p0 = flat[indices[i]];
        const glm::dvec3& p1 = flat[indices[i + 1]];
        const glm::dvec3& p2 = flat[indices[i + 2]];
        if (glm::dot(glm::cross(p1 - p0, p2 - p0), normal) < 0.0) {
            std::swap(indices[i + 1], indices[i + 2]);
        }
    }
    return indices;
}

Mesh MeshBuilder::build(const merge::MergedRecord& record, const MeshConfig& config) {
    Mesh mesh;
    mesh.identifier = record.osm_identifier;
    mesh.epsg = record.epsg;

    size_t input_surfaces = 0;
    if (config.rebase_to_origin) {
        glm::dvec3 sum(0.0);
        size_t count = 0;
        for (const auto& building : record.buildings) {
            for (const auto& solid : building.solids) {
                for (const auto& surface : solid.surfaces) {
                    for (const auto& p : open_ring(surface.outer)) {
                        sum += p;
                        count++;
                    }
                }
            }
        }
        if (count > 0) mesh.origin = sum / static_cast<double>(count);
    }

    std::vector<glm::dvec3> welded;
    VertexWelder welder(config.weld_tolerance_m, welded);
    std::array<std::vector<Triangle>, 3> by_class;
    auto class_slot = [](MaterialClass c) {
        switch (c) {
            case MaterialClass::Roof:   return 0;
            case MaterialClass::Wall:   return 1;
            case MaterialClass::Ground: return 2;
        }
        return 1;
    };

    for (const auto& building : record.buildings) {
        for (const auto& solid : building.solids) {
            std::vector<SurfaceTriangles> surfaces;
            surfaces.reserve(solid.surfaces.size());

            glm::dvec3 solid_centroid(0.0);
            size_t solid_points = 0;

            for (const auto& surface : solid.surfaces) {
                input_surfaces++;

                // Work relative to the origin, projected coordinates are large
                std::vector<glm::dvec3> outer;
                for (const auto& p : surface.outer) outer.push_back(p - mesh.origin);
                std::vector<std::vector<glm::dvec3>> holes;
                for (const auto& hole : surface.holes) {
                    holes.emplace_back();
                    for (const auto& p : hole) holes.back().push_back(p - mesh.origin);
                }

                const auto rings = open_rings(outer, holes);
                std::vector<glm::dvec3> flat;
                for (const auto& r : rings) flat.insert(flat.end(), r.begin(), r.end());

                SurfaceTriangles result;
                result.material_class = surface.role;
                result.normal = merge::newell_normal(rings.front());
                for (const auto& p : rings.front()) {
                    result.centroid += p;
                    solid_centroid += p;
                    solid_points++;
                }
                if (!rings.front().empty()) {
                    result.centroid /= static_cast<double>(rings.front().size());
                }

                const auto indices = triangulate(outer, holes);
                for (size_t i = 0; i + 2 < indices.size(); i += 3) {
                    const glm::dvec3& p0 = flat[indices[i]];
                    const glm::dvec3& p1 = flat[indices[i + 1]];
                    const glm::dvec3& p2 = flat[indices[i + 2]];
                    if (0.5 * glm::length(glm::cross(p1 - p0, p2 - p0)) < config.min_triangle_area_m2) {
                        continue;
                    }

                    Triangle t = {welder.add(p0), welder.add(p1), welder.add(p2)};
                    if (t[0] == t[1] || t[1] == t[2] || t[0] == t[2]) continue;

                    // Welding may have collapsed a sliver
                    const glm::dvec3 n = glm::cross(welded[t[1]] - welded[t[0]], welded[t[2]] - welded[t[0]]);
                    if (0.5 * glm::length(n) < config.min_triangle_area_m2) continue;

                    result.triangles.push_back(t);
                }

                if (!result.triangles.empty()) {
                    surfaces.push_back(std::move(result));
                }
            }

            if (surfaces.empty()) continue;
            if (solid_points > 0) solid_centroid /= static_cast<double>(solid_points);

            if (closed_and_consistent(solid, config.weld_tolerance_m)) {
                double volume = 0.0;
                for (const auto& surface : surfaces) {
                    for (const auto& t : surface.triangles) {
                        volume += glm::dot(welded[t[0]], glm::cross(welded[t[1]], welded[t[2]]));
                    }
                }
                if (volume < 0.0) {
                    for (auto& surface : surfaces) {
                        for (auto& t : surface.triangles) std::swap(t[1], t[2]);
                    }
                }
            } else {
                for (auto& surface : surfaces) {
                    if (!faces_outward(surface, solid_centroid)) {
                        for (auto& t : surface.triangles) std::swap(t[1], t[2]);
                    }
                }
            }

            for (auto& surface : surfaces) {
                auto& target = by_class[class_slot(surface.material_class)];
                target.insert(target.end(), surface.triangles.begin(), surface.triangles.end());
                mesh.surface_count++;
            }
        }
    }

    // Compact: keep referenced vertices in first-use order
    std::vector<int64_t> remap(welded.size(), -1);
    const MaterialClass order[3] = {MaterialClass::Roof, MaterialClass::Wall, MaterialClass::Ground};
    for (int slot = 0; slot < 3; ++slot) {
        if (by_class[slot].empty()) continue;

        FaceRange range;
        range.material = config.material(order[slot]);
        range.first_face = static_cast<uint32_t>(mesh.face_count());
        range.face_count = static_cast<uint32_t>(by_class[slot].size());

        for (const auto& t : by_class[slot]) {
            for (uint32_t index : t) {
                if (remap[index] < 0) {
                    remap[index] = static_cast<int64_t>(mesh.vertices.size());
                    mesh.vertices.push_back(welded[index]);
                }
                mesh.indices.push_back(static_cast<uint32_t>(remap[index]));
            }
        }
        mesh.ranges.push_back(std::move(range));
    }

    if (mesh.face_count() == 0) {
        throw PipelineError(FailureKind::DegenerateSolid,
                            record.osm_identifier + ": " + std::to_string(input_surfaces) +
                            " surfaces, no face survived triangulation");
    }

    mesh.compute_bounds();

    spdlog::debug("MeshBuilder: {} -> {} vertices, {} faces from {} of {} surfaces",
                  mesh.identifier, mesh.vertices.size(), mesh.face_count(),
                  mesh.surface_count, input_surfaces);
    return mesh;
}

} // namespace cityfuse::mesh
