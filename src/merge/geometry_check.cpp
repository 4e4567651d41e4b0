#include "merge/geometry_check.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <map>
#include <utility>

namespace cityfuse::merge {

namespace {

using GridKey = std::array<int64_t, 3>;

GridKey grid_key(const glm::dvec3& p, double tolerance) {
    return {static_cast<int64_t>(std::llround(p.x / tolerance)),
            static_cast<int64_t>(std::llround(p.y / tolerance)),
            static_cast<int64_t>(std::llround(p.z / tolerance))};
}

bool same_point(const glm::dvec3& a, const glm::dvec3& b, double tolerance) {
    return glm::length(a - b) <= tolerance;
}

void close_ring(std::vector<glm::dvec3>& ring, double tolerance) {
    if (ring.size() < 2) return;
    if (same_point(ring.front(), ring.back(), tolerance)) {
        ring.back() = ring.front();
    } else {
        ring.push_back(ring.front());
    }
}

} // namespace

glm::dvec3 newell_normal(const std::vector<glm::dvec3>& ring) {
    glm::dvec3 normal(0.0);
    const size_t n = ring.size();
    if (n < 3) return normal;

    // Relative to the first vertex, projected coordinates are large
    const glm::dvec3 ref = ring[0];
    for (size_t i = 0; i < n; ++i) {
        const glm::dvec3 a = ring[i] - ref;
        const glm::dvec3 b = ring[(i + 1) % n] - ref;
        normal.x += (a.y - b.y) * (a.z + b.z);
        normal.y += (a.z - b.z) * (a.x + b.x);
        normal.z += (a.x - b.x) * (a.y + b.y);
    }
    return normal;
}

double planarity_deviation(const std::vector<glm::dvec3>& ring) {
    const glm::dvec3 normal = newell_normal(ring);
    const double length = glm::length(normal);
    if (length < 1e-12) return 0.0;
    const glm::dvec3 unit = normal / length;

    glm::dvec3 center(0.0);
    for (const auto& p : ring) center += p - ring[0];
    center = ring[0] + center / static_cast<double>(ring.size());

    double deviation = 0.0;
    for (const auto& p : ring) {
        deviation = std::max(deviation, std::abs(glm::dot(p - center, unit)));
    }
    return deviation;
}

size_t distinct_points(const std::vector<glm::dvec3>& ring, double tolerance) {
    if (ring.empty()) return 0;
    size_t count = 1;
    for (size_t i = 1; i < ring.size(); ++i) {
        if (!same_point(ring[i], ring[i - 1], tolerance)) count++;
    }
    // The closing point repeats the first one
    if (count > 1 && same_point(ring.front(), ring.back(), tolerance)) count--;
    return count;
}

void close_rings(cityjson::CityBuilding& building, double tolerance) {
    for (auto& solid : building.solids) {
        for (auto& surface : solid.surfaces) {
            close_ring(surface.outer, tolerance);
            for (auto& hole : surface.holes) {
                close_ring(hole, tolerance);
            }
        }
    }
}

size_t open_edge_count(const cityjson::Solid& solid, double tolerance) {
    std::map<std::pair<GridKey, GridKey>, int> edges;

    auto add_ring = [&](const std::vector<glm::dvec3>& ring) {
        // Rings are closed: the last point equals the first
        for (size_t i = 0; i + 1 < ring.size(); ++i) {
            GridKey a = grid_key(ring[i], tolerance);
            GridKey b = grid_key(ring[i + 1], tolerance);
            if (a == b) continue;
            if (b < a) std::swap(a, b);
            edges[{a, b}]++;
        }
    };

    for (const auto& surface : solid.surfaces) {
        add_ring(surface.outer);
        for (const auto& hole : surface.holes) add_ring(hole);
    }

    size_t open = 0;
    for (const auto& [edge, uses] : edges) {
        if (uses == 1) open++;
    }
    return open;
}

std::vector<GeometryIssue> check_building(const cityjson::CityBuilding& building,
                                          double planarity_tolerance,
                                          double closure_tolerance) {
    std::vector<GeometryIssue> issues;

    for (size_t s = 0; s < building.solids.size(); ++s) {
        const auto& solid = building.solids[s];

        for (size_t f = 0; f < solid.surfaces.size(); ++f) {
            const auto& surface = solid.surfaces[f];

            const size_t points = distinct_points(surface.outer, closure_tolerance);
            if (points < 3) {
                issues.push_back({GeometryIssue::Kind::TooFewPoints, building.id, s, f,
                                  static_cast<double>(points)});
                continue;
            }

            const double deviation = planarity_deviation(surface.outer);
            if (deviation > planarity_tolerance) {
                issues.push_back({GeometryIssue::Kind::NonPlanar, building.id, s, f, deviation});
            }
        }

        // Grid cells of 1 mm tolerate the rounding of CityJSON integer vertices
        const size_t open = open_edge_count(solid, std::max(closure_tolerance, 1e-3));
        if (open > 0) {
            issues.push_back({GeometryIssue::Kind::OpenShell, building.id, s, 0,
                              static_cast<double>(open)});
        }
    }
    return issues;
}

} // namespace cityfuse::merge
