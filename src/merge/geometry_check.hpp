#pragma once

#include "cityjson/types.hpp"
#include "merge/merged_record.hpp"
#include <glm/glm.hpp>
#include <vector>

namespace cityfuse::merge {

/**
 * @brief Newell normal of a 3D ring (not normalized, length = 2 * area)
 *
 * Works for open and closed rings and for non-convex polygons.
 */
[[nodiscard]] glm::dvec3 newell_normal(const std::vector<glm::dvec3>& ring);

/**
 * @brief Largest distance of a ring vertex from the ring's best-fit plane
 * @return Deviation in meters, 0 for degenerate rings
 */
[[nodiscard]] double planarity_deviation(const std::vector<glm::dvec3>& ring);

/**
 * @brief Number of distinct consecutive points of a ring
 */
[[nodiscard]] size_t distinct_points(const std::vector<glm::dvec3>& ring, double tolerance);

/**
 * @brief Close every ring of a building (append the first point if needed)
 */
void close_rings(cityjson::CityBuilding& building, double tolerance);

/**
 * @brief Count edges of a solid used by only one surface
 *
 * Vertices are compared on a grid of the given tolerance. A solid that
 * encloses a volume has no such edges.
 */
[[nodiscard]] size_t open_edge_count(const cityjson::Solid& solid, double tolerance);

/**
 * @brief Check a building with closed rings for geometry defects
 */
[[nodiscard]] std::vector<GeometryIssue> check_building(const cityjson::CityBuilding& building,
                                                        double planarity_tolerance,
                                                        double closure_tolerance);

} // namespace cityfuse::merge
