/**
 * @file geometry_index.hpp
 * @brief Spatial index over CityJSON building footprints
 * @author cityfuse Team
 * @version 0.1.0
 * @date 2026
 *
 * Buildings are indexed by the bounding box of their 2D footprint in the
 * projected reference system of the CityJSON export. The index is built
 * once per run and is read-only afterwards, so concurrent queries from
 * several workers need no locking.
 */

#pragma once

#include "cityjson/types.hpp"
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/index/rtree.hpp>
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cityfuse::index {

namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

using Point2D = bg::model::point<double, 2, bg::cs::cartesian>;
using Box2D = bg::model::box<Point2D>;
using Polygon2D = bg::model::polygon<Point2D>;          ///< Clockwise, closed
using Footprint = bg::model::multi_polygon<Polygon2D>;

/**
 * @brief One building as held by the index
 */
struct IndexedBuilding {
    cityjson::CityBuilding building;
    Footprint footprint;
    Box2D bounds;
    double area = 0.0;                  ///< Footprint area in m^2
};

/**
 * @brief A building near a query point
 */
struct IndexHit {
    std::string building_id;
    double distance = 0.0;              ///< Point to nearest footprint edge, 0 when contained
    bool contains = false;              ///< Point strictly inside the footprint
    double area = 0.0;                  ///< Footprint area in m^2
};

/**
 * @brief R-tree over building footprints
 *
 * Usage:
 * @code
 * GeometryIndex index;
 * index.build(catalog.load_all());
 * auto ids = index.query({456123.0, 5428456.0}, 25.0);
 * @endcode
 */
class GeometryIndex {
public:
    GeometryIndex() = default;

    /**
     * @brief Build the index
     *
     * Buildings present in several tiles are kept once: the instance with
     * the most surfaces (then the most vertices) wins. Buildings without
     * any footprint are logged and left out.
     *
     * @throws IndexError (IndexEmpty) when no building can be indexed
     */
    void build(std::vector<cityjson::CityBuilding> buildings);

    /**
     * @brief Building identifiers within radius, by ascending distance
     * @throws IndexError (NotBuilt) before build()
     */
    [[nodiscard]] std::vector<std::string> query(const glm::dvec2& point, double radius) const;

    /**
     * @brief Same as query(), with distance, containment and area per hit
     * @throws IndexError (NotBuilt) before build()
     */
    [[nodiscard]] std::vector<IndexHit> query_hits(const glm::dvec2& point, double radius) const;

    /**
     * @brief Look up an indexed building
     * @return nullptr when the identifier is unknown
     */
    [[nodiscard]] const IndexedBuilding* find(const std::string& id) const;

    [[nodiscard]] bool is_built() const { return m_built; }
    [[nodiscard]] size_t size() const { return m_entries.size(); }

    /**
     * @brief Duplicate instances dropped during build()
     */
    [[nodiscard]] size_t duplicates_dropped() const { return m_duplicates; }

    /**
     * @brief Buildings left out of the index for lack of a footprint
     */
    [[nodiscard]] size_t without_footprint() const { return m_without_footprint; }

    /**
     * @brief Reference system shared by every indexed building
     * @return EPSG code, or nullopt when missing or inconsistent
     */
    [[nodiscard]] std::optional<int> epsg() const { return m_epsg; }

    /**
     * @brief Compute the 2D footprint of a building
     *
     * Union of its ground surface rings projected to XY; when it has no
     * ground surface, the convex hull of all its vertices.
     */
    [[nodiscard]] static std::optional<Footprint> compute_footprint(const cityjson::CityBuilding& building);

private:
    using Value = std::pair<Box2D, size_t>;

    std::vector<IndexedBuilding> m_entries;
    std::unordered_map<std::string, size_t> m_by_id;
    bgi::rtree<Value, bgi::quadratic<16>> m_rtree;

    std::optional<int> m_epsg;
    size_t m_duplicates = 0;
    size_t m_without_footprint = 0;
    bool m_built = false;
};

} // namespace cityfuse::index
