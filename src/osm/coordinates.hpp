/**
 * @file coordinates.hpp
 * @brief Coordinate conversion utilities for OSM and CityJSON data
 * @author cityfuse Team
 * @version 0.1.0
 * @date 2026
 *
 * This file provides conversion from WGS84 (lat/lon) into the planar
 * reference systems used by cadastral CityJSON exports (UTM zones on the
 * ETRS89 or WGS84 datum, and Web Mercator), plus the 2D polygon helpers
 * used for footprint matching.
 */

#pragma once

#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cityfuse::osm {

// ============================================================================
// Constants
// ============================================================================

/// WGS84 Earth radius (semi-major axis) in meters
constexpr double EARTH_RADIUS_M = 6378137.0;

/// WGS84 inverse flattening
constexpr double WGS84_INV_FLATTENING = 298.257223563;

/// GRS80 inverse flattening (ETRS89 datum)
constexpr double GRS80_INV_FLATTENING = 298.257222101;

/// Degrees to radians conversion factor
constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;

/// Radians to degrees conversion factor
constexpr double RAD_TO_DEG = 180.0 / 3.14159265358979323846;

/// EPSG code of WGS84 geographic coordinates (OSM input)
constexpr int EPSG_WGS84 = 4326;

/// EPSG code of Web Mercator / Pseudo-Mercator
constexpr int EPSG_WEB_MERCATOR = 3857;

// ============================================================================
// Projection Description
// ============================================================================

/**
 * @brief Parameters of a supported planar reference system
 */
struct Projection {
    /// Projection family
    enum class Kind {
        WebMercator,            ///< EPSG:3857 spherical Mercator
        TransverseMercator      ///< UTM zones (ETRS89 / WGS84)
    };

    int epsg = 0;                       ///< EPSG code
    Kind kind = Kind::TransverseMercator;
    double semi_major_axis = EARTH_RADIUS_M;
    double inverse_flattening = WGS84_INV_FLATTENING;
    double central_meridian = 0.0;      ///< Degrees
    double scale_factor = 0.9996;       ///< k0 on the central meridian
    double false_easting = 500000.0;    ///< Meters
    double false_northing = 0.0;        ///< Meters (10 000 km in the south)
};

/**
 * @brief Look up the projection parameters for an EPSG code
 * @param epsg EPSG code (25828-25838, 32601-32660, 32701-32760, 3857)
 * @return Parameters, or nullopt when the code is not supported
 */
[[nodiscard]] std::optional<Projection> projection_for_epsg(int epsg);

/**
 * @brief Extract the EPSG code from a CityJSON reference system string
 *
 * Accepts "urn:ogc:def:crs:EPSG::25832", "urn:ogc:def:crs:EPSG:6.18:3:25832",
 * "https://www.opengis.net/def/crs/EPSG/0/25832" and "EPSG:25832".
 *
 * @return EPSG code, or nullopt when none can be read
 */
[[nodiscard]] std::optional<int> parse_epsg(const std::string& reference_system);

// ============================================================================
// Coordinate Converter
// ============================================================================

/**
 * @brief Converts between WGS84 and a planar reference system
 *
 * Coordinate flow:
 * @code
 * WGS84 (lat, lon) -> projected (easting, northing in meters)
 * @endcode
 *
 * Usage:
 * @code
 * CoordinateConverter converter;
 * if (converter.set_projection(25832)) {
 *     glm::dvec2 en = converter.wgs84_to_projected(49.014, 8.404);
 * }
 * @endcode
 */
class CoordinateConverter {
public:
    CoordinateConverter() = default;

    /**
     * @brief Select the target reference system
     * @param epsg EPSG code of the planar system
     * @return false when the code is not supported (converter unchanged)
     */
    bool set_projection(int epsg);

    /**
     * @brief EPSG code of the selected projection, 0 when none
     */
    [[nodiscard]] int epsg() const { return m_projection ? m_projection->epsg : 0; }

    /**
     * @brief Convert WGS84 to the selected projection
     * @param lat Latitude in degrees
     * @param lon Longitude in degrees
     * @return (easting, northing) in meters
     *
     * @pre set_projection() must have succeeded
     */
    [[nodiscard]] glm::dvec2 wgs84_to_projected(double lat, double lon) const;

    /**
     * @brief Convert projected coordinates back to WGS84
     * @return WGS84 coordinates as (latitude, longitude) in degrees
     */
    [[nodiscard]] glm::dvec2 projected_to_wgs84(double x, double y) const;

    /**
     * @brief Convert WGS84 coordinates to Web Mercator projection
     * @param lat Latitude in degrees (-85.051 to 85.051)
     * @param lon Longitude in degrees (-180 to 180)
     * @return Web Mercator coordinates in meters (x = easting, y = northing)
     *
     * Uses EPSG:3857 (Web Mercator / Pseudo-Mercator) projection.
     * Note: This projection is not suitable for areas near poles.
     */
    [[nodiscard]] static glm::dvec2 wgs84_to_mercator(double lat, double lon);

    /**
     * @brief Convert Web Mercator coordinates back to WGS84
     * @param x Easting in meters
     * @param y Northing in meters
     * @return WGS84 coordinates as (latitude, longitude) in degrees
     */
    [[nodiscard]] static glm::dvec2 mercator_to_wgs84(double x, double y);

    /**
     * @brief Transverse Mercator forward projection (Krueger series)
     * @return (easting, northing) in meters
     */
    [[nodiscard]] static glm::dvec2 wgs84_to_transverse_mercator(
        const Projection& projection, double lat, double lon);

    /**
     * @brief Transverse Mercator inverse projection
     * @return (latitude, longitude) in degrees
     */
    [[nodiscard]] static glm::dvec2 transverse_mercator_to_wgs84(
        const Projection& projection, double x, double y);

private:
    std::optional<Projection> m_projection;
};

// ============================================================================
// Geometry Utilities
// ============================================================================

namespace geometry {

/**
 * @brief Calculate the signed area of a polygon
 * @param polygon Ordered list of vertices (closing point optional)
 * @return Signed area (positive = CCW, negative = CW)
 *
 * Uses the shoelace formula.
 */
[[nodiscard]] double polygon_area(const std::vector<glm::dvec2>& polygon);

/**
 * @brief Calculate the centroid of a polygon
 * @param polygon Ordered list of vertices
 * @return Centroid point
 */
[[nodiscard]] glm::dvec2 centroid(const std::vector<glm::dvec2>& polygon);

} // namespace geometry

} // namespace cityfuse::osm
