/**
 * @file coordinates.cpp
 * @brief Implementation of coordinate conversion utilities
 */

#include "osm/coordinates.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace cityfuse::osm {

// ============================================================================
// Projection Lookup
// ============================================================================

std::optional<Projection> projection_for_epsg(int epsg) {
    Projection projection;
    projection.epsg = epsg;

    if (epsg == EPSG_WEB_MERCATOR) {
        projection.kind = Projection::Kind::WebMercator;
        projection.scale_factor = 1.0;
        projection.false_easting = 0.0;
        return projection;
    }

    int zone = 0;
    bool south = false;

    if (epsg >= 25828 && epsg <= 25838) {
        // ETRS89 / UTM zone 28N..38N
        zone = epsg - 25800;
        projection.inverse_flattening = GRS80_INV_FLATTENING;
    } else if (epsg >= 32601 && epsg <= 32660) {
        zone = epsg - 32600;
    } else if (epsg >= 32701 && epsg <= 32760) {
        zone = epsg - 32700;
        south = true;
    } else {
        return std::nullopt;
    }

    projection.kind = Projection::Kind::TransverseMercator;
    projection.central_meridian = -183.0 + 6.0 * zone;
    projection.false_northing = south ? 10000000.0 : 0.0;
    return projection;
}

std::optional<int> parse_epsg(const std::string& reference_system) {
    std::string upper = reference_system;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (upper.find("EPSG") == std::string::npos) {
        return std::nullopt;
    }

    // The code is the trailing run of digits ("...EPSG::25832", ".../EPSG/0/25832")
    size_t end = upper.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(upper[end - 1]))) {
        --end;
    }
    size_t begin = end;
    while (begin > 0 && std::isdigit(static_cast<unsigned char>(upper[begin - 1]))) {
        --begin;
    }
    if (begin == end) {
        return std::nullopt;
    }

    try {
        return std::stoi(upper.substr(begin, end - begin));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// CoordinateConverter Implementation
// ============================================================================

bool CoordinateConverter::set_projection(int epsg) {
    auto projection = projection_for_epsg(epsg);
    if (!projection) {
        return false;
    }
    m_projection = projection;
    return true;
}

glm::dvec2 CoordinateConverter::wgs84_to_projected(double lat, double lon) const {
    if (!m_projection) {
        // Fallback: plain mercator, matching an uninitialized converter
        return wgs84_to_mercator(lat, lon);
    }
    if (m_projection->kind == Projection::Kind::WebMercator) {
        return wgs84_to_mercator(lat, lon);
    }
    return wgs84_to_transverse_mercator(*m_projection, lat, lon);
}

glm::dvec2 CoordinateConverter::projected_to_wgs84(double x, double y) const {
    if (!m_projection || m_projection->kind == Projection::Kind::WebMercator) {
        return mercator_to_wgs84(x, y);
    }
    return transverse_mercator_to_wgs84(*m_projection, x, y);
}

glm::dvec2 CoordinateConverter::wgs84_to_mercator(double lat, double lon) {
    // Clamp latitude to valid range for Web Mercator
    // (beyond ~85 degrees, projection becomes infinite)
    lat = std::clamp(lat, -85.051128, 85.051128);

    double x = EARTH_RADIUS_M * lon * DEG_TO_RAD;
    double y = EARTH_RADIUS_M * std::log(std::tan((M_PI / 4.0) + (lat * DEG_TO_RAD / 2.0)));

    return glm::dvec2(x, y);
}

glm::dvec2 CoordinateConverter::mercator_to_wgs84(double x, double y) {
    double lon = (x / EARTH_RADIUS_M) * RAD_TO_DEG;
    double lat = (2.0 * std::atan(std::exp(y / EARTH_RADIUS_M)) - M_PI / 2.0) * RAD_TO_DEG;
    return glm::dvec2(lat, lon);
}

namespace {

// Series coefficients of the Krueger expansion, third order in n
struct KruegerSeries {
    double rectifying_radius = 0.0;     // A
    double eccentricity = 0.0;          // e
    double alpha[3] = {0.0, 0.0, 0.0};
    double beta[3] = {0.0, 0.0, 0.0};
    double delta[3] = {0.0, 0.0, 0.0};
};

KruegerSeries make_series(const Projection& projection) {
    KruegerSeries s;
    const double f = 1.0 / projection.inverse_flattening;
    const double n = f / (2.0 - f);
    const double n2 = n * n;
    const double n3 = n2 * n;

    s.rectifying_radius = projection.semi_major_axis / (1.0 + n) * (1.0 + n2 / 4.0 + n2 * n2 / 64.0);
    s.eccentricity = 2.0 * std::sqrt(n) / (1.0 + n);

    s.alpha[0] = n / 2.0 - 2.0 * n2 / 3.0 + 5.0 * n3 / 16.0;
    s.alpha[1] = 13.0 * n2 / 48.0 - 3.0 * n3 / 5.0;
    s.alpha[2] = 61.0 * n3 / 240.0;

    s.beta[0] = n / 2.0 - 2.0 * n2 / 3.0 + 37.0 * n3 / 96.0;
    s.beta[1] = n2 / 48.0 + n3 / 15.0;
    s.beta[2] = 17.0 * n3 / 480.0;

    s.delta[0] = 2.0 * n - 2.0 * n2 / 3.0 - 2.0 * n3;
    s.delta[1] = 7.0 * n2 / 3.0 - 8.0 * n3 / 5.0;
    s.delta[2] = 56.0 * n3 / 15.0;
    return s;
}

} // namespace

glm::dvec2 CoordinateConverter::wgs84_to_transverse_mercator(
    const Projection& projection, double lat, double lon) {
    const KruegerSeries s = make_series(projection);

    const double phi = lat * DEG_TO_RAD;
    const double dlambda = (lon - projection.central_meridian) * DEG_TO_RAD;
    const double sin_phi = std::sin(phi);

    // Conformal latitude
    const double t = std::sinh(std::atanh(sin_phi) - s.eccentricity * std::atanh(s.eccentricity * sin_phi));
    const double xi_prime = std::atan2(t, std::cos(dlambda));
    const double eta_prime = std::atanh(std::sin(dlambda) / std::sqrt(1.0 + t * t));

    double xi = xi_prime;
    double eta = eta_prime;
    for (int j = 1; j <= 3; ++j) {
        xi += s.alpha[j - 1] * std::sin(2.0 * j * xi_prime) * std::cosh(2.0 * j * eta_prime);
        eta += s.alpha[j - 1] * std::cos(2.0 * j * xi_prime) * std::sinh(2.0 * j * eta_prime);
    }

    const double k0a = projection.scale_factor * s.rectifying_radius;
    return glm::dvec2(projection.false_easting + k0a * eta,
                      projection.false_northing + k0a * xi);
}

glm::dvec2 CoordinateConverter::transverse_mercator_to_wgs84(
    const Projection& projection, double x, double y) {
    const KruegerSeries s = make_series(projection);

    const double k0a = projection.scale_factor * s.rectifying_radius;
    const double xi = (y - projection.false_northing) / k0a;
    const double eta = (x - projection.false_easting) / k0a;

    double xi_prime = xi;
    double eta_prime = eta;
    for (int j = 1; j <= 3; ++j) {
        xi_prime -= s.beta[j - 1] * std::sin(2.0 * j * xi) * std::cosh(2.0 * j * eta);
        eta_prime -= s.beta[j - 1] * std::cos(2.0 * j * xi) * std::sinh(2.0 * j * eta);
    }

    const double chi = std::asin(std::sin(xi_prime) / std::cosh(eta_prime));
    double phi = chi;
    for (int j = 1; j <= 3; ++j) {
        phi += s.delta[j - 1] * std::sin(2.0 * j * chi);
    }
    const double lambda = std::atan2(std::sinh(eta_prime), std::cos(xi_prime));

    return glm::dvec2(phi * RAD_TO_DEG, projection.central_meridian + lambda * RAD_TO_DEG);
}

// ============================================================================
// Geometry Utilities Implementation
// ============================================================================

namespace geometry {

double polygon_area(const std::vector<glm::dvec2>& polygon) {
    if (polygon.size() < 3) return 0.0;

    // Shoelace formula
    double area = 0.0;
    size_t n = polygon.size();

    for (size_t i = 0; i < n; ++i) {
        size_t j = (i + 1) % n;
        area += polygon[i].x * polygon[j].y;
        area -= polygon[j].x * polygon[i].y;
    }

    return area / 2.0;
}

glm::dvec2 centroid(const std::vector<glm::dvec2>& polygon) {
    if (polygon.empty()) return glm::dvec2(0.0);
    if (polygon.size() == 1) return polygon[0];
    if (polygon.size() == 2) return (polygon[0] + polygon[1]) / 2.0;

    double cx = 0.0;
    double cy = 0.0;
    double signed_area = 0.0;
    size_t n = polygon.size();

    // Shift to the first vertex to keep projected coordinates well conditioned
    const glm::dvec2 ref = polygon[0];

    for (size_t i = 0; i < n; ++i) {
        size_t j = (i + 1) % n;
        glm::dvec2 a = polygon[i] - ref;
        glm::dvec2 b = polygon[j] - ref;
        double cross = a.x * b.y - b.x * a.y;
        signed_area += cross;
        cx += (a.x + b.x) * cross;
        cy += (a.y + b.y) * cross;
    }

    signed_area /= 2.0;
    if (std::abs(signed_area) < 1e-10) {
        // Degenerate polygon, return simple average
        glm::dvec2 sum(0.0);
        for (const auto& p : polygon) sum += p - ref;
        return ref + sum / static_cast<double>(n);
    }

    cx /= (6.0 * signed_area);
    cy /= (6.0 * signed_area);

    return ref + glm::dvec2(cx, cy);
}

} // namespace geometry

} // namespace cityfuse::osm
