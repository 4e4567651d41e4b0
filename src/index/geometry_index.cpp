#include "index/geometry_index.hpp"
#include "core/errors.hpp"
#include <boost/geometry/geometries/multi_point.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace cityfuse::index {

namespace {

// Surfaces first, vertices second
bool more_complete(const cityjson::CityBuilding& a, const cityjson::CityBuilding& b) {
    const size_t surfaces_a = a.surface_count();
    const size_t surfaces_b = b.surface_count();
    if (surfaces_a != surfaces_b) return surfaces_a > surfaces_b;
    return a.vertex_count() > b.vertex_count();
}

Polygon2D to_polygon(const cityjson::Surface& surface) {
    Polygon2D polygon;
    for (const auto& p : surface.outer) {
        bg::append(polygon.outer(), Point2D(p.x, p.y));
    }
    for (const auto& hole : surface.holes) {
        polygon.inners().emplace_back();
        for (const auto& p : hole) {
            bg::append(polygon.inners().back(), Point2D(p.x, p.y));
        }
    }
    bg::correct(polygon);
    return polygon;
}

} // namespace

std::optional<Footprint> GeometryIndex::compute_footprint(const cityjson::CityBuilding& building) {
    constexpr double MIN_AREA = 1e-6;

    Footprint footprint;
    for (const auto& solid : building.solids) {
        for (const auto& surface : solid.surfaces) {
            if (surface.role != cityjson::SurfaceRole::Ground || surface.outer.size() < 3) continue;

            Polygon2D polygon = to_polygon(surface);
            if (bg::area(polygon) < MIN_AREA) continue;

            Footprint merged;
            bg::union_(footprint, polygon, merged);
            footprint = std::move(merged);
        }
    }

    if (!footprint.empty() && bg::area(footprint) >= MIN_AREA) {
        return footprint;
    }

    // No usable ground surface: fall back to the convex hull of every vertex
    bg::model::multi_point<Point2D> points;
    for (const auto& solid : building.solids) {
        for (const auto& surface : solid.surfaces) {
            for (const auto& p : surface.outer) {
                bg::append(points, Point2D(p.x, p.y));
            }
        }
    }
    if (points.size() < 3) {
        return std::nullopt;
    }

    Polygon2D hull;
    bg::convex_hull(points, hull);
    bg::correct(hull);
    if (bg::area(hull) < MIN_AREA) {
        return std::nullopt;
    }

    Footprint result;
    result.push_back(std::move(hull));
    return result;
}

void GeometryIndex::build(std::vector<cityjson::CityBuilding> buildings) {
    m_entries.clear();
    m_by_id.clear();
    m_rtree.clear();
    m_epsg.reset();
    m_duplicates = 0;
    m_without_footprint = 0;
    m_built = false;

    if (buildings.empty()) {
        throw IndexError(IndexErrorKind::IndexEmpty, "no buildings to index");
    }

    // Deduplicate buildings repeated across tile borders
    std::unordered_map<std::string, size_t> best;
    std::vector<cityjson::CityBuilding> unique;
    unique.reserve(buildings.size());
    for (auto& building : buildings) {
        auto it = best.find(building.id);
        if (it == best.end()) {
            best.emplace(building.id, unique.size());
            unique.push_back(std::move(building));
            continue;
        }
        m_duplicates++;
        if (more_complete(building, unique[it->second])) {
            unique[it->second] = std::move(building);
        }
    }

    std::vector<Value> values;
    values.reserve(unique.size());
    for (auto& building : unique) {
        auto footprint = compute_footprint(building);
        if (!footprint) {
            spdlog::debug("GeometryIndex: Building {} has no footprint, not indexed", building.id);
            m_without_footprint++;
            continue;
        }

        IndexedBuilding entry;
        entry.footprint = std::move(*footprint);
        entry.bounds = bg::return_envelope<Box2D>(entry.footprint);
        entry.area = bg::area(entry.footprint);
        entry.building = std::move(building);

        const size_t slot = m_entries.size();
        values.emplace_back(entry.bounds, slot);
        m_by_id.emplace(entry.building.id, slot);
        m_entries.push_back(std::move(entry));
    }

    if (m_entries.empty()) {
        throw IndexError(IndexErrorKind::IndexEmpty,
                         std::to_string(unique.size()) + " buildings, none with a footprint");
    }

    // Bulk loading packs the tree better than repeated inserts
    m_rtree = bgi::rtree<Value, bgi::quadratic<16>>(values.begin(), values.end());

    bool consistent = true;
    for (const auto& entry : m_entries) {
        const auto& epsg = entry.building.epsg;
        if (!epsg || (m_epsg && *m_epsg != *epsg)) {
            consistent = false;
            break;
        }
        m_epsg = epsg;
    }
    if (!consistent) {
        spdlog::warn("GeometryIndex: Buildings have missing or inconsistent reference systems");
        m_epsg.reset();
    }

    m_built = true;

    spdlog::info("GeometryIndex: Indexed {} buildings ({} duplicates dropped, {} without footprint)",
                 m_entries.size(), m_duplicates, m_without_footprint);
}

std::vector<IndexHit> GeometryIndex::query_hits(const glm::dvec2& point, double radius) const {
    if (!m_built) {
        throw IndexError(IndexErrorKind::NotBuilt, "query before build()");
    }

    const Point2D p(point.x, point.y);
    const Box2D search(Point2D(point.x - radius, point.y - radius),
                       Point2D(point.x + radius, point.y + radius));

    std::vector<Value> found;
    m_rtree.query(bgi::intersects(search), std::back_inserter(found));

    std::vector<IndexHit> hits;
    hits.reserve(found.size());
    for (const auto& value : found) {
        const IndexedBuilding& entry = m_entries[value.second];

        IndexHit hit;
        hit.building_id = entry.building.id;
        hit.area = entry.area;
        hit.contains = bg::within(p, entry.footprint);
        hit.distance = hit.contains ? 0.0 : bg::distance(p, entry.footprint);

        if (hit.distance <= radius) {
            hits.push_back(std::move(hit));
        }
    }

    std::sort(hits.begin(), hits.end(), [](const IndexHit& a, const IndexHit& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        return a.building_id < b.building_id;
    });
    return hits;
}

std::vector<std::string> GeometryIndex::query(const glm::dvec2& point, double radius) const {
    std::vector<std::string> ids;
    for (auto& hit : query_hits(point, radius)) {
        ids.push_back(std::move(hit.building_id));
    }
    return ids;
}

const IndexedBuilding* GeometryIndex::find(const std::string& id) const {
    auto it = m_by_id.find(id);
    return it != m_by_id.end() ? &m_entries[it->second] : nullptr;
}

} // namespace cityfuse::index
