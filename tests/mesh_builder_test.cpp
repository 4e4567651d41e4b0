#include "mesh/mesh_builder.hpp"
#include "core/errors.hpp"
#include "merge/geometry_check.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <set>

using namespace cityfuse;
using mesh::MeshBuilder;

namespace {

merge::MergedRecord record_of(std::vector<cityjson::CityBuilding> buildings) {
    merge::MergedRecord record;
    record.osm_identifier = "node/1";
    record.stem = "node_1";
    record.epsg = test::TEST_EPSG;
    record.buildings = std::move(buildings);
    for (auto& building : record.buildings) {
        merge::close_rings(building, 1e-6);
    }
    return record;
}

double total_area(const mesh::Mesh& mesh) {
    double area = 0.0;
    for (size_t f = 0; f < mesh.face_count(); ++f) {
        area += mesh.face_area(f);
    }
    return area;
}

} // namespace

TEST(TriangulateTest, RectangleGivesTwoTrianglesAlongItsNormal) {
    const std::vector<glm::dvec3> rectangle = {{0, 0, 0}, {4, 0, 0}, {4, 0, 3}, {0, 0, 3}};
    auto indices = MeshBuilder::triangulate(rectangle, {});
    ASSERT_EQ(indices.size(), 6u);

    const glm::dvec3 ring_normal = merge::newell_normal(rectangle);
    double area = 0.0;
    for (size_t i = 0; i < indices.size(); i += 3) {
        const glm::dvec3 n = glm::cross(rectangle[indices[i + 1]] - rectangle[indices[i]],
                                        rectangle[indices[i + 2]] - rectangle[indices[i]]);
        EXPECT_GT(glm::dot(n, ring_normal), 0.0);
        area += 0.5 * glm::length(n);
    }
    EXPECT_NEAR(area, 12.0, 1e-9);
}

TEST(TriangulateTest, HolesAreLeftOpen) {
    const std::vector<glm::dvec3> outer = {{0, 0, 5}, {10, 0, 5}, {10, 10, 5}, {0, 10, 5}, {0, 0, 5}};
    const std::vector<glm::dvec3> hole = {{4, 4, 5}, {4, 6, 5}, {6, 6, 5}, {6, 4, 5}};
    auto indices = MeshBuilder::triangulate(outer, {hole});
    ASSERT_EQ(indices.size() % 3, 0u);
    EXPECT_EQ(indices.size() / 3, 8u);

    // Outer ring is passed closed: indices refer to its 4 open points, then the hole
    std::vector<glm::dvec3> flat = {outer[0], outer[1], outer[2], outer[3]};
    flat.insert(flat.end(), hole.begin(), hole.end());
    double area = 0.0;
    for (size_t i = 0; i < indices.size(); i += 3) {
        ASSERT_LT(*std::max_element(indices.begin() + i, indices.begin() + i + 3), flat.size());
        const glm::dvec3 n = glm::cross(flat[indices[i + 1]] - flat[indices[i]], flat[indices[i + 2]] - flat[indices[i]]);
        EXPECT_GT(n.z, 0.0);
        area += 0.5 * glm::length(n);
    }
    EXPECT_NEAR(area, 96.0, 1e-9);
}

TEST(TriangulateTest, NonConvexRingKeepsItsArea) {
    // L-shaped roof, the notch sits at x > 4, y > 4
    const std::vector<glm::dvec3> ring = {{0, 0, 5}, {10, 0, 5}, {10, 4, 5}, {4, 4, 5}, {4, 10, 5}, {0, 10, 5}};
    auto indices = MeshBuilder::triangulate(ring, {});
    ASSERT_EQ(indices.size(), 3u * (ring.size() - 2));

    const glm::dvec3 ring_normal = merge::newell_normal(ring);
    double area = 0.0;
    for (size_t i = 0; i < indices.size(); i += 3) {
        const glm::dvec3& a = ring[indices[i]];
        const glm::dvec3& b = ring[indices[i + 1]];
        const glm::dvec3& c = ring[indices[i + 2]];
        const glm::dvec3 n = glm::cross(b - a, c - a);
        EXPECT_GT(glm::dot(n, ring_normal), 0.0);
        area += 0.5 * glm::length(n);

        const glm::dvec3 centroid = (a + b + c) / 3.0;
        EXPECT_FALSE(centroid.x > 4.0 && centroid.y > 4.0);
    }
    EXPECT_NEAR(area, 64.0, 1e-9);
}

TEST(TriangulateTest, ColinearPointsAddNoSlivers) {
    const std::vector<glm::dvec3> ring = {{0, 0, 3}, {5, 0, 3}, {10, 0, 3}, {10, 5, 3},
                                          {10, 10, 3}, {5, 10, 3}, {0, 10, 3}, {0, 5, 3}};
    auto indices = MeshBuilder::triangulate(ring, {});
    ASSERT_FALSE(indices.empty());
    EXPECT_LE(indices.size(), 3u * (ring.size() - 2));

    double area = 0.0;
    for (size_t i = 0; i < indices.size(); i += 3) {
        area += 0.5 * glm::length(glm::cross(ring[indices[i + 1]] - ring[indices[i]],
                                             ring[indices[i + 2]] - ring[indices[i]]));
    }
    EXPECT_NEAR(area, 100.0, 1e-9);
}

TEST(TriangulateTest, DegenerateRingsGiveNothing) {
    EXPECT_TRUE(MeshBuilder::triangulate({{0, 0, 0}, {1, 0, 0}}, {}).empty());
    EXPECT_TRUE(MeshBuilder::triangulate({{0, 0, 0}, {1, 0, 0}, {2, 0, 0}, {3, 0, 0}}, {}).empty());
}

TEST(MeshBuilderTest, GableHouseBecomesAClosedOutwardMesh) {
    const glm::dvec2 center = test::project(8.404, 49.014);
    auto record = record_of({test::gable_house("house", center.x, center.y)});

    mesh::Mesh mesh = MeshBuilder::build(record);

    EXPECT_EQ(mesh.identifier, "node/1");
    EXPECT_EQ(mesh.epsg, test::TEST_EPSG);
    EXPECT_EQ(mesh.surface_count, 7u);
    EXPECT_EQ(mesh.face_count(), 16u);
    EXPECT_EQ(mesh.vertices.size(), 10u);
    EXPECT_NEAR(mesh.signed_volume(), 360.0, 1e-6);
    EXPECT_NEAR(total_area(mesh), 80.0 + 2 * 30.0 + 2 * 36.0 + 2 * 10.0 * std::sqrt(4.0 * 4.0 + 3.0 * 3.0), 1e-6);

    for (size_t f = 0; f < mesh.face_count(); ++f) {
        std::set<uint32_t> corners(mesh.indices.begin() + f * 3, mesh.indices.begin() + f * 3 + 3);
        EXPECT_EQ(corners.size(), 3u);
        EXPECT_GT(mesh.face_area(f), 1e-6);
    }

    // Vertices are stored relative to an origin next to the building
    EXPECT_LT(glm::length(mesh.bounds.center()), 10.0);
    EXPECT_GT(mesh.origin.x, 400000.0);
    EXPECT_NEAR(mesh.bounds.max.z - mesh.bounds.min.z, 6.0, 1e-9);
}

TEST(MeshBuilderTest, FacesAreGroupedByMaterial) {
    auto record = record_of({test::gable_house("house", 0.0, 0.0)});
    mesh::Mesh mesh = MeshBuilder::build(record);

    ASSERT_EQ(mesh.ranges.size(), 3u);
    EXPECT_EQ(mesh.ranges[0].material.name, "roof");
    EXPECT_EQ(mesh.ranges[0].face_count, 4u);
    EXPECT_EQ(mesh.ranges[1].material.name, "wall");
    EXPECT_EQ(mesh.ranges[1].face_count, 10u);
    EXPECT_EQ(mesh.ranges[2].material.name, "ground");
    EXPECT_EQ(mesh.ranges[2].face_count, 2u);

    uint32_t next = 0;
    for (const auto& range : mesh.ranges) {
        EXPECT_EQ(range.first_face, next);
        next += range.face_count;
    }
    EXPECT_EQ(next, mesh.face_count());

    // Roof faces point up, ground faces point down
    for (uint32_t f = 0; f < mesh.ranges[0].face_count; ++f) {
        EXPECT_GT(mesh.face_normal(f).z, 0.0);
    }
    EXPECT_LT(mesh.face_normal(mesh.ranges[2].first_face).z, 0.0);
}

TEST(MeshBuilderTest, InwardSolidsAreTurnedOutward) {
    auto building = test::box_building("inside_out", 0, 0, 10, 10, 4);
    for (auto& surface : building.solids[0].surfaces) {
        std::reverse(surface.outer.begin(), surface.outer.end());
    }

    mesh::Mesh mesh = MeshBuilder::build(record_of({building}));
    EXPECT_EQ(mesh.face_count(), 12u);
    EXPECT_NEAR(mesh.signed_volume(), 400.0, 1e-6);
}

TEST(MeshBuilderTest, OpenSolidsAreOrientedPerSurface) {
    auto building = test::box_building("open", 0, 0, 10, 10, 4);
    auto& surfaces = building.solids[0].surfaces;
    surfaces.erase(surfaces.begin() + 1);
    std::reverse(surfaces.back().outer.begin(), surfaces.back().outer.end());

    mesh::Mesh mesh = MeshBuilder::build(record_of({building}));
    EXPECT_EQ(mesh.face_count(), 10u);
    EXPECT_GT(mesh.face_normal(mesh.ranges[0].first_face).z, 0.0);
}

TEST(MeshBuilderTest, CloseVerticesAreWelded) {
    auto a = test::box_building("a", 0, 0, 10, 10, 4);
    auto b = test::box_building("b", 10.0004, 0, 20, 10, 4);

    mesh::Mesh welded = MeshBuilder::build(record_of({a, b}));
    EXPECT_EQ(welded.vertices.size(), 12u);

    mesh::MeshConfig strict;
    strict.weld_tolerance_m = 1e-5;
    mesh::Mesh separate = MeshBuilder::build(record_of({a, b}), strict);
    EXPECT_EQ(separate.vertices.size(), 16u);
}

TEST(MeshBuilderTest, ColinearRoofPointsGiveNoDegenerateFaces) {
    cityjson::CityBuilding shed;
    shed.id = "shed";
    cityjson::Solid solid;
    solid.surfaces.push_back(test::surface(cityjson::SurfaceRole::Roof,
        {{0.0, 0.0, 3.0}, {2.5, 0.0, 3.0}, {5.0, 0.0, 3.0}, {7.5, 0.0, 3.0}, {10.0, 0.0, 3.0},
         {10.0, 10.0, 3.0}, {5.0, 10.0, 3.0}, {0.0, 10.0, 3.0}, {0.0, 5.0, 3.0}}));
    shed.solids.push_back(solid);

    mesh::MeshConfig config;
    mesh::Mesh mesh = MeshBuilder::build(record_of({shed}), config);

    ASSERT_GT(mesh.face_count(), 0u);
    for (size_t f = 0; f < mesh.face_count(); ++f) {
        EXPECT_GE(mesh.face_area(f), config.min_triangle_area_m2);
        EXPECT_GT(mesh.face_normal(f).z, 0.0);
    }
    EXPECT_NEAR(total_area(mesh), 100.0, 1e-6);
}

TEST(MeshBuilderTest, NothingToTriangulateIsADegenerateSolid) {
    cityjson::CityBuilding flat;
    flat.id = "flat";
    cityjson::Solid solid;
    solid.surfaces.push_back(test::surface(cityjson::SurfaceRole::Wall,
                                           {{0.0, 0.0, 0.0}, {5.0, 0.0, 0.0}, {10.0, 0.0, 0.0}}));
    solid.surfaces.push_back(test::surface(cityjson::SurfaceRole::Roof,
                                           {{0.0, 0.0, 1.0}, {1e-5, 0.0, 1.0}, {0.0, 1e-5, 1.0}}));
    flat.solids.push_back(solid);

    try {
        (void)MeshBuilder::build(record_of({flat}));
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), FailureKind::DegenerateSolid);
    }

    EXPECT_THROW((void)MeshBuilder::build(record_of({})), PipelineError);
}
