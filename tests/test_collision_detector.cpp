#include <gtest/gtest.h>
#include "roamcam/collision_detector.hpp"
#include <memory>

using namespace roamcam;

namespace {

// Wall slab perpendicular to Z, wide enough that side rays never miss
TriangleMesh zWall(const std::string& name, float zMin, float zMax) {
    return TriangleMesh::box(name, AABB(-5.0f, -4.0f, zMin, 7.0f, 5.0f, zMax));
}

}  // namespace

// ============================================================================
// Direction sets
// ============================================================================

TEST(CollisionDirectionsTest, HorizontalDirectionsAreEvenlySpaced) {
    auto dirs = horizontalDirections(4);
    ASSERT_EQ(dirs.size(), 4u);
    EXPECT_NEAR(dirs[0].x, 1.0f, 1e-6f);
    EXPECT_NEAR(dirs[1].z, 1.0f, 1e-6f);
    EXPECT_NEAR(dirs[2].x, -1.0f, 1e-6f);
    EXPECT_NEAR(dirs[3].z, -1.0f, 1e-6f);

    for (const auto& d : horizontalDirections(16)) {
        EXPECT_FLOAT_EQ(d.y, 0.0f);
        EXPECT_NEAR(glm::length(d), 1.0f, 1e-5f);
    }

    EXPECT_TRUE(horizontalDirections(0).empty());
    EXPECT_TRUE(horizontalDirections(-3).empty());
}

TEST(CollisionDirectionsTest, RadialSetCoversAllOctants) {
    const auto& dirs = radialSphereDirections();
    // 16 horizontal + up/down + 8 upward and 8 downward diagonals
    EXPECT_EQ(dirs.size(), 34u);
    for (const auto& d : dirs) {
        EXPECT_NEAR(glm::length(d), 1.0f, 1e-5f);
    }
}

// ============================================================================
// Probe
// ============================================================================

TEST(CollisionProbeTest, ReturnsNearestMesh) {
    TriangleMesh near = zWall("near", -2.4f, -2.0f);
    TriangleMesh far = zWall("far", -4.4f, -4.0f);
    std::vector<const TriangleMesh*> meshes = {&far, &near};
    CollisionDetector detector(meshes);

    // Direction is normalized by the detector
    auto hit = detector.probe(Vec3(0.3f, 0.4f, 0.0f), Vec3(0.0f, 0.0f, -2.0f), 10.0f);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->mesh, &near);
    EXPECT_NEAR(hit->distance, 2.0f, 1e-5f);
    EXPECT_NEAR(hit->normal.z, 1.0f, 1e-5f);
}

TEST(CollisionProbeTest, TieKeepsEarlierMesh) {
    TriangleMesh a = zWall("a", -2.4f, -2.0f);
    TriangleMesh b = zWall("b", -2.4f, -2.0f);

    std::vector<const TriangleMesh*> ab = {&a, &b};
    auto hit = CollisionDetector::probe(ab, Vec3(0.3f, 0.4f, 0.0f), Vec3(0.0f, 0.0f, -1.0f), 10.0f);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->mesh, &a);

    std::vector<const TriangleMesh*> ba = {&b, &a};
    hit = CollisionDetector::probe(ba, Vec3(0.3f, 0.4f, 0.0f), Vec3(0.0f, 0.0f, -1.0f), 10.0f);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->mesh, &b);
}

TEST(CollisionProbeTest, DegenerateQueriesMiss) {
    TriangleMesh wall = zWall("wall", -2.4f, -2.0f);
    std::vector<const TriangleMesh*> meshes = {&wall};
    CollisionDetector detector(meshes);

    EXPECT_FALSE(detector.probe(Vec3(0.3f, 0.4f, 0.0f), Vec3(0.0f), 10.0f).has_value());
    EXPECT_FALSE(detector.probe(Vec3(0.3f, 0.4f, 0.0f), Vec3(0.0f, 0.0f, -1.0f), 0.0f).has_value());
    EXPECT_FALSE(detector.probe(Vec3(0.3f, 0.4f, 0.0f), Vec3(0.0f, 0.0f, -1.0f), 1.5f).has_value());

    CollisionDetector empty;
    EXPECT_TRUE(empty.empty());
    EXPECT_FALSE(empty.probe(Vec3(0.0f), Vec3(0.0f, 0.0f, -1.0f), 10.0f).has_value());
}

TEST(CollisionProbeTest, ProbeAllIsSortedOnePerMesh) {
    TriangleMesh near = zWall("near", -2.4f, -2.0f);
    TriangleMesh far = zWall("far", -4.4f, -4.0f);
    std::vector<const TriangleMesh*> meshes = {&far, &near};
    CollisionDetector detector(meshes);

    auto hits = detector.probeAll(Vec3(0.3f, 0.4f, 0.0f), Vec3(0.0f, 0.0f, -1.0f), 10.0f);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].mesh, &near);
    EXPECT_EQ(hits[1].mesh, &far);
    EXPECT_LT(hits[0].distance, hits[1].distance);
}

// ============================================================================
// Sphere-cast
// ============================================================================

TEST(SphereCastTest, FlatWallIsHitByEverySample) {
    TriangleMesh wall = zWall("wall", -3.2f, -3.0f);
    std::vector<const TriangleMesh*> meshes = {&wall};
    CollisionDetector detector(meshes);

    auto hit = detector.sphereCast(Vec3(0.0f), 0.5f, Vec3(0.0f, 0.0f, -1.0f), 5.0f);
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->sample.distance, 3.0f, 1e-4f);
    // Centre sample plus three rings of eight
    EXPECT_EQ(hit->rayCount, 25);
    EXPECT_EQ(hit->hitCount, 25);
    EXPECT_EQ(hit->sampleIndex, 0);
}

TEST(SphereCastTest, RayLengthIsDistancePlusRadius) {
    TriangleMesh wall = zWall("wall", -3.2f, -3.0f);
    std::vector<const TriangleMesh*> meshes = {&wall};
    CollisionDetector detector(meshes);

    EXPECT_FALSE(detector.sphereCast(Vec3(0.0f), 0.5f, Vec3(0.0f, 0.0f, -1.0f), 2.4f).has_value());
    EXPECT_TRUE(detector.sphereCast(Vec3(0.0f), 0.5f, Vec3(0.0f, 0.0f, -1.0f), 2.6f).has_value());
}

TEST(SphereCastTest, CatchesObstacleBesideTheCentreRay) {
    TriangleMesh pole = TriangleMesh::box("pole", AABB(0.3f, -4.0f, -3.1f, 0.45f, 5.0f, -2.9f));
    std::vector<const TriangleMesh*> meshes = {&pole};
    CollisionDetector detector(meshes);

    EXPECT_FALSE(detector.probe(Vec3(0.0f), Vec3(0.0f, 0.0f, -1.0f), 10.0f).has_value());

    auto hit = detector.sphereCast(Vec3(0.0f), 0.5f, Vec3(0.0f, 0.0f, -1.0f), 5.0f);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->sample.mesh, &pole);
    EXPECT_NEAR(hit->sample.distance, 2.9f, 1e-4f);
    // One sample on the middle ring and two on the outer ring land on it
    EXPECT_EQ(hit->hitCount, 3);
    EXPECT_GT(hit->sampleIndex, 0);
}

TEST(SphereCastTest, ZeroDirectionProbesRadially) {
    TriangleMesh wall = zWall("wall", -1.2f, -1.0f);
    std::vector<const TriangleMesh*> meshes = {&wall};
    CollisionDetector detector(meshes);

    auto hit = detector.sphereCast(Vec3(0.0f), 0.3f, Vec3(0.0f), 2.0f);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->rayCount, 34);
    EXPECT_NEAR(hit->sample.distance, 1.0f, 1e-4f);
    EXPECT_NEAR(hit->rayDirection.z, -1.0f, 1e-5f);
}

// ============================================================================
// Radial probe
// ============================================================================

TEST(RadialProbeTest, FourWallsFourHitsInOrder) {
    TriangleMesh east = TriangleMesh::box("east", AABB(1.0f, -4.0f, -6.0f, 1.2f, 5.0f, 7.0f));
    TriangleMesh west = TriangleMesh::box("west", AABB(-1.2f, -4.0f, -6.0f, -1.0f, 5.0f, 7.0f));
    TriangleMesh south = TriangleMesh::box("south", AABB(-6.0f, -4.0f, 1.0f, 7.0f, 5.0f, 1.2f));
    TriangleMesh north = TriangleMesh::box("north", AABB(-6.0f, -4.0f, -1.2f, 7.0f, 5.0f, -1.0f));
    std::vector<const TriangleMesh*> meshes = {&east, &west, &south, &north};
    CollisionDetector detector(meshes);

    auto dirs = horizontalDirections(4);
    auto hits = detector.radialProbe(Vec3(0.0f), 5.0f, dirs);
    ASSERT_EQ(hits.size(), 4u);
    EXPECT_EQ(hits[0].sample.mesh, &east);
    EXPECT_EQ(hits[1].sample.mesh, &south);
    EXPECT_EQ(hits[2].sample.mesh, &west);
    EXPECT_EQ(hits[3].sample.mesh, &north);
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(hits[i].directionIndex, i);
        EXPECT_NEAR(hits[i].sample.distance, 1.0f, 1e-4f);
    }

    // Out of reach
    EXPECT_TRUE(detector.radialProbe(Vec3(0.0f), 0.5f, dirs).empty());
}
