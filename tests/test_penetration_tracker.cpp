#include <gtest/gtest.h>
#include "roamcam/penetration_tracker.hpp"

using namespace roamcam;

class PenetrationTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        floor = TriangleMesh::floorQuad("floor", -10.0f, 12.0f, -9.0f, 10.0f, 0.0f);
        floor.setMetadata({{"ground", true}});
        crate = TriangleMesh::box("crate", AABB(2.0f, 0.0f, -1.0f, 3.5f, 0.6f, 1.3f));
        meshes = {&floor, &crate};
        detector.setCandidates(meshes);
    }

    PenetrationConfig noGrace() {
        PenetrationConfig config;
        config.skipFrames = 0;
        return config;
    }

    static constexpr float RADIUS = 0.3f;
    static constexpr float HEIGHT = 1.8f;

    TriangleMesh floor;
    TriangleMesh crate;
    std::vector<const TriangleMesh*> meshes;
    CollisionDetector detector;
};

// ============================================================================
// Threshold
// ============================================================================

TEST_F(PenetrationTrackerTest, ThresholdIncludesEpsilon) {
    PenetrationTracker tracker;
    // 0.31 - 0.02 = 0.29 < 0.3
    EXPECT_TRUE(tracker.isPenetrating(0.31f, 0.3f));
    EXPECT_FALSE(tracker.isPenetrating(0.33f, 0.3f));
    EXPECT_FALSE(tracker.isPenetrating(9999.0f, 0.3f));
}

TEST_F(PenetrationTrackerTest, PermissiveOffsetLowersThreshold) {
    PenetrationConfig config = noGrace();
    config.permissiveOffset = -0.1f;
    PenetrationTracker tracker(config);

    auto result = tracker.update(detector, Vec3(0.3f, 0.0f, 0.7f), RADIUS, HEIGHT);
    EXPECT_NEAR(result.threshold, 0.2f, 1e-6f);
}

// ============================================================================
// Sampling
// ============================================================================

TEST_F(PenetrationTrackerTest, GroundUnderFeetIsNotPenetration) {
    PenetrationTracker tracker(noGrace());

    PenetrationResult result;
    for (int i = 0; i < 20; ++i) {
        result = tracker.update(detector, Vec3(0.3f, 0.0f, 0.7f), RADIUS, HEIGHT);
    }
    EXPECT_FALSE(result.penetrating);
    EXPECT_EQ(result.phase, PenetrationPhase::Clear);
    EXPECT_EQ(tracker.penetratingFrames(), 0);
    // Lowest sample is filtered; next one is 0.2778 * 1.8 above the floor
    EXPECT_NEAR(result.minDistance, 0.5f, 1e-3f);
}

TEST_F(PenetrationTrackerTest, UnflaggedFloorCountsAsPenetration) {
    floor.setMetadata({});
    PenetrationTracker tracker(noGrace());

    auto result = tracker.update(detector, Vec3(0.3f, 0.0f, 0.7f), RADIUS, HEIGHT);
    EXPECT_TRUE(result.penetrating);
    EXPECT_NEAR(result.minDistance, 0.1f, 1e-3f);
    ASSERT_FALSE(result.colliders.empty());
    EXPECT_EQ(result.colliders.front(), &floor);
}

TEST_F(PenetrationTrackerTest, NoHitsReportsSentinelDistance) {
    std::vector<const TriangleMesh*> none;
    CollisionDetector empty(none);
    PenetrationTracker tracker;

    auto result = tracker.update(empty, Vec3(0.0f), RADIUS, HEIGHT);
    EXPECT_FALSE(result.penetrating);
    EXPECT_FLOAT_EQ(result.minDistance, 9999.0f);
    EXPECT_TRUE(result.colliders.empty());
}

// ============================================================================
// Frame counting
// ============================================================================

TEST_F(PenetrationTrackerTest, GracePeriodAfterSpawn) {
    PenetrationTracker tracker;  // skipFrames = 10
    const Vec3 onCrate(2.7f, 0.0f, 0.2f);

    for (int i = 0; i < 10; ++i) {
        auto result = tracker.update(detector, onCrate, RADIUS, HEIGHT);
        EXPECT_TRUE(result.penetrating);
        EXPECT_FALSE(result.effectivelyPenetrating);
        EXPECT_EQ(tracker.penetratingFrames(), 0);
    }

    auto result = tracker.update(detector, onCrate, RADIUS, HEIGHT);
    EXPECT_TRUE(result.effectivelyPenetrating);
    EXPECT_EQ(tracker.penetratingFrames(), 1);
    EXPECT_EQ(result.phase, PenetrationPhase::Penetrating);
}

TEST_F(PenetrationTrackerTest, CounterResetsWhenClear) {
    PenetrationTracker tracker(noGrace());
    const Vec3 inCrate(2.7f, 0.0f, 0.2f);
    const Vec3 onFloor(0.3f, 0.0f, 0.7f);

    for (int i = 0; i < 3; ++i) {
        (void)tracker.update(detector, inCrate, RADIUS, HEIGHT);
    }
    EXPECT_EQ(tracker.penetratingFrames(), 3);

    auto result = tracker.update(detector, onFloor, RADIUS, HEIGHT);
    EXPECT_FALSE(result.penetrating);
    EXPECT_EQ(tracker.penetratingFrames(), 0);
    EXPECT_EQ(tracker.phase(), PenetrationPhase::Clear);
}

TEST_F(PenetrationTrackerTest, SnapsRootBackToGround) {
    PenetrationTracker tracker(noGrace());
    Vec3 root(0.3f, -0.4f, 0.7f);

    for (int i = 0; i < 5; ++i) {
        auto result = tracker.update(detector, root, RADIUS, HEIGHT);
        EXPECT_TRUE(result.effectivelyPenetrating);
        EXPECT_FALSE(result.snapDelta.has_value());
        EXPECT_EQ(result.phase, PenetrationPhase::Penetrating);
    }

    // Sixth consecutive frame: 20% of the 0.4 gap
    auto result = tracker.update(detector, root, RADIUS, HEIGHT);
    EXPECT_EQ(result.phase, PenetrationPhase::Snapping);
    ASSERT_TRUE(result.snapDelta.has_value());
    EXPECT_NEAR(*result.snapDelta, 0.08f, 1e-4f);

    root.y += *result.snapDelta;
    for (int i = 0; i < 20 && tracker.phase() != PenetrationPhase::Clear; ++i) {
        result = tracker.update(detector, root, RADIUS, HEIGHT);
        if (result.snapDelta) {
            EXPECT_GT(*result.snapDelta, 0.0f);
            root.y += *result.snapDelta;
        }
    }

    EXPECT_EQ(tracker.phase(), PenetrationPhase::Clear);
    EXPECT_GT(root.y, -0.4f);
    EXPECT_LT(root.y, 0.0f);
}

TEST_F(PenetrationTrackerTest, ResetForgetsHistory) {
    PenetrationTracker tracker(noGrace());
    for (int i = 0; i < 3; ++i) {
        (void)tracker.update(detector, Vec3(2.7f, 0.0f, 0.2f), RADIUS, HEIGHT);
    }
    ASSERT_GT(tracker.penetratingFrames(), 0);

    tracker.reset();
    EXPECT_EQ(tracker.penetratingFrames(), 0);
    EXPECT_EQ(tracker.frameCount(), 0u);
    EXPECT_EQ(tracker.phase(), PenetrationPhase::Clear);
}

TEST_F(PenetrationTrackerTest, TrackersDoNotShareState) {
    PenetrationTracker a(noGrace());
    PenetrationTracker b(noGrace());

    (void)a.update(detector, Vec3(2.7f, 0.0f, 0.2f), RADIUS, HEIGHT);
    EXPECT_EQ(a.penetratingFrames(), 1);
    EXPECT_EQ(b.penetratingFrames(), 0);
    EXPECT_EQ(b.frameCount(), 0u);
}
