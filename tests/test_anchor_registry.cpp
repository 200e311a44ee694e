#include "core/events.hpp"
#include "scene/anchor_registry.hpp"
#include <glm/gtc/matrix_transform.hpp>
#include <gtest/gtest.h>
#include <random>
#include <string>
#include <vector>

using namespace arp;

class AnchorRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng_.seed(8128);
    }

    tracking::SpatialAnchor makeSurface(tracking::AnchorId id,
                                        const glm::vec3& center = glm::vec3(0.0f),
                                        const glm::vec2& extent = glm::vec2(1.0f)) {
        tracking::SpatialAnchor anchor;
        anchor.id = id;
        anchor.kind = tracking::AnchorKind::Surface;
        anchor.pose = geometry::Pose(glm::vec3(0.0f, -1.0f, 0.0f));
        anchor.center = center;
        anchor.extent = extent;
        return anchor;
    }

    tracking::SpatialAnchor makeMarker(tracking::AnchorId id, const std::string& image) {
        tracking::SpatialAnchor anchor;
        anchor.id = id;
        anchor.kind = tracking::AnchorKind::Marker;
        anchor.pose = geometry::Pose(glm::vec3(1.0f, 0.0f, -2.0f));
        anchor.image_name = image;
        return anchor;
    }

    bool vectorsEqual(const glm::vec3& a, const glm::vec3& b, float tolerance = 1e-5f) {
        return glm::length(a - b) < tolerance;
    }

    std::mt19937 rng_;
};

TEST_F(AnchorRegistryTest, SurfaceAddCreatesVisual) {
    scene::AnchorRegistry registry(0.25f, false);
    registry.onAnchorAdded(makeSurface(1, glm::vec3(0.5f, 0.0f, -0.25f), glm::vec2(2.0f, 3.0f)));

    ASSERT_EQ(registry.visualCount(), 1u);
    EXPECT_EQ(registry.anchorCount(), 1u);

    const auto* visual = registry.getVisual(1);
    ASSERT_NE(visual, nullptr);
    EXPECT_EQ(visual->anchor, 1u);
    EXPECT_FLOAT_EQ(visual->width, 2.0f);
    EXPECT_FLOAT_EQ(visual->depth, 3.0f);
    EXPECT_FLOAT_EQ(visual->opacity, 0.25f);
    EXPECT_TRUE(visual->hidden);
    EXPECT_TRUE(vectorsEqual(visual->local_position, glm::vec3(0.5f, 0.0f, -0.25f)));
}

TEST_F(AnchorRegistryTest, VisualFollowsShowFlag) {
    scene::AnchorRegistry registry(0.25f, true);
    registry.onAnchorAdded(makeSurface(1));
    EXPECT_FALSE(registry.getVisual(1)->hidden);
}

// Center and extent may change independently; the visual must match the latest values exactly
TEST_F(AnchorRegistryTest, UpdatesTrackExtentAndCenterExactly) {
    scene::AnchorRegistry registry;
    registry.onAnchorAdded(makeSurface(3));

    std::uniform_real_distribution<float> dist(0.1f, 5.0f);
    for (int i = 0; i < 20; ++i) {
        auto anchor = makeSurface(3);
        anchor.center = glm::vec3(dist(rng_), 0.7f, dist(rng_));
        anchor.extent = glm::vec2(dist(rng_), dist(rng_));
        registry.onAnchorUpdated(anchor);

        const auto* visual = registry.getVisual(3);
        ASSERT_NE(visual, nullptr);
        EXPECT_FLOAT_EQ(visual->width, anchor.extent.x);
        EXPECT_FLOAT_EQ(visual->depth, anchor.extent.y);
        // y of the center is not used, the indicator lies in the anchor plane
        EXPECT_TRUE(vectorsEqual(visual->local_position, glm::vec3(anchor.center.x, 0.0f, anchor.center.z)));
    }
    EXPECT_EQ(registry.visualCount(), 1u);
}

TEST_F(AnchorRegistryTest, WorldTransformLaysQuadFlat) {
    scene::AnchorRegistry registry;
    registry.onAnchorAdded(makeSurface(1, glm::vec3(0.5f, 0.0f, 0.5f)));

    const glm::mat4 world = registry.getVisual(1)->worldTransform();

    // Quad normal (local +Z) points up after the -90 degree turn about X
    const glm::vec3 normal = glm::vec3(world * glm::vec4(0, 0, 1, 0));
    EXPECT_TRUE(vectorsEqual(normal, glm::vec3(0, 1, 0)));
    EXPECT_TRUE(vectorsEqual(glm::vec3(world[3]), glm::vec3(0.5f, -1.0f, 0.5f)));
}

TEST_F(AnchorRegistryTest, RemoveDiscardsVisual) {
    scene::AnchorRegistry registry;
    registry.onAnchorAdded(makeSurface(1));
    registry.onAnchorAdded(makeSurface(2));

    registry.onAnchorRemoved(makeSurface(1));

    EXPECT_EQ(registry.getVisual(1), nullptr);
    EXPECT_EQ(registry.getAnchor(1), nullptr);
    EXPECT_NE(registry.getVisual(2), nullptr);
    EXPECT_EQ(registry.visualCount(), 1u);
}

TEST_F(AnchorRegistryTest, UnknownUpdatesAndRemovalsAreIgnored) {
    scene::AnchorRegistry registry;
    registry.onAnchorUpdated(makeSurface(9));
    registry.onAnchorRemoved(makeSurface(9));

    EXPECT_EQ(registry.anchorCount(), 0u);
    EXPECT_EQ(registry.visualCount(), 0u);
}

// No visual may outlive its anchor, whatever the event order
TEST_F(AnchorRegistryTest, NoVisualWithoutAnchor) {
    scene::AnchorRegistry registry;
    std::uniform_int_distribution<int> id_dist(1, 6);
    std::uniform_int_distribution<int> op_dist(0, 2);

    for (int step = 0; step < 200; ++step) {
        const auto id = static_cast<tracking::AnchorId>(id_dist(rng_));
        switch (op_dist(rng_)) {
        case 0: registry.onAnchorAdded(makeSurface(id)); break;
        case 1: registry.onAnchorUpdated(makeSurface(id, glm::vec3(0.0f), glm::vec2(2.0f))); break;
        default: registry.onAnchorRemoved(makeSurface(id)); break;
        }

        for (const auto* visual : registry.getVisuals()) {
            ASSERT_NE(registry.getAnchor(visual->anchor), nullptr) << "Step " << step;
        }
        EXPECT_EQ(registry.visualCount(), registry.anchorCount());
    }
}

TEST_F(AnchorRegistryTest, MarkerAddNotifiesCallbackWithoutVisual) {
    scene::AnchorRegistry registry;
    std::vector<tracking::AnchorId> notified;
    registry.setMarkerAddedCallback([&](const tracking::SpatialAnchor& anchor) { notified.push_back(anchor.id); });

    std::string detected_image;
    auto handler = events::state::MarkerDetected::when([&](const auto& e) { detected_image = e.image_name; });

    registry.onAnchorAdded(makeMarker(5, "poster"));

    EXPECT_EQ(notified, std::vector<tracking::AnchorId>{5});
    EXPECT_EQ(detected_image, "poster");
    EXPECT_EQ(registry.anchorCount(), 1u);
    EXPECT_EQ(registry.visualCount(), 0u);

    event::bus().remove<events::state::MarkerDetected>(handler);
}

TEST_F(AnchorRegistryTest, ToggleFansOutToEveryVisual) {
    scene::AnchorRegistry registry;
    for (tracking::AnchorId id = 1; id <= 4; ++id) {
        registry.onAnchorAdded(makeSurface(id));
    }

    registry.setShowSurfaces(true);
    for (const auto* visual : registry.getVisuals()) {
        EXPECT_FALSE(visual->hidden);
    }

    // Visuals added later pick up the current flag
    registry.onAnchorAdded(makeSurface(5));
    EXPECT_FALSE(registry.getVisual(5)->hidden);

    registry.setShowSurfaces(false);
    for (const auto* visual : registry.getVisuals()) {
        EXPECT_TRUE(visual->hidden);
    }
    EXPECT_EQ(registry.visualCount(), 5u);
}

TEST_F(AnchorRegistryTest, ClearRemovesEverything) {
    scene::AnchorRegistry registry(0.25f, true);
    registry.onAnchorAdded(makeSurface(1));
    registry.onAnchorAdded(makeSurface(2));
    registry.onAnchorAdded(makeMarker(3, "poster"));

    EXPECT_EQ(registry.clear(), 2u);
    EXPECT_EQ(registry.anchorCount(), 0u);
    EXPECT_EQ(registry.visualCount(), 0u);
    EXPECT_TRUE(registry.showSurfaces());
    EXPECT_EQ(registry.clear(), 0u);
}
