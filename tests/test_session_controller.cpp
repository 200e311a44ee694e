#include "core/events.hpp"
#include "fake_tracking_session.hpp"
#include "session/session_controller.hpp"
#include <gtest/gtest.h>

using namespace arp;

class SessionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        params_.reference_image_group = "AR Resources";
        params_.reference_images = {"poster", "book_cover"};
    }

    void populate() {
        tracking::SpatialAnchor plane;
        plane.id = 1;
        plane.kind = tracking::AnchorKind::Surface;
        plane.extent = glm::vec2(1.0f);
        registry_.onAnchorAdded(plane);

        scene::PlacedObject object;
        object.model = "cup";
        ledger_.commit(object);
        ledger_.commit(object);
    }

    FakeTrackingSession tracking_;
    scene::AnchorRegistry registry_;
    scene::ObjectLedger ledger_;
    param::PlacementParameters params_;
};

TEST_F(SessionControllerTest, PlaneDetectionAlwaysOn) {
    for (auto mode : {PlacementMode::FreeForm, PlacementMode::Surface, PlacementMode::Marker}) {
        auto config = session::SessionController::detectionConfigFor(mode, params_);
        EXPECT_TRUE(config.planesEnabled()) << to_string(mode);
        EXPECT_EQ(config.plane_detection, tracking::PlaneDetection::Horizontal);
    }
}

TEST_F(SessionControllerTest, MarkerImagesOnlyInMarkerMode) {
    auto marker = session::SessionController::detectionConfigFor(PlacementMode::Marker, params_);
    EXPECT_TRUE(marker.markersEnabled());
    EXPECT_EQ(marker.image_group, "AR Resources");
    EXPECT_EQ(marker.detection_images, params_.reference_images);

    for (auto mode : {PlacementMode::FreeForm, PlacementMode::Surface}) {
        auto config = session::SessionController::detectionConfigFor(mode, params_);
        EXPECT_FALSE(config.markersEnabled());
        EXPECT_TRUE(config.image_group.empty());
    }
}

TEST_F(SessionControllerTest, ReconfigureWithClearEmptiesRegistryAndLedger) {
    session::SessionController controller(tracking_, registry_, ledger_, params_);
    populate();

    size_t reported_objects = 0;
    size_t reported_visuals = 0;
    auto handler = events::state::SceneReset::when([&](const auto& e) {
        reported_objects = e.objects_removed;
        reported_visuals = e.visuals_removed;
    });

    controller.reconfigure(PlacementMode::Surface, true);

    EXPECT_TRUE(ledger_.empty());
    EXPECT_EQ(registry_.visualCount(), 0u);
    EXPECT_EQ(registry_.anchorCount(), 0u);
    EXPECT_EQ(reported_objects, 2u);
    EXPECT_EQ(reported_visuals, 1u);

    ASSERT_EQ(tracking_.runs.size(), 1u);
    EXPECT_TRUE(tracking_.runs[0].remove_existing_anchors);
    EXPECT_FALSE(tracking_.runs[0].config.markersEnabled());

    event::bus().remove<events::state::SceneReset>(handler);
}

TEST_F(SessionControllerTest, ReconfigureWithoutClearKeepsEverything) {
    session::SessionController controller(tracking_, registry_, ledger_, params_);
    populate();

    bool anchors_removed = true;
    auto handler = events::state::SessionReconfigured::when([&](const auto& e) { anchors_removed = e.anchors_removed; });

    controller.reconfigure(PlacementMode::Marker, false);

    EXPECT_EQ(ledger_.size(), 2u);
    EXPECT_EQ(registry_.visualCount(), 1u);
    ASSERT_EQ(tracking_.runs.size(), 1u);
    EXPECT_FALSE(tracking_.runs[0].remove_existing_anchors);
    EXPECT_TRUE(tracking_.runs[0].config.markersEnabled());
    EXPECT_EQ(controller.currentConfig().detection_images, params_.reference_images);
    EXPECT_FALSE(anchors_removed);

    event::bus().remove<events::state::SessionReconfigured>(handler);
}

TEST_F(SessionControllerTest, ClearOnEmptySceneIsHarmless) {
    session::SessionController controller(tracking_, registry_, ledger_, params_);
    controller.reconfigure(PlacementMode::FreeForm, true);
    controller.reconfigure(PlacementMode::FreeForm, true);

    EXPECT_TRUE(ledger_.empty());
    EXPECT_EQ(tracking_.runs.size(), 2u);
}

TEST_F(SessionControllerTest, PauseForwardsToTracking) {
    session::SessionController controller(tracking_, registry_, ledger_, params_);
    controller.pause();
    EXPECT_EQ(tracking_.pause_count, 1);
}
