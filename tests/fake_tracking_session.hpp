#pragma once

#include "tracking/tracking_session.hpp"
#include <optional>
#include <utility>
#include <vector>

// Scripted tracking boundary: fixed camera pose and hit list, records run() calls
class FakeTrackingSession : public arp::tracking::ITrackingSession {
public:
    struct RunCall {
        arp::tracking::DetectionConfig config;
        bool remove_existing_anchors;
    };

    std::optional<arp::geometry::Pose> currentCameraPose() const override { return camera_pose; }

    std::vector<arp::tracking::HitResult> hitTest(const glm::vec2& screen_point) const override {
        hit_test_points.push_back(screen_point);
        return hits;
    }

    void run(const arp::tracking::DetectionConfig& config, bool remove_existing_anchors) override {
        runs.push_back({config, remove_existing_anchors});
    }

    void pause() override { ++pause_count; }

    void setAnchorCallbacks(arp::tracking::AnchorCallbacks cb) override { callbacks = std::move(cb); }

    // Place a single hit at the given world position
    void setHit(const glm::vec3& position) {
        hits = {arp::tracking::HitResult{.world_position = position, .distance = 1.0f, .anchor = 1}};
    }

    std::optional<arp::geometry::Pose> camera_pose;
    std::vector<arp::tracking::HitResult> hits;
    mutable std::vector<glm::vec2> hit_test_points;
    std::vector<RunCall> runs;
    int pause_count = 0;
    arp::tracking::AnchorCallbacks callbacks;
};
