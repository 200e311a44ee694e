/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "tracking/tracking_session.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace arp::tracking {

    /**
     * @brief Scripted tracking backend
     *
     * Stands in for the sensing subsystem: the host feeds it camera poses,
     * plane observations and marker sightings, and it reports the resulting
     * anchor lifecycle through the same callbacks a device backend would use.
     * Hit tests cast a pinhole ray from the current camera through the
     * simulated viewport and intersect it with the extent of each plane.
     */
    class SimulatedTrackingSession : public ITrackingSession {
    public:
        explicit SimulatedTrackingSession(const param::SimulationParameters& params = {});
        ~SimulatedTrackingSession() override = default;

        // ITrackingSession
        std::optional<geometry::Pose> currentCameraPose() const override;
        std::vector<HitResult> hitTest(const glm::vec2& screen_point) const override;
        void run(const DetectionConfig& config, bool remove_existing_anchors) override;
        void pause() override;
        void setAnchorCallbacks(AnchorCallbacks callbacks) override;

        // Camera
        void setCameraPose(const geometry::Pose& pose) { camera_pose_ = pose; }
        void clearCameraPose() { camera_pose_.reset(); }

        // Observations. Ignored unless the session runs with the matching feature.
        std::optional<AnchorId> addPlane(const geometry::Pose& pose, const glm::vec3& center, const glm::vec2& extent);
        bool updatePlane(AnchorId id, const glm::vec3& center, const glm::vec2& extent);
        std::optional<AnchorId> detectMarker(const std::string& image_name, const geometry::Pose& pose);

        // Tracking lost for an anchor
        bool removeAnchor(AnchorId id);

        bool isRunning() const { return running_; }
        const DetectionConfig& activeConfig() const { return config_; }
        size_t runCount() const { return run_count_; }
        size_t anchorCount() const { return anchors_.size(); }

    private:
        void notify(const AnchorCallback& callback, const SpatialAnchor& anchor) const;
        glm::vec3 rayDirection(const glm::vec2& screen_point) const;

        param::SimulationParameters params_;
        AnchorCallbacks callbacks_;
        DetectionConfig config_;
        std::optional<geometry::Pose> camera_pose_;
        std::map<AnchorId, SpatialAnchor> anchors_;
        AnchorId next_id_ = 1;
        size_t run_count_ = 0;
        bool running_ = false;
    };

} // namespace arp::tracking
