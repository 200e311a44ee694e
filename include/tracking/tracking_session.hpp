/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "geometry/pose.hpp"
#include "tracking/tracking_types.hpp"
#include <glm/glm.hpp>
#include <optional>
#include <vector>

namespace arp::tracking {

    /**
     * @brief Boundary to the visual tracking subsystem
     *
     * Implementations own camera pose estimation, plane and marker detection.
     * Anchor lifecycle notifications are delivered through the callbacks set
     * with setAnchorCallbacks(), always on the control thread.
     */
    class ITrackingSession {
    public:
        virtual ~ITrackingSession() = default;

        /**
         * @brief Latest camera pose
         * @return Pose, or nullopt while tracking has not produced a frame
         */
        virtual std::optional<geometry::Pose> currentCameraPose() const = 0;

        /**
         * @brief Intersect a screen point with the known surfaces
         * @param screen_point Point in view coordinates (origin top-left)
         * @return Hits ordered nearest first, possibly empty
         */
        virtual std::vector<HitResult> hitTest(const glm::vec2& screen_point) const = 0;

        /**
         * @brief (Re)start tracking with the given feature set
         * @param config Detection features to enable
         * @param remove_existing_anchors Drop every anchor tracked so far
         */
        virtual void run(const DetectionConfig& config, bool remove_existing_anchors) = 0;

        virtual void pause() = 0;

        virtual void setAnchorCallbacks(AnchorCallbacks callbacks) = 0;
    };

} // namespace arp::tracking
