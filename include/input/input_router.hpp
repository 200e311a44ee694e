/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "input/input_types.hpp"
#include "placement/placement_selector.hpp"

namespace arp {

    /**
     * @brief Turns touch gestures into placement calls
     *
     * FreeForm places on touch down, Surface places on touch down and again
     * whenever a drag has moved at least the drag threshold away from the last
     * committed point, Marker ignores touches.
     */
    class InputRouter {
    public:
        explicit InputRouter(placement::PlacementSelector& selector);

        void touchBegan(const glm::vec2& point, const std::optional<geometry::Pose>& camera_pose);
        void touchMoved(const glm::vec2& point);
        void touchEnded();

        void handleTouch(const TouchEvent& event);

        bool isGestureActive() const { return gesture_active_; }

    private:
        placement::PlacementSelector& selector_;
        bool gesture_active_ = false;
    };

} // namespace arp
