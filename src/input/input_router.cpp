/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "input/input_router.hpp"
#include "core/logger.hpp"

namespace arp {

    InputRouter::InputRouter(placement::PlacementSelector& selector)
        : selector_(selector) {
    }

    void InputRouter::touchBegan(const glm::vec2& point, const std::optional<geometry::Pose>& camera_pose) {
        gesture_active_ = true;
        selector_.clearLastCommittedPoint();

        switch (selector_.mode()) {
        case PlacementMode::FreeForm:
            selector_.placeFreeForm(camera_pose);
            break;
        case PlacementMode::Surface:
            selector_.placeOnSurface(point);
            break;
        case PlacementMode::Marker:
            // Marker placement follows anchor detection, not touches
            break;
        }
    }

    void InputRouter::touchMoved(const glm::vec2& point) {
        if (!gesture_active_ || selector_.mode() != PlacementMode::Surface) {
            return;
        }

        const auto& last_point = selector_.lastCommittedPoint();
        if (!last_point) {
            return;
        }

        const float distance = glm::distance(*last_point, point);
        if (distance < selector_.dragThreshold()) {
            return;
        }

        LOG_TRACE("Drag moved {:.1f} from ({}, {}), placing again", distance, last_point->x, last_point->y);
        selector_.placeOnSurface(point);
    }

    void InputRouter::touchEnded() {
        gesture_active_ = false;
        selector_.clearLastCommittedPoint();
    }

    void InputRouter::handleTouch(const TouchEvent& event) {
        switch (event.phase) {
        case TouchPhase::Began:
            touchBegan(event.position, event.camera_pose);
            break;
        case TouchPhase::Moved:
            touchMoved(event.position);
            break;
        case TouchPhase::Ended:
        case TouchPhase::Cancelled:
            touchEnded();
            break;
        }
    }

} // namespace arp
