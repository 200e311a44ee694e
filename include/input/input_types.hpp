/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "geometry/pose.hpp"
#include <cstdint>
#include <glm/glm.hpp>
#include <optional>

namespace arp {

    enum class TouchPhase : uint8_t {
        Began,
        Moved,
        Ended,
        Cancelled
    };

    // Single-pointer touch in view coordinates (origin top-left)
    struct TouchEvent {
        TouchPhase phase = TouchPhase::Began;
        glm::vec2 position{0.0f};
        std::optional<geometry::Pose> camera_pose; // Sampled at Began only
    };

} // namespace arp
