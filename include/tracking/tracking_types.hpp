/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "geometry/pose.hpp"
#include <cstdint>
#include <functional>
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace arp::tracking {

    // Identity handed out by the tracking backend. Never reused within a session.
    using AnchorId = std::uint64_t;
    constexpr AnchorId INVALID_ANCHOR_ID = 0;

    enum class AnchorKind : uint8_t {
        Surface,
        Marker
    };

    struct SpatialAnchor {
        AnchorId id = INVALID_ANCHOR_ID;
        AnchorKind kind = AnchorKind::Surface;
        geometry::Pose pose;

        // Surface only: plane center relative to the anchor pose, and its
        // width (x) and depth (z) extent.
        glm::vec3 center{0.0f};
        glm::vec2 extent{0.0f};

        // Marker only: name of the reference image that was recognized
        std::string image_name;

        bool isSurface() const { return kind == AnchorKind::Surface; }
        bool isMarker() const { return kind == AnchorKind::Marker; }
    };

    struct HitResult {
        glm::vec3 world_position{0.0f};
        float distance = 0.0f; // Along the camera ray
        AnchorId anchor = INVALID_ANCHOR_ID;
    };

    enum class PlaneDetection : uint8_t {
        None,
        Horizontal
    };

    // Feature set the tracking session runs with
    struct DetectionConfig {
        PlaneDetection plane_detection = PlaneDetection::Horizontal;
        std::string image_group;                   // Reference image group name, empty when off
        std::vector<std::string> detection_images; // Images inside the active group

        bool markersEnabled() const { return !detection_images.empty(); }
        bool planesEnabled() const { return plane_detection != PlaneDetection::None; }
    };

    using AnchorCallback = std::function<void(const SpatialAnchor&)>;

    struct AnchorCallbacks {
        AnchorCallback on_added;
        AnchorCallback on_updated;
        AnchorCallback on_removed;
    };

    const char* to_string(AnchorKind kind);

} // namespace arp::tracking
