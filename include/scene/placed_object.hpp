/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "geometry/pose.hpp"
#include "placement/placement_mode.hpp"
#include "tracking/tracking_types.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace arp::scene {

    using ObjectId = std::uint64_t;
    constexpr ObjectId INVALID_OBJECT_ID = 0;

    struct PlacedObject {
        ObjectId id = INVALID_OBJECT_ID;
        std::string model;

        // World transform when anchor is empty, otherwise relative to the anchor
        geometry::Pose transform;
        std::optional<tracking::AnchorId> anchor;

        PlacementMode mode = PlacementMode::FreeForm;

        bool isAttached() const { return anchor.has_value(); }
    };

} // namespace arp::scene
