/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "geometry/pose.hpp"
#include "placement/placement_mode.hpp"
#include "scene/placed_object.hpp"
#include "tracking/tracking_types.hpp"
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace arp::placement {

    struct ModelTemplate {
        std::string name;
    };

    // Everything a placement decision depends on besides the triggering event
    struct PlacementState {
        PlacementMode mode = PlacementMode::FreeForm;
        std::optional<ModelTemplate> model;
        std::optional<glm::vec2> last_point; // Last committed surface point of the current gesture
    };

    // Events, one per placement mode
    struct FreeFormRequest {
        std::optional<geometry::Pose> camera_pose;
    };

    struct SurfaceRequest {
        glm::vec2 screen_point{0.0f};
        std::vector<tracking::HitResult> hits; // Nearest first
    };

    struct MarkerSighting {
        tracking::AnchorId anchor = tracking::INVALID_ANCHOR_ID;
    };

    using PlacementEvent = std::variant<FreeFormRequest, SurfaceRequest, MarkerSighting>;

    struct PlacementOutcome {
        std::optional<scene::PlacedObject> object; // Uncommitted, id is still invalid
        PlacementState state;
    };

    struct StrategyOptions {
        float free_form_distance = 0.2f;
    };

    // Each arm maps (state, event) to (object?, new state) without side effects.
    // An event whose arm does not match state.mode produces no object.
    PlacementOutcome placeFreeForm(const PlacementState& state,
                                   const FreeFormRequest& request,
                                   const StrategyOptions& options = {});

    PlacementOutcome placeOnSurface(const PlacementState& state,
                                    const SurfaceRequest& request);

    PlacementOutcome placeOnMarker(const PlacementState& state,
                                   const MarkerSighting& sighting);

    PlacementOutcome place(const PlacementState& state,
                           const PlacementEvent& event,
                           const StrategyOptions& options = {});

} // namespace arp::placement
