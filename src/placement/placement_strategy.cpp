/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "placement/placement_strategy.hpp"
#include "core/logger.hpp"
#include <type_traits>
#include <utility>

namespace arp::placement {

    namespace {
        scene::PlacedObject makeObject(const PlacementState& state, PlacementMode mode) {
            scene::PlacedObject object;
            object.model = state.model->name;
            object.mode = mode;
            return object;
        }
    } // namespace

    PlacementOutcome placeFreeForm(const PlacementState& state,
                                   const FreeFormRequest& request,
                                   const StrategyOptions& options) {
        PlacementOutcome outcome{.object = std::nullopt, .state = state};

        if (state.mode != PlacementMode::FreeForm) {
            return outcome;
        }
        if (!state.model) {
            LOG_TRACE("Free-form placement skipped, no model selected");
            return outcome;
        }
        if (!request.camera_pose) {
            LOG_TRACE("Free-form placement skipped, no camera pose");
            return outcome;
        }

        scene::PlacedObject object = makeObject(state, PlacementMode::FreeForm);
        object.transform = request.camera_pose->translatedAlongForward(options.free_form_distance);
        outcome.object = std::move(object);
        return outcome;
    }

    PlacementOutcome placeOnSurface(const PlacementState& state,
                                    const SurfaceRequest& request) {
        PlacementOutcome outcome{.object = std::nullopt, .state = state};

        if (state.mode != PlacementMode::Surface) {
            return outcome;
        }
        if (!state.model) {
            LOG_TRACE("Surface placement skipped, no model selected");
            return outcome;
        }
        if (request.hits.empty()) {
            LOG_TRACE("Surface placement skipped, no surface at ({}, {})",
                      request.screen_point.x, request.screen_point.y);
            return outcome;
        }

        // Position only, the orientation stays at identity
        scene::PlacedObject object = makeObject(state, PlacementMode::Surface);
        object.transform = geometry::Pose(request.hits.front().world_position);

        outcome.object = std::move(object);
        outcome.state.last_point = request.screen_point;
        return outcome;
    }

    PlacementOutcome placeOnMarker(const PlacementState& state,
                                   const MarkerSighting& sighting) {
        PlacementOutcome outcome{.object = std::nullopt, .state = state};

        if (state.mode != PlacementMode::Marker) {
            return outcome;
        }
        if (!state.model) {
            // Not retried if a model is selected later
            LOG_DEBUG("Marker anchor {} detected with no model selected", sighting.anchor);
            return outcome;
        }

        // Child of the marker anchor at its origin
        scene::PlacedObject object = makeObject(state, PlacementMode::Marker);
        object.transform = geometry::Pose();
        object.anchor = sighting.anchor;

        outcome.object = std::move(object);
        return outcome;
    }

    PlacementOutcome place(const PlacementState& state,
                           const PlacementEvent& event,
                           const StrategyOptions& options) {
        return std::visit(
            [&](const auto& e) -> PlacementOutcome {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, FreeFormRequest>) {
                    return placeFreeForm(state, e, options);
                } else if constexpr (std::is_same_v<T, SurfaceRequest>) {
                    return placeOnSurface(state, e);
                } else {
                    return placeOnMarker(state, e);
                }
            },
            event);
    }

} // namespace arp::placement
