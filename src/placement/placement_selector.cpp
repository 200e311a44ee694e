/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "placement/placement_selector.hpp"
#include "core/events.hpp"
#include "core/logger.hpp"

namespace arp::placement {

    PlacementSelector::PlacementSelector(scene::ObjectLedger& ledger,
                                         const tracking::ITrackingSession& tracking,
                                         const param::PlacementParameters& params)
        : ledger_(ledger),
          tracking_(tracking),
          options_{.free_form_distance = params.free_form_distance},
          drag_threshold_(params.drag_threshold) {
        state_.mode = params.initial_mode;
    }

    std::optional<scene::ObjectId> PlacementSelector::commit(PlacementOutcome outcome) {
        state_ = std::move(outcome.state);
        if (!outcome.object) {
            return std::nullopt;
        }
        return ledger_.commit(std::move(*outcome.object));
    }

    std::optional<scene::ObjectId> PlacementSelector::placeFreeForm(const std::optional<geometry::Pose>& camera_pose) {
        return place(FreeFormRequest{.camera_pose = camera_pose});
    }

    std::optional<scene::ObjectId> PlacementSelector::placeOnSurface(const glm::vec2& screen_point) {
        if (state_.mode != PlacementMode::Surface || !state_.model) {
            return std::nullopt;
        }
        return place(SurfaceRequest{
            .screen_point = screen_point,
            .hits = tracking_.hitTest(screen_point)});
    }

    std::optional<scene::ObjectId> PlacementSelector::placeOnMarker(tracking::AnchorId anchor) {
        return place(MarkerSighting{.anchor = anchor});
    }

    std::optional<scene::ObjectId> PlacementSelector::place(const PlacementEvent& event) {
        return commit(placement::place(state_, event, options_));
    }

    void PlacementSelector::selectModel(const std::string& name) {
        state_.model = ModelTemplate{.name = name};
        LOG_INFO("Selected model '{}'", name);
        events::state::ModelSelected{.name = name}.emit();
    }

    bool PlacementSelector::setMode(PlacementMode mode) {
        if (state_.mode == mode) {
            return false;
        }

        const PlacementMode old_mode = state_.mode;
        state_.mode = mode;
        state_.last_point.reset();

        LOG_INFO("Placement mode changed: {} -> {}", to_string(old_mode), to_string(mode));
        events::state::PlacementModeChanged{
            .old_mode = old_mode,
            .new_mode = mode}
            .emit();

        if (mode_changed_) {
            mode_changed_(old_mode, mode);
        }
        return true;
    }

} // namespace arp::placement
