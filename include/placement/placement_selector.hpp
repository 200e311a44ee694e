/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "placement/placement_strategy.hpp"
#include "scene/object_ledger.hpp"
#include "tracking/tracking_session.hpp"
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace arp::placement {

    /**
     * @brief Holds the active placement mode and selected model, and routes
     *        placement events to the matching strategy
     *
     * Results are committed to the ledger. Hit tests and camera poses come from
     * the tracking session. Missing preconditions (no model, no pose, no hit)
     * leave everything unchanged.
     */
    class PlacementSelector {
    public:
        using ModeChangedCallback = std::function<void(PlacementMode old_mode, PlacementMode new_mode)>;

        PlacementSelector(scene::ObjectLedger& ledger,
                          const tracking::ITrackingSession& tracking,
                          const param::PlacementParameters& params = {});

        // Delete copy operations
        PlacementSelector(const PlacementSelector&) = delete;
        PlacementSelector& operator=(const PlacementSelector&) = delete;

        // Placement, each returns the committed object id
        std::optional<scene::ObjectId> placeFreeForm(const std::optional<geometry::Pose>& camera_pose);
        std::optional<scene::ObjectId> placeOnSurface(const glm::vec2& screen_point);
        std::optional<scene::ObjectId> placeOnMarker(tracking::AnchorId anchor);
        std::optional<scene::ObjectId> place(const PlacementEvent& event);

        // Model selection
        void selectModel(const std::string& name);
        const std::optional<ModelTemplate>& selectedModel() const { return state_.model; }

        // Mode management. Returns false when the mode is already active.
        PlacementMode mode() const { return state_.mode; }
        bool setMode(PlacementMode mode);
        void setModeChangedCallback(ModeChangedCallback callback) { mode_changed_ = std::move(callback); }

        // Drag throttle
        const std::optional<glm::vec2>& lastCommittedPoint() const { return state_.last_point; }
        void clearLastCommittedPoint() { state_.last_point.reset(); }
        float dragThreshold() const { return drag_threshold_; }

    private:
        std::optional<scene::ObjectId> commit(PlacementOutcome outcome);

        scene::ObjectLedger& ledger_;
        const tracking::ITrackingSession& tracking_;
        PlacementState state_;
        StrategyOptions options_;
        float drag_threshold_;
        ModeChangedCallback mode_changed_;
    };

} // namespace arp::placement
