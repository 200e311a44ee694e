/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include "core/event_bus.hpp"
#include "placement/placement_mode.hpp"
#include "scene/placed_object.hpp"
#include "tracking/tracking_types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace arp {

// Declares an event struct bound to arp::event::bus()
#define EVENT(Name, ...)                                           \
    struct Name {                                                  \
        using event_id = Name;                                     \
        __VA_ARGS__                                                \
                                                                   \
        void emit() const {                                        \
            ::arp::event::bus().emit(*this);                       \
        }                                                          \
                                                                   \
        static auto when(auto&& handler) {                         \
            return ::arp::event::bus().when<Name>(                 \
                std::forward<decltype(handler)>(handler));         \
        }                                                          \
                                                                   \
        [[nodiscard]] static auto subscribe(auto&& handler) {      \
            return ::arp::event::bus().subscribe<Name>(            \
                std::forward<decltype(handler)>(handler));         \
        }                                                          \
    }

    namespace events {

        // ============================================================================
        // Commands - UI requests
        // ============================================================================
        namespace cmd {
            EVENT(SelectModel, std::string name;);
            EVENT(SetPlacementMode, PlacementMode mode;);
            EVENT(UndoLastObject, );
            EVENT(ResetScene, );
            EVENT(TogglePlaneVisualization, );
        } // namespace cmd

        // ============================================================================
        // State - Notifications about what has happened (broadcasts)
        // ============================================================================
        namespace state {
            EVENT(ModelSelected, std::string name;);
            EVENT(PlacementModeChanged, PlacementMode old_mode; PlacementMode new_mode;);

            // Ledger
            EVENT(ObjectPlaced,
                  scene::ObjectId id;
                  std::string model;
                  PlacementMode mode;
                  std::optional<tracking::AnchorId> anchor;);
            EVENT(ObjectRemoved, scene::ObjectId id;);
            EVENT(SceneReset, size_t objects_removed; size_t visuals_removed;);

            // Anchor registry
            EVENT(AnchorVisualAdded, tracking::AnchorId anchor; float width; float depth; bool hidden;);
            EVENT(AnchorVisualUpdated, tracking::AnchorId anchor; float width; float depth;);
            EVENT(AnchorVisualRemoved, tracking::AnchorId anchor;);
            EVENT(MarkerDetected, tracking::AnchorId anchor; std::string image_name;);
            EVENT(SurfacesVisibilityChanged, bool visible; size_t visuals;);

            // Tracking session
            EVENT(SessionReconfigured,
                  PlacementMode mode;
                  bool plane_detection;
                  std::vector<std::string> marker_images;
                  bool anchors_removed;);
        } // namespace state
    }     // namespace events

} // namespace arp
