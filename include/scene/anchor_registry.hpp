/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "tracking/tracking_types.hpp"
#include <cstddef>
#include <functional>
#include <glm/glm.hpp>
#include <map>
#include <utility>
#include <vector>

namespace arp::scene {

    // Translucent plane indicator drawn for a surface anchor. The quad is
    // modelled in its local XY plane and laid flat by a -90 degree turn about X.
    struct AnchorVisual {
        tracking::AnchorId anchor = tracking::INVALID_ANCHOR_ID;
        geometry::Pose anchor_pose;
        glm::vec3 local_position{0.0f}; // (center.x, 0, center.z)
        float width = 0.0f;
        float depth = 0.0f;
        float opacity = 0.25f;
        bool hidden = true;

        glm::mat4 worldTransform() const;
    };

    /**
     * @brief Live set of anchors reported by the tracking session
     *
     * Owns one AnchorVisual per surface anchor and keeps it in sync with every
     * update. Marker sightings are forwarded to the marker callback. Entries are
     * keyed by anchor id, nothing outside holds a reference into the maps.
     */
    class AnchorRegistry {
    public:
        using MarkerCallback = std::function<void(const tracking::SpatialAnchor&)>;

        AnchorRegistry(float surface_opacity = 0.25f, bool show_surfaces = false);
        ~AnchorRegistry() = default;

        // Delete copy operations
        AnchorRegistry(const AnchorRegistry&) = delete;
        AnchorRegistry& operator=(const AnchorRegistry&) = delete;

        // Tracking lifecycle
        void onAnchorAdded(const tracking::SpatialAnchor& anchor);
        void onAnchorUpdated(const tracking::SpatialAnchor& anchor);
        void onAnchorRemoved(const tracking::SpatialAnchor& anchor);

        void setMarkerAddedCallback(MarkerCallback callback) { marker_added_ = std::move(callback); }

        // Visibility of all plane indicators
        void setShowSurfaces(bool show);
        bool showSurfaces() const { return show_surfaces_; }

        // Drops every anchor and visual, returns the number of visuals removed
        size_t clear();

        // Direct queries
        size_t anchorCount() const { return anchors_.size(); }
        size_t visualCount() const { return visuals_.size(); }
        const tracking::SpatialAnchor* getAnchor(tracking::AnchorId id) const;
        const AnchorVisual* getVisual(tracking::AnchorId id) const;
        std::vector<const tracking::SpatialAnchor*> getAnchors() const;
        std::vector<const AnchorVisual*> getVisuals() const;

    private:
        void syncVisual(AnchorVisual& visual, const tracking::SpatialAnchor& anchor) const;

        std::map<tracking::AnchorId, tracking::SpatialAnchor> anchors_;
        std::map<tracking::AnchorId, AnchorVisual> visuals_;
        MarkerCallback marker_added_;
        float surface_opacity_;
        bool show_surfaces_;
    };

} // namespace arp::scene
