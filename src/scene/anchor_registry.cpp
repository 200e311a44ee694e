/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scene/anchor_registry.hpp"
#include "core/events.hpp"
#include "core/logger.hpp"
#include <glm/gtc/matrix_transform.hpp>
#include <vector>

namespace arp::scene {

    glm::mat4 AnchorVisual::worldTransform() const {
        glm::mat4 transform = anchor_pose.toMat4();
        transform = glm::translate(transform, local_position);
        return glm::rotate(transform, glm::radians(-90.0f), glm::vec3(1.0f, 0.0f, 0.0f));
    }

    AnchorRegistry::AnchorRegistry(float surface_opacity, bool show_surfaces)
        : surface_opacity_(surface_opacity),
          show_surfaces_(show_surfaces) {
    }

    void AnchorRegistry::syncVisual(AnchorVisual& visual, const tracking::SpatialAnchor& anchor) const {
        visual.anchor_pose = anchor.pose;
        visual.local_position = glm::vec3(anchor.center.x, 0.0f, anchor.center.z);
        visual.width = anchor.extent.x;
        visual.depth = anchor.extent.y;
    }

    void AnchorRegistry::onAnchorAdded(const tracking::SpatialAnchor& anchor) {
        if (anchors_.contains(anchor.id)) {
            LOG_DEBUG("Anchor {} already registered, treating add as update", anchor.id);
            onAnchorUpdated(anchor);
            return;
        }

        anchors_[anchor.id] = anchor;

        if (anchor.isSurface()) {
            AnchorVisual visual;
            visual.anchor = anchor.id;
            visual.opacity = surface_opacity_;
            visual.hidden = !show_surfaces_;
            syncVisual(visual, anchor);
            visuals_[anchor.id] = visual;

            LOG_DEBUG("Surface anchor {} added ({}x{})", anchor.id, visual.width, visual.depth);
            events::state::AnchorVisualAdded{
                .anchor = anchor.id,
                .width = visual.width,
                .depth = visual.depth,
                .hidden = visual.hidden}
                .emit();
            return;
        }

        LOG_DEBUG("Marker anchor {} added for image '{}'", anchor.id, anchor.image_name);
        events::state::MarkerDetected{
            .anchor = anchor.id,
            .image_name = anchor.image_name}
            .emit();

        // A handler may have reset the registry
        if (marker_added_ && anchors_.contains(anchor.id)) {
            marker_added_(anchor);
        }
    }

    void AnchorRegistry::onAnchorUpdated(const tracking::SpatialAnchor& anchor) {
        auto it = anchors_.find(anchor.id);
        if (it == anchors_.end()) {
            LOG_DEBUG("Update for unknown anchor {} ignored", anchor.id);
            return;
        }
        it->second = anchor;

        auto visual_it = visuals_.find(anchor.id);
        if (visual_it == visuals_.end()) {
            return;
        }

        syncVisual(visual_it->second, anchor);
        LOG_TRACE("Surface anchor {} resized to {}x{}", anchor.id, visual_it->second.width, visual_it->second.depth);
        events::state::AnchorVisualUpdated{
            .anchor = anchor.id,
            .width = visual_it->second.width,
            .depth = visual_it->second.depth}
            .emit();
    }

    void AnchorRegistry::onAnchorRemoved(const tracking::SpatialAnchor& anchor) {
        if (anchors_.erase(anchor.id) == 0) {
            LOG_DEBUG("Removal of unknown anchor {} ignored", anchor.id);
            return;
        }

        if (visuals_.erase(anchor.id) > 0) {
            events::state::AnchorVisualRemoved{.anchor = anchor.id}.emit();
        }
        LOG_DEBUG("{} anchor {} removed", tracking::to_string(anchor.kind), anchor.id);
    }

    void AnchorRegistry::setShowSurfaces(bool show) {
        show_surfaces_ = show;
        for (auto& [id, visual] : visuals_) {
            visual.hidden = !show;
        }

        LOG_INFO("Plane indicators {}", show ? "shown" : "hidden");
        events::state::SurfacesVisibilityChanged{
            .visible = show,
            .visuals = visuals_.size()}
            .emit();
    }

    size_t AnchorRegistry::clear() {
        std::vector<tracking::AnchorId> removed;
        removed.reserve(visuals_.size());
        for (const auto& [id, visual] : visuals_) {
            removed.push_back(id);
        }
        visuals_.clear();
        anchors_.clear();

        for (const tracking::AnchorId id : removed) {
            events::state::AnchorVisualRemoved{.anchor = id}.emit();
        }
        return removed.size();
    }

    const tracking::SpatialAnchor* AnchorRegistry::getAnchor(tracking::AnchorId id) const {
        auto it = anchors_.find(id);
        return it != anchors_.end() ? &it->second : nullptr;
    }

    const AnchorVisual* AnchorRegistry::getVisual(tracking::AnchorId id) const {
        auto it = visuals_.find(id);
        return it != visuals_.end() ? &it->second : nullptr;
    }

    std::vector<const tracking::SpatialAnchor*> AnchorRegistry::getAnchors() const {
        std::vector<const tracking::SpatialAnchor*> result;
        result.reserve(anchors_.size());
        for (const auto& [id, anchor] : anchors_) {
            result.push_back(&anchor);
        }
        return result;
    }

    std::vector<const AnchorVisual*> AnchorRegistry::getVisuals() const {
        std::vector<const AnchorVisual*> result;
        result.reserve(visuals_.size());
        for (const auto& [id, visual] : visuals_) {
            result.push_back(&visual);
        }
        return result;
    }

} // namespace arp::scene
