/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "tracking/simulated_tracking_session.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace arp::tracking {

    namespace {
        constexpr float RAY_EPSILON = 1e-6f;
    } // namespace

    SimulatedTrackingSession::SimulatedTrackingSession(const param::SimulationParameters& params)
        : params_(params) {
    }

    std::optional<geometry::Pose> SimulatedTrackingSession::currentCameraPose() const {
        if (!running_) {
            return std::nullopt;
        }
        return camera_pose_;
    }

    glm::vec3 SimulatedTrackingSession::rayDirection(const glm::vec2& screen_point) const {
        const float width = static_cast<float>(params_.viewport_width);
        const float height = static_cast<float>(params_.viewport_height);

        // View coordinates have their origin top-left with y pointing down
        const float ndc_x = 2.0f * screen_point.x / width - 1.0f;
        const float ndc_y = 1.0f - 2.0f * screen_point.y / height;

        const float tan_half_fov = std::tan(glm::radians(params_.vertical_fov) * 0.5f);
        const float aspect = width / height;

        return glm::normalize(glm::vec3(ndc_x * tan_half_fov * aspect, ndc_y * tan_half_fov, -1.0f));
    }

    std::vector<HitResult> SimulatedTrackingSession::hitTest(const glm::vec2& screen_point) const {
        std::vector<HitResult> hits;

        if (!running_ || !camera_pose_) {
            return hits;
        }
        if (!std::isfinite(screen_point.x) || !std::isfinite(screen_point.y)) {
            LOG_DEBUG("Hit test ignored, screen point is not finite");
            return hits;
        }

        const glm::vec3 origin = camera_pose_->getPosition();
        const glm::vec3 direction = camera_pose_->transformVector(rayDirection(screen_point));

        for (const auto& [id, anchor] : anchors_) {
            if (!anchor.isSurface()) {
                continue;
            }

            // Intersect in the plane's local frame, where the surface is y = 0
            const geometry::Pose to_local = anchor.pose.inv();
            const glm::vec3 local_origin = to_local.transformPoint(origin);
            const glm::vec3 local_direction = to_local.transformVector(direction);

            if (std::abs(local_direction.y) < RAY_EPSILON) {
                continue;
            }

            const float t = -local_origin.y / local_direction.y;
            if (!std::isfinite(t) || t <= 0.0f) {
                continue;
            }

            const glm::vec3 local_hit = local_origin + t * local_direction;
            const glm::vec2 half_extent = anchor.extent * 0.5f;
            // Written as "inside" tests so NaN coordinates miss
            if (!(std::abs(local_hit.x - anchor.center.x) <= half_extent.x) ||
                !(std::abs(local_hit.z - anchor.center.z) <= half_extent.y)) {
                continue;
            }

            hits.push_back(HitResult{
                .world_position = anchor.pose.transformPoint(local_hit),
                .distance = t,
                .anchor = id});
        }

        std::sort(hits.begin(), hits.end(), [](const HitResult& a, const HitResult& b) {
            return a.distance < b.distance;
        });

        LOG_TRACE("Hit test at ({}, {}) produced {} hits", screen_point.x, screen_point.y, hits.size());
        return hits;
    }

    void SimulatedTrackingSession::run(const DetectionConfig& config, bool remove_existing_anchors) {
        config_ = config;
        running_ = true;
        ++run_count_;

        if (remove_existing_anchors && !anchors_.empty()) {
            LOG_DEBUG("Dropping {} tracked anchors", anchors_.size());
            anchors_.clear();
        }

        LOG_INFO("Tracking running: planes={}, marker images={} (run #{})",
                 config_.planesEnabled() ? "horizontal" : "off",
                 config_.detection_images.size(),
                 run_count_);
    }

    void SimulatedTrackingSession::pause() {
        if (!running_) {
            return;
        }
        running_ = false;
        LOG_INFO("Tracking paused");
    }

    void SimulatedTrackingSession::setAnchorCallbacks(AnchorCallbacks callbacks) {
        callbacks_ = std::move(callbacks);
    }

    void SimulatedTrackingSession::notify(const AnchorCallback& callback, const SpatialAnchor& anchor) const {
        if (callback) {
            callback(anchor);
        }
    }

    std::optional<AnchorId> SimulatedTrackingSession::addPlane(const geometry::Pose& pose,
                                                               const glm::vec3& center,
                                                               const glm::vec2& extent) {
        if (!running_ || !config_.planesEnabled()) {
            LOG_DEBUG("Plane observation ignored, plane detection is not running");
            return std::nullopt;
        }

        SpatialAnchor anchor;
        anchor.id = next_id_++;
        anchor.kind = AnchorKind::Surface;
        anchor.pose = pose;
        anchor.center = center;
        anchor.extent = extent;

        anchors_[anchor.id] = anchor;
        LOG_DEBUG("Plane {} detected, extent {}x{}", anchor.id, extent.x, extent.y);

        notify(callbacks_.on_added, anchor);
        return anchor.id;
    }

    bool SimulatedTrackingSession::updatePlane(AnchorId id, const glm::vec3& center, const glm::vec2& extent) {
        if (!running_) {
            return false;
        }

        auto it = anchors_.find(id);
        if (it == anchors_.end() || !it->second.isSurface()) {
            LOG_DEBUG("No tracked plane with id {}", id);
            return false;
        }

        it->second.center = center;
        it->second.extent = extent;

        notify(callbacks_.on_updated, it->second);
        return true;
    }

    std::optional<AnchorId> SimulatedTrackingSession::detectMarker(const std::string& image_name,
                                                                   const geometry::Pose& pose) {
        if (!running_) {
            return std::nullopt;
        }

        const auto& images = config_.detection_images;
        if (std::find(images.begin(), images.end(), image_name) == images.end()) {
            LOG_DEBUG("Marker '{}' is not in the active detection set", image_name);
            return std::nullopt;
        }

        SpatialAnchor anchor;
        anchor.id = next_id_++;
        anchor.kind = AnchorKind::Marker;
        anchor.pose = pose;
        anchor.image_name = image_name;

        anchors_[anchor.id] = anchor;
        LOG_DEBUG("Marker '{}' recognized as anchor {}", image_name, anchor.id);

        notify(callbacks_.on_added, anchor);
        return anchor.id;
    }

    bool SimulatedTrackingSession::removeAnchor(AnchorId id) {
        if (!running_) {
            return false;
        }

        auto it = anchors_.find(id);
        if (it == anchors_.end()) {
            LOG_DEBUG("No tracked anchor with id {}", id);
            return false;
        }

        const SpatialAnchor anchor = it->second;
        anchors_.erase(it);

        notify(callbacks_.on_removed, anchor);
        return true;
    }

} // namespace arp::tracking
