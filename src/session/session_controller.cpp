/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "session/session_controller.hpp"
#include "core/events.hpp"
#include "core/logger.hpp"

namespace arp::session {

    SessionController::SessionController(tracking::ITrackingSession& tracking,
                                         scene::AnchorRegistry& registry,
                                         scene::ObjectLedger& ledger,
                                         const param::PlacementParameters& params)
        : tracking_(tracking),
          registry_(registry),
          ledger_(ledger),
          params_(params) {
    }

    tracking::DetectionConfig SessionController::detectionConfigFor(PlacementMode mode,
                                                                    const param::PlacementParameters& params) {
        tracking::DetectionConfig config;
        config.plane_detection = tracking::PlaneDetection::Horizontal;

        if (mode == PlacementMode::Marker) {
            config.image_group = params.reference_image_group;
            config.detection_images = params.reference_images;
        }
        return config;
    }

    void SessionController::reconfigure(PlacementMode mode, bool clear_existing) {
        current_config_ = detectionConfigFor(mode, params_);

        if (mode == PlacementMode::Marker && current_config_.detection_images.empty()) {
            LOG_WARN("Marker mode active but reference image group '{}' has no images",
                     current_config_.image_group);
        }

        if (clear_existing) {
            const size_t visuals_removed = registry_.clear();
            const size_t objects_removed = ledger_.resetAll();

            LOG_INFO("Scene cleared: {} objects, {} plane indicators", objects_removed, visuals_removed);
            events::state::SceneReset{
                .objects_removed = objects_removed,
                .visuals_removed = visuals_removed}
                .emit();
        }

        tracking_.run(current_config_, clear_existing);

        LOG_DEBUG("Session reconfigured for {} mode ({} anchors)",
                  to_string(mode), clear_existing ? "removed" : "kept");
        events::state::SessionReconfigured{
            .mode = mode,
            .plane_detection = current_config_.planesEnabled(),
            .marker_images = current_config_.detection_images,
            .anchors_removed = clear_existing}
            .emit();
    }

    void SessionController::pause() {
        tracking_.pause();
    }

} // namespace arp::session
