/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "placement/placement_mode.hpp"
#include "scene/anchor_registry.hpp"
#include "scene/object_ledger.hpp"
#include "tracking/tracking_session.hpp"

namespace arp::session {

    /**
     * @brief Restarts the tracking session with the feature set a placement
     *        mode needs
     *
     * Horizontal plane detection is always on so plane indicators can be shown
     * in any mode. The reference image set is active only in Marker mode.
     */
    class SessionController {
    public:
        SessionController(tracking::ITrackingSession& tracking,
                          scene::AnchorRegistry& registry,
                          scene::ObjectLedger& ledger,
                          const param::PlacementParameters& params = {});

        // Delete copy operations
        SessionController(const SessionController&) = delete;
        SessionController& operator=(const SessionController&) = delete;

        /**
         * @brief Restart tracking for the given mode
         * @param mode Placement mode the feature set is chosen for
         * @param clear_existing Remove every visual, anchor and placed object and
         *        have the tracking session drop its anchors. When false existing
         *        anchors are kept.
         */
        void reconfigure(PlacementMode mode, bool clear_existing);

        void pause();

        static tracking::DetectionConfig detectionConfigFor(PlacementMode mode,
                                                            const param::PlacementParameters& params);

        const tracking::DetectionConfig& currentConfig() const { return current_config_; }

    private:
        tracking::ITrackingSession& tracking_;
        scene::AnchorRegistry& registry_;
        scene::ObjectLedger& ledger_;
        param::PlacementParameters params_;
        tracking::DetectionConfig current_config_;
    };

} // namespace arp::session
