/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/events.hpp"
#include "core/parameters.hpp"
#include "input/input_router.hpp"
#include "placement/placement_selector.hpp"
#include "scene/anchor_registry.hpp"
#include "scene/object_ledger.hpp"
#include "session/session_controller.hpp"
#include "tracking/tracking_session.hpp"
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <vector>

namespace arp {

    /**
     * @brief Owns the placement core and wires it to a tracking session
     *
     * Entry point for the UI (model and mode selection, undo, reset, plane
     * visibility) and for touch input. Also answers the commands published on
     * the event bus. The tracking session must outlive the manager.
     */
    class SceneManager {
    public:
        explicit SceneManager(tracking::ITrackingSession& tracking,
                              const param::PlacementParameters& params = {});
        ~SceneManager();

        // Delete copy operations
        SceneManager(const SceneManager&) = delete;
        SceneManager& operator=(const SceneManager&) = delete;

        // Session lifecycle
        void start();
        void pause();

        // UI operations
        bool selectModel(const std::string& name);
        bool setMode(PlacementMode mode);
        bool undoLastObject();
        void resetScene();
        bool togglePlaneVisualization(); // Returns the new visibility

        // Touch input. touchBegan samples the camera pose from tracking.
        void touchBegan(const glm::vec2& point);
        void touchMoved(const glm::vec2& point);
        void touchEnded();

        // Read access for rendering
        const scene::ObjectLedger& getLedger() const { return ledger_; }
        const scene::AnchorRegistry& getRegistry() const { return registry_; }

        // World transform of a placed object, nullopt when its anchor is no longer tracked
        std::optional<glm::mat4> worldTransformOf(const scene::PlacedObject& object) const;

        PlacementMode getMode() const { return selector_.mode(); }
        bool showSurfaces() const { return registry_.showSurfaces(); }
        const std::optional<placement::ModelTemplate>& selectedModel() const { return selector_.selectedModel(); }
        const std::vector<std::string>& availableModels() const { return params_.models; }
        const tracking::DetectionConfig& currentDetectionConfig() const { return controller_.currentConfig(); }

        // Direct info queries
        struct SceneInfo {
            PlacementMode mode = PlacementMode::FreeForm;
            std::string selected_model;
            size_t num_objects = 0;
            size_t num_attached_objects = 0;
            size_t num_anchors = 0;
            size_t num_plane_indicators = 0;
            bool show_surfaces = false;
        };

        SceneInfo getSceneInfo() const;

    private:
        void setupEventHandlers();

        tracking::ITrackingSession& tracking_;
        param::PlacementParameters params_;

        scene::AnchorRegistry registry_;
        scene::ObjectLedger ledger_;
        placement::PlacementSelector selector_;
        InputRouter router_;
        session::SessionController controller_;

        std::vector<event::Subscription> subscriptions_;
    };

} // namespace arp
