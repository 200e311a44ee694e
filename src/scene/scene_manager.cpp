/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scene/scene_manager.hpp"
#include "core/logger.hpp"
#include <algorithm>

namespace arp {

    SceneManager::SceneManager(tracking::ITrackingSession& tracking,
                               const param::PlacementParameters& params)
        : tracking_(tracking),
          params_(params),
          registry_(params.surface_opacity, params.show_surfaces),
          selector_(ledger_, tracking, params),
          router_(selector_),
          controller_(tracking, registry_, ledger_, params) {

        tracking_.setAnchorCallbacks(tracking::AnchorCallbacks{
            .on_added = [this](const tracking::SpatialAnchor& anchor) { registry_.onAnchorAdded(anchor); },
            .on_updated = [this](const tracking::SpatialAnchor& anchor) { registry_.onAnchorUpdated(anchor); },
            .on_removed = [this](const tracking::SpatialAnchor& anchor) { registry_.onAnchorRemoved(anchor); }});

        registry_.setMarkerAddedCallback([this](const tracking::SpatialAnchor& anchor) {
            selector_.placeOnMarker(anchor.id);
        });

        // Mode switches keep anchors and objects
        selector_.setModeChangedCallback([this](PlacementMode, PlacementMode new_mode) {
            controller_.reconfigure(new_mode, false);
        });

        setupEventHandlers();
        LOG_DEBUG("SceneManager initialized");
    }

    SceneManager::~SceneManager() {
        subscriptions_.clear();
        tracking_.setAnchorCallbacks({});
    }

    void SceneManager::setupEventHandlers() {
        using namespace events;

        subscriptions_.push_back(cmd::SelectModel::subscribe([this](const auto& cmd) {
            selectModel(cmd.name);
        }));

        subscriptions_.push_back(cmd::SetPlacementMode::subscribe([this](const auto& cmd) {
            setMode(cmd.mode);
        }));

        subscriptions_.push_back(cmd::UndoLastObject::subscribe([this](const auto&) {
            undoLastObject();
        }));

        subscriptions_.push_back(cmd::ResetScene::subscribe([this](const auto&) {
            resetScene();
        }));

        subscriptions_.push_back(cmd::TogglePlaneVisualization::subscribe([this](const auto&) {
            togglePlaneVisualization();
        }));
    }

    void SceneManager::start() {
        LOG_INFO("Starting session in {} mode", to_string(selector_.mode()));
        controller_.reconfigure(selector_.mode(), true);
    }

    void SceneManager::pause() {
        router_.touchEnded();
        controller_.pause();
    }

    bool SceneManager::selectModel(const std::string& name) {
        const auto& models = params_.models;
        if (!models.empty() && std::find(models.begin(), models.end(), name) == models.end()) {
            LOG_WARN("Unknown model '{}'", name);
            return false;
        }
        selector_.selectModel(name);
        return true;
    }

    bool SceneManager::setMode(PlacementMode mode) {
        return selector_.setMode(mode);
    }

    bool SceneManager::undoLastObject() {
        return ledger_.undoLast().has_value();
    }

    void SceneManager::resetScene() {
        router_.touchEnded();
        controller_.reconfigure(selector_.mode(), true);
    }

    bool SceneManager::togglePlaneVisualization() {
        registry_.setShowSurfaces(!registry_.showSurfaces());
        return registry_.showSurfaces();
    }

    void SceneManager::touchBegan(const glm::vec2& point) {
        router_.touchBegan(point, tracking_.currentCameraPose());
    }

    void SceneManager::touchMoved(const glm::vec2& point) {
        router_.touchMoved(point);
    }

    void SceneManager::touchEnded() {
        router_.touchEnded();
    }

    std::optional<glm::mat4> SceneManager::worldTransformOf(const scene::PlacedObject& object) const {
        if (!object.anchor) {
            return object.transform.toMat4();
        }

        const tracking::SpatialAnchor* anchor = registry_.getAnchor(*object.anchor);
        if (!anchor) {
            return std::nullopt;
        }
        return (anchor->pose * object.transform).toMat4();
    }

    SceneManager::SceneInfo SceneManager::getSceneInfo() const {
        SceneInfo info;
        info.mode = selector_.mode();
        if (const auto& model = selector_.selectedModel()) {
            info.selected_model = model->name;
        }
        info.num_objects = ledger_.size();
        info.num_attached_objects = static_cast<size_t>(std::count_if(
            ledger_.getObjects().begin(), ledger_.getObjects().end(),
            [](const scene::PlacedObject& object) { return object.isAttached(); }));
        info.num_anchors = registry_.anchorCount();
        info.num_plane_indicators = registry_.visualCount();
        info.show_surfaces = registry_.showSurfaces();
        return info;
    }

} // namespace arp
