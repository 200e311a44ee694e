/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/command_processor.hpp"
#include "core/logger.hpp"
#include "scene/scene_manager.hpp"
#include "tracking/simulated_tracking_session.hpp"
#include <cctype>
#include <cmath>
#include <format>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace arp {

    CommandProcessor::CommandProcessor(SceneManager* scene_manager, tracking::SimulatedTrackingSession* tracking)
        : scene_manager_(scene_manager),
          tracking_(tracking) {
        registerBuiltinCommands();
    }

    void CommandProcessor::registerBuiltinCommands() {
        registerCommand("help", [this](const Arguments&) { return handleHelp(); });
        registerCommand("h", [this](const Arguments&) { return handleHelp(); });
        registerCommand("status", [this](const Arguments&) { return handleStatus(); });
        registerCommand("models", [this](const Arguments&) { return handleModels(); });
        registerCommand("select", [this](const Arguments& args) { return handleSelect(args); });
        registerCommand("mode", [this](const Arguments& args) { return handleMode(args); });
        registerCommand("touch", [this](const Arguments& args) { return handleTouch(args); });
        registerCommand("move", [this](const Arguments& args) { return handleMove(args); });
        registerCommand("end", [this](const Arguments&) { return handleEnd(); });
        registerCommand("tap", [this](const Arguments& args) { return handleTap(args); });
        registerCommand("undo", [this](const Arguments&) { return handleUndo(); });
        registerCommand("reset", [this](const Arguments&) { return handleReset(); });
        registerCommand("planes", [this](const Arguments&) { return handlePlanes(); });
        registerCommand("camera", [this](const Arguments& args) { return handleCamera(args); });
        registerCommand("nocamera", [this](const Arguments&) { return handleNoCamera(); });
        registerCommand("plane", [this](const Arguments& args) { return handlePlane(args); });
        registerCommand("grow", [this](const Arguments& args) { return handleGrow(args); });
        registerCommand("lose", [this](const Arguments& args) { return handleLose(args); });
        registerCommand("marker", [this](const Arguments& args) { return handleMarker(args); });
        registerCommand("objects", [this](const Arguments&) { return handleObjects(); });
        registerCommand("anchors", [this](const Arguments&) { return handleAnchors(); });
    }

    std::string CommandProcessor::processCommand(const std::string& command) {
        std::istringstream stream(command);
        std::string name;
        if (!(stream >> name) || name.starts_with('#')) {
            return "";
        }

        Arguments args;
        std::string token;
        while (stream >> token) {
            args.push_back(token);
        }

        // Look up command in registry
        auto it = commands_.find(name);
        if (it != commands_.end()) {
            return it->second(args);
        }

        return "Unknown command: '" + name + "'. Type 'help' for available commands.";
    }

    void CommandProcessor::registerCommand(const std::string& name, CommandHandler handler) {
        commands_[name] = handler;
    }

    std::expected<std::vector<float>, std::string> CommandProcessor::parseFloats(const Arguments& args,
                                                                                 size_t first,
                                                                                 size_t count) {
        if (args.size() < first + count) {
            return std::unexpected(std::format("expected {} numeric arguments", count));
        }

        std::vector<float> values;
        values.reserve(count);
        for (size_t i = first; i < first + count; ++i) {
            try {
                const float value = std::stof(args[i]);
                if (!std::isfinite(value)) {
                    return std::unexpected(std::format("'{}' is not a finite number", args[i]));
                }
                values.push_back(value);
            } catch (const std::invalid_argument&) {
                return std::unexpected(std::format("'{}' is not a number", args[i]));
            } catch (const std::out_of_range&) {
                return std::unexpected(std::format("'{}' is out of range", args[i]));
            }
        }
        return values;
    }

    std::expected<std::uint64_t, std::string> CommandProcessor::parseId(const std::string& token) {
        // stoull accepts a sign and wraps negative values
        if (token.empty() || !std::isdigit(static_cast<unsigned char>(token.front()))) {
            return std::unexpected(std::format("'{}' is not an id", token));
        }
        try {
            return std::stoull(token);
        } catch (const std::invalid_argument&) {
            return std::unexpected(std::format("'{}' is not an id", token));
        } catch (const std::out_of_range&) {
            return std::unexpected(std::format("'{}' is out of range", token));
        }
    }

    std::string CommandProcessor::handleHelp() {
        std::ostringstream result;
        result << "Available commands:\n";
        result << "  help, h - Show this help\n";
        result << "  status - Show placement state\n";
        result << "  models - List selectable models\n";
        result << "  select <name> - Select the model to place\n";
        result << "  mode <freeform|surface|marker> - Switch placement mode\n";
        result << "  touch <x> <y> - Touch down at a view point\n";
        result << "  move <x> <y> - Drag the active touch\n";
        result << "  end - Lift the active touch\n";
        result << "  tap <x> <y> - Touch down and lift\n";
        result << "  undo - Remove the last placed object\n";
        result << "  reset - Remove all objects and anchors and restart tracking\n";
        result << "  planes - Toggle plane indicators\n";
        result << "  camera <x> <y> <z> [pitch] [yaw] - Set the camera pose (degrees)\n";
        result << "  nocamera - Drop the camera pose\n";
        result << "  plane <x> <y> <z> <cx> <cz> <w> <d> - Report a horizontal plane\n";
        result << "  grow <id> <cx> <cz> <w> <d> - Update a plane's center and extent\n";
        result << "  lose <id> - Stop tracking an anchor\n";
        result << "  marker <image> <x> <y> <z> - Report a recognized reference image\n";
        result << "  objects - List placed objects\n";
        result << "  anchors - List tracked anchors";
        return result.str();
    }

    std::string CommandProcessor::handleStatus() {
        if (!scene_manager_) {
            return "No scene manager available";
        }

        const auto info = scene_manager_->getSceneInfo();
        std::ostringstream result;
        result << "Placement Status:\n";
        result << "  Mode: " << to_string(info.mode) << "\n";
        result << "  Model: " << (info.selected_model.empty() ? "<none>" : info.selected_model) << "\n";
        result << "  Objects: " << info.num_objects << " (" << info.num_attached_objects << " on markers)\n";
        result << "  Anchors: " << info.num_anchors << "\n";
        result << "  Plane indicators: " << info.num_plane_indicators
               << (info.show_surfaces ? " (shown)" : " (hidden)") << "\n";

        const auto& detection = scene_manager_->currentDetectionConfig();
        result << "  Detection: " << (detection.planesEnabled() ? "planes" : "no planes");
        if (detection.markersEnabled()) {
            result << ", " << detection.detection_images.size() << " images in '" << detection.image_group << "'";
        }

        if (tracking_) {
            result << "\n  Tracking: " << (tracking_->isRunning() ? "running" : "paused");
        }
        return result.str();
    }

    std::string CommandProcessor::handleModels() {
        if (!scene_manager_) {
            return "No scene manager available";
        }

        std::ostringstream result;
        result << "Available models:";
        for (const auto& model : scene_manager_->availableModels()) {
            result << "\n  " << model;
        }
        return result.str();
    }

    std::string CommandProcessor::handleSelect(const Arguments& args) {
        if (!scene_manager_) {
            return "No scene manager available";
        }
        if (args.empty()) {
            return "Usage: select <name>";
        }
        if (!scene_manager_->selectModel(args[0])) {
            return std::format("Unknown model '{}'. Type 'models' for the list.", args[0]);
        }
        return std::format("Selected {}", args[0]);
    }

    std::string CommandProcessor::handleMode(const Arguments& args) {
        if (!scene_manager_) {
            return "No scene manager available";
        }
        if (args.empty()) {
            return std::format("Mode: {}", to_string(scene_manager_->getMode()));
        }

        const auto mode = parse_placement_mode(args[0]);
        if (!mode) {
            return std::format("Invalid mode '{}'. Use freeform, surface or marker.", args[0]);
        }
        if (!scene_manager_->setMode(*mode)) {
            return std::format("Already in {} mode", to_string(*mode));
        }
        return std::format("Mode: {}", to_string(*mode));
    }

    std::string CommandProcessor::handleTouch(const Arguments& args) {
        if (!scene_manager_) {
            return "No scene manager available";
        }
        auto point = parseFloats(args, 0, 2);
        if (!point) {
            return "Usage: touch <x> <y>: " + point.error();
        }

        const size_t before = scene_manager_->getLedger().size();
        scene_manager_->touchBegan({(*point)[0], (*point)[1]});
        return std::format("Placed {}", scene_manager_->getLedger().size() - before);
    }

    std::string CommandProcessor::handleMove(const Arguments& args) {
        if (!scene_manager_) {
            return "No scene manager available";
        }
        auto point = parseFloats(args, 0, 2);
        if (!point) {
            return "Usage: move <x> <y>: " + point.error();
        }

        const size_t before = scene_manager_->getLedger().size();
        scene_manager_->touchMoved({(*point)[0], (*point)[1]});
        return std::format("Placed {}", scene_manager_->getLedger().size() - before);
    }

    std::string CommandProcessor::handleEnd() {
        if (!scene_manager_) {
            return "No scene manager available";
        }
        scene_manager_->touchEnded();
        return "Touch ended";
    }

    std::string CommandProcessor::handleTap(const Arguments& args) {
        auto result = handleTouch(args);
        if (scene_manager_) {
            scene_manager_->touchEnded();
        }
        return result;
    }

    std::string CommandProcessor::handleUndo() {
        if (!scene_manager_) {
            return "No scene manager available";
        }
        return scene_manager_->undoLastObject() ? "Removed last object" : "Nothing to undo";
    }

    std::string CommandProcessor::handleReset() {
        if (!scene_manager_) {
            return "No scene manager available";
        }
        scene_manager_->resetScene();
        return "Scene reset";
    }

    std::string CommandProcessor::handlePlanes() {
        if (!scene_manager_) {
            return "No scene manager available";
        }
        return scene_manager_->togglePlaneVisualization() ? "Plane indicators shown" : "Plane indicators hidden";
    }

    std::string CommandProcessor::handleCamera(const Arguments& args) {
        if (!tracking_) {
            return "No simulated tracking session available";
        }
        auto position = parseFloats(args, 0, 3);
        if (!position) {
            return "Usage: camera <x> <y> <z> [pitch] [yaw]: " + position.error();
        }

        float pitch = 0.0f;
        float yaw = 0.0f;
        if (args.size() > 3) {
            auto angles = parseFloats(args, 3, args.size() > 4 ? 2 : 1);
            if (!angles) {
                return "Usage: camera <x> <y> <z> [pitch] [yaw]: " + angles.error();
            }
            pitch = (*angles)[0];
            if (angles->size() > 1) {
                yaw = (*angles)[1];
            }
        }

        const glm::vec3 eye((*position)[0], (*position)[1], (*position)[2]);
        tracking_->setCameraPose(geometry::Pose::fromPitchYawDegrees(eye, pitch, yaw));
        return std::format("Camera at ({}, {}, {}) pitch {} yaw {}", eye.x, eye.y, eye.z, pitch, yaw);
    }

    std::string CommandProcessor::handleNoCamera() {
        if (!tracking_) {
            return "No simulated tracking session available";
        }
        tracking_->clearCameraPose();
        return "Camera pose cleared";
    }

    std::string CommandProcessor::handlePlane(const Arguments& args) {
        if (!tracking_) {
            return "No simulated tracking session available";
        }
        auto values = parseFloats(args, 0, 7);
        if (!values) {
            return "Usage: plane <x> <y> <z> <cx> <cz> <w> <d>: " + values.error();
        }

        const auto& v = *values;
        auto id = tracking_->addPlane(geometry::Pose(glm::vec3(v[0], v[1], v[2])),
                                      glm::vec3(v[3], 0.0f, v[4]),
                                      glm::vec2(v[5], v[6]));
        if (!id) {
            return "Plane ignored, tracking is not detecting planes";
        }
        return std::format("Plane anchor {}", *id);
    }

    std::string CommandProcessor::handleGrow(const Arguments& args) {
        if (!tracking_) {
            return "No simulated tracking session available";
        }
        if (args.empty()) {
            return "Usage: grow <id> <cx> <cz> <w> <d>";
        }
        auto id = parseId(args[0]);
        if (!id) {
            return "Usage: grow <id> <cx> <cz> <w> <d>: " + id.error();
        }
        auto values = parseFloats(args, 1, 4);
        if (!values) {
            return "Usage: grow <id> <cx> <cz> <w> <d>: " + values.error();
        }

        const auto& v = *values;
        if (!tracking_->updatePlane(*id, glm::vec3(v[0], 0.0f, v[1]), glm::vec2(v[2], v[3]))) {
            return std::format("No tracked plane {}", *id);
        }
        return std::format("Plane anchor {} updated", *id);
    }

    std::string CommandProcessor::handleLose(const Arguments& args) {
        if (!tracking_) {
            return "No simulated tracking session available";
        }
        if (args.empty()) {
            return "Usage: lose <id>";
        }
        auto id = parseId(args[0]);
        if (!id) {
            return "Usage: lose <id>: " + id.error();
        }
        if (!tracking_->removeAnchor(*id)) {
            return std::format("No tracked anchor {}", *id);
        }
        return std::format("Anchor {} lost", *id);
    }

    std::string CommandProcessor::handleMarker(const Arguments& args) {
        if (!tracking_) {
            return "No simulated tracking session available";
        }
        if (args.empty()) {
            return "Usage: marker <image> <x> <y> <z>";
        }
        auto position = parseFloats(args, 1, 3);
        if (!position) {
            return "Usage: marker <image> <x> <y> <z>: " + position.error();
        }

        const glm::vec3 p((*position)[0], (*position)[1], (*position)[2]);
        auto id = tracking_->detectMarker(args[0], geometry::Pose(p));
        if (!id) {
            return std::format("Marker '{}' not recognized in the current mode", args[0]);
        }
        return std::format("Marker anchor {}", *id);
    }

    std::string CommandProcessor::handleObjects() {
        if (!scene_manager_) {
            return "No scene manager available";
        }

        const auto& objects = scene_manager_->getLedger().getObjects();
        if (objects.empty()) {
            return "No objects placed";
        }

        std::ostringstream result;
        result << "Placed objects:" << std::fixed << std::setprecision(3);
        for (const auto& object : objects) {
            result << "\n  #" << object.id << " " << object.model << " [" << to_string(object.mode) << "]";

            auto world = scene_manager_->worldTransformOf(object);
            if (world) {
                const glm::vec4& p = (*world)[3];
                result << " at (" << p.x << ", " << p.y << ", " << p.z << ")";
            } else {
                result << " anchor lost";
            }
            if (object.anchor) {
                result << " on anchor " << *object.anchor;
            }
        }
        return result.str();
    }

    std::string CommandProcessor::handleAnchors() {
        if (!scene_manager_) {
            return "No scene manager available";
        }

        const auto& registry = scene_manager_->getRegistry();
        const auto anchors = registry.getAnchors();
        if (anchors.empty()) {
            return "No anchors tracked";
        }

        std::ostringstream result;
        result << "Tracked anchors:" << std::fixed << std::setprecision(3);
        for (const auto* anchor : anchors) {
            result << "\n  " << anchor->id << " " << tracking::to_string(anchor->kind);
            if (const auto* visual = registry.getVisual(anchor->id)) {
                result << " " << visual->width << "x" << visual->depth
                       << (visual->hidden ? " hidden" : " shown");
            } else {
                result << " '" << anchor->image_name << "'";
            }
        }
        return result.str();
    }

} // namespace arp
