/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace arp {
    class SceneManager;

    namespace tracking {
        class SimulatedTrackingSession;
    }

    class CommandProcessor {
    public:
        using Arguments = std::vector<std::string>;
        using CommandHandler = std::function<std::string(const Arguments&)>;

        CommandProcessor(SceneManager* scene_manager, tracking::SimulatedTrackingSession* tracking);

        // Process a command line and return the result
        std::string processCommand(const std::string& command);

        // Register custom commands
        void registerCommand(const std::string& name, CommandHandler handler);

    private:
        // Built-in command handlers
        std::string handleHelp();
        std::string handleStatus();
        std::string handleModels();
        std::string handleSelect(const Arguments& args);
        std::string handleMode(const Arguments& args);
        std::string handleTouch(const Arguments& args);
        std::string handleMove(const Arguments& args);
        std::string handleEnd();
        std::string handleTap(const Arguments& args);
        std::string handleUndo();
        std::string handleReset();
        std::string handlePlanes();
        std::string handleCamera(const Arguments& args);
        std::string handleNoCamera();
        std::string handlePlane(const Arguments& args);
        std::string handleGrow(const Arguments& args);
        std::string handleLose(const Arguments& args);
        std::string handleMarker(const Arguments& args);
        std::string handleObjects();
        std::string handleAnchors();

        static std::expected<std::vector<float>, std::string> parseFloats(const Arguments& args,
                                                                          size_t first,
                                                                          size_t count);
        static std::expected<std::uint64_t, std::string> parseId(const std::string& token);

        SceneManager* scene_manager_;
        tracking::SimulatedTrackingSession* tracking_;
        std::unordered_map<std::string, CommandHandler> commands_;

        void registerBuiltinCommands();
    };

} // namespace arp
