/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/application.hpp"
#include "core/command_processor.hpp"
#include "core/logger.hpp"
#include "core/parameters.hpp"
#include "scene/scene_manager.hpp"
#include "tracking/simulated_tracking_session.hpp"
#include <fstream>
#include <iostream>
#include <string>

namespace arp {

    int Application::runCommands(const param::AppParameters& params, std::istream& in, std::ostream& out) {
        tracking::SimulatedTrackingSession tracking(params.simulation);
        SceneManager scene_manager(tracking, params.placement);
        CommandProcessor processor(&scene_manager, &tracking);

        scene_manager.start();

        if (params.initial_model && !scene_manager.selectModel(*params.initial_model)) {
            LOG_ERROR("Model '{}' is not in the catalog", *params.initial_model);
            return -1;
        }

        LOG_TIMER("Command stream");

        size_t line_count = 0;
        std::string line;
        while (std::getline(in, line)) {
            ++line_count;
            if (line == "quit" || line == "exit") {
                break;
            }

            const std::string result = processor.processCommand(line);
            if (!result.empty()) {
                out << result << '\n';
            }
        }

        scene_manager.pause();

        const auto info = scene_manager.getSceneInfo();
        LOG_INFO("Processed {} lines, {} objects placed, {} anchors tracked",
                 line_count, info.num_objects, info.num_anchors);
        return 0;
    }

    int Application::run(std::unique_ptr<param::AppParameters> params) {
        if (params->script_path.empty()) {
            LOG_INFO("Reading commands from standard input");
            return runCommands(*params, std::cin, std::cout);
        }

        std::ifstream script(params->script_path);
        if (!script.is_open()) {
            LOG_ERROR("Could not open script: {}", params->script_path.string());
            return -1;
        }

        LOG_INFO("Running script: {}", params->script_path.string());
        return runCommands(*params, script, std::cout);
    }
} // namespace arp
