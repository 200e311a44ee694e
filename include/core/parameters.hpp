/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/logger.hpp"
#include "placement/placement_mode.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace arp {
    namespace param {
        struct PlacementParameters {
            float free_form_distance = 0.2f; // Distance in front of the camera for free-form placement
            float drag_threshold = 40.0f;    // Screen distance between two surface placements while dragging
            bool show_surfaces = false;      // Initial visibility of the plane indicators
            float surface_opacity = 0.25f;   // Opacity of the plane indicators
            PlacementMode initial_mode = PlacementMode::FreeForm;
            std::string reference_image_group = "AR Resources";
            std::vector<std::string> reference_images = {"poster", "book_cover"};
            std::vector<std::string> models = {"cup", "vase", "boxing", "table", "candle", "lamp"};

            nlohmann::json to_json() const;
            static PlacementParameters from_json(const nlohmann::json& j);
        };

        // Camera model of the simulated tracking backend
        struct SimulationParameters {
            int viewport_width = 1170;
            int viewport_height = 2532;
            float vertical_fov = 60.0f; // Degrees

            nlohmann::json to_json() const;
            static SimulationParameters from_json(const nlohmann::json& j);
        };

        struct AppParameters {
            PlacementParameters placement;
            SimulationParameters simulation;

            // Runtime only, never read from or written to JSON
            std::filesystem::path config_file = "";
            std::filesystem::path script_path = ""; // Empty reads commands from stdin
            std::optional<std::string> initial_model = std::nullopt;
            core::LogLevel log_level = core::LogLevel::Info;
            std::filesystem::path log_file = "";
        };

        std::expected<AppParameters, std::string> read_app_params_from_json(const std::filesystem::path& path);

        std::expected<void, std::string> save_app_params_to_json(
            const AppParameters& params,
            const std::filesystem::path& output_path);
    } // namespace param
} // namespace arp
