/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/logger.hpp"
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace arp {
    namespace param {
        namespace {

            /**
             * @brief Read and parse a JSON configuration file
             * @param path Path to the JSON file
             * @return Expected JSON object or error message
             */
            std::expected<nlohmann::json, std::string> read_json_file(const std::filesystem::path& path) {
                if (!std::filesystem::exists(path)) {
                    return std::unexpected(std::format("Configuration file does not exist: {}", path.string()));
                }

                std::ifstream file(path);
                if (!file.is_open()) {
                    return std::unexpected(std::format("Could not open configuration file: {}", path.string()));
                }

                try {
                    std::stringstream buffer;
                    buffer << file.rdbuf();
                    return nlohmann::json::parse(buffer.str());
                } catch (const nlohmann::json::parse_error& e) {
                    return std::unexpected(std::format("JSON parsing error in {}: {}", path.string(), e.what()));
                }
            }

            std::vector<std::string> read_string_list(const nlohmann::json& json) {
                std::vector<std::string> values;
                for (const auto& entry : json) {
                    values.push_back(entry.get<std::string>());
                }
                return values;
            }

        } // namespace

        nlohmann::json PlacementParameters::to_json() const {

            nlohmann::json placement_json;
            placement_json["free_form_distance"] = free_form_distance;
            placement_json["drag_threshold"] = drag_threshold;
            placement_json["show_surfaces"] = show_surfaces;
            placement_json["surface_opacity"] = surface_opacity;
            placement_json["initial_mode"] = std::string(to_string(initial_mode));
            placement_json["reference_image_group"] = reference_image_group;
            placement_json["reference_images"] = reference_images;
            placement_json["models"] = models;

            return placement_json;
        }

        PlacementParameters PlacementParameters::from_json(const nlohmann::json& json) {

            PlacementParameters params;

            if (json.contains("free_form_distance")) {
                float distance = json["free_form_distance"];
                if (distance > 0.0f) {
                    params.free_form_distance = distance;
                } else {
                    LOG_WARN("Invalid free_form_distance {} in JSON. Using default {}", distance, params.free_form_distance);
                }
            }
            if (json.contains("drag_threshold")) {
                float threshold = json["drag_threshold"];
                if (threshold >= 0.0f) {
                    params.drag_threshold = threshold;
                } else {
                    LOG_WARN("Invalid drag_threshold {} in JSON. Using default {}", threshold, params.drag_threshold);
                }
            }
            if (json.contains("show_surfaces")) {
                params.show_surfaces = json["show_surfaces"];
            }
            if (json.contains("surface_opacity")) {
                float opacity = json["surface_opacity"];
                if (opacity >= 0.0f && opacity <= 1.0f) {
                    params.surface_opacity = opacity;
                } else {
                    LOG_WARN("Invalid surface_opacity {} in JSON. Using default {}", opacity, params.surface_opacity);
                }
            }

            if (json.contains("initial_mode")) {
                std::string mode = json["initial_mode"];
                if (auto parsed = parse_placement_mode(mode)) {
                    params.initial_mode = *parsed;
                } else {
                    LOG_WARN("Invalid initial_mode '{}' in JSON. Using default '{}'", mode, to_string(params.initial_mode));
                }
            }

            if (json.contains("reference_image_group")) {
                params.reference_image_group = json["reference_image_group"];
            }
            if (json.contains("reference_images")) {
                params.reference_images = read_string_list(json["reference_images"]);
            }
            if (json.contains("models")) {
                params.models = read_string_list(json["models"]);
            }

            return params;
        }

        nlohmann::json SimulationParameters::to_json() const {
            nlohmann::json sim_json;
            sim_json["viewport_width"] = viewport_width;
            sim_json["viewport_height"] = viewport_height;
            sim_json["vertical_fov"] = vertical_fov;
            return sim_json;
        }

        SimulationParameters SimulationParameters::from_json(const nlohmann::json& json) {
            SimulationParameters params;

            if (json.contains("viewport_width")) {
                params.viewport_width = json["viewport_width"];
            }
            if (json.contains("viewport_height")) {
                params.viewport_height = json["viewport_height"];
            }
            if (json.contains("vertical_fov")) {
                params.vertical_fov = json["vertical_fov"];
            }

            if (params.viewport_width <= 0 || params.viewport_height <= 0) {
                LOG_WARN("Invalid viewport {}x{} in JSON. Using default", params.viewport_width, params.viewport_height);
                params.viewport_width = SimulationParameters{}.viewport_width;
                params.viewport_height = SimulationParameters{}.viewport_height;
            }
            if (params.vertical_fov <= 0.0f || params.vertical_fov >= 180.0f) {
                LOG_WARN("Invalid vertical_fov {} in JSON. Using default", params.vertical_fov);
                params.vertical_fov = SimulationParameters{}.vertical_fov;
            }

            return params;
        }

        std::expected<AppParameters, std::string> read_app_params_from_json(const std::filesystem::path& path) {

            auto json_result = read_json_file(path);
            if (!json_result) {
                return std::unexpected(json_result.error());
            }

            try {
                const auto& json = *json_result;
                AppParameters params;
                if (json.contains("placement")) {
                    params.placement = PlacementParameters::from_json(json["placement"]);
                }
                if (json.contains("simulation")) {
                    params.simulation = SimulationParameters::from_json(json["simulation"]);
                }
                params.config_file = path;

                LOG_DEBUG("Loaded configuration from {}", path.string());
                return params;
            } catch (const nlohmann::json::exception& e) {
                return std::unexpected(std::format("Invalid value in {}: {}", path.string(), e.what()));
            }
        }

        std::expected<void, std::string> save_app_params_to_json(
            const AppParameters& params,
            const std::filesystem::path& output_path) {

            try {
                if (output_path.has_parent_path()) {
                    std::filesystem::create_directories(output_path.parent_path());
                }

                nlohmann::json json;
                json["placement"] = params.placement.to_json();
                json["simulation"] = params.simulation.to_json();

                std::ofstream file(output_path);
                if (!file) {
                    return std::unexpected(std::format("Could not open file for writing: {}", output_path.string()));
                }

                file << json.dump(4);
                file.close();

                LOG_DEBUG("Saved configuration to {}", output_path.string());
                return {};
            } catch (const std::exception& e) {
                return std::unexpected(std::format("Error saving configuration: {}", e.what()));
            }
        }

    } // namespace param
} // namespace arp
