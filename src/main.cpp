/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/application.hpp"
#include "core/argument_parser.hpp"
#include "core/logger.hpp"

#include <print>
#include <utility>

int main(int argc, char* argv[]) {
    // Also initializes the logger from --log-level, --log-file and --log-module
    auto params_result = arp::args::parse_args_and_params(argc, argv);
    if (!params_result) {
        LOG_ERROR("Failed to parse arguments: {}", params_result.error());
        std::println(stderr, "Error: {}", params_result.error());
        return -1;
    }

    auto params = std::move(*params_result);

    LOG_INFO("ARPlace: {} models, {} reference images in '{}'",
             params->placement.models.size(),
             params->placement.reference_images.size(),
             params->placement.reference_image_group);
    LOG_INFO("Initial mode: {}, plane indicators {}",
             arp::to_string(params->placement.initial_mode),
             params->placement.show_surfaces ? "shown" : "hidden");
    if (!params->config_file.empty()) {
        LOG_INFO("Configuration: {}", params->config_file.string());
    }

    arp::Application app;
    const int result = app.run(std::move(params));
    arp::core::Logger::get().flush();
    return result;
}
