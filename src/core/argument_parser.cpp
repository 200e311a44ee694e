/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include "core/logger.hpp"
#include "core/parameters.hpp"
#include <args.hxx>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <format>
#include <functional>
#include <optional>
#include <print>
#include <tuple>

namespace {

    /**
     * @brief Locate a file in the parameter directory next to the installation
     * @param filename Name of the configuration file
     * @return Full path, or nullopt when no parameter directory holds the file
     */
    std::optional<std::filesystem::path> find_config_path(const std::string& filename) {
        std::error_code ec;
        std::filesystem::path executable_path = std::filesystem::canonical("/proc/self/exe", ec);
        if (ec) {
            return std::nullopt;
        }

        // Build trees put the executable one or two levels below the source root
        std::filesystem::path search_dir = executable_path.parent_path();
        while (!search_dir.empty()) {
            const auto candidate = search_dir / "parameter" / filename;
            if (std::filesystem::exists(candidate)) {
                return candidate;
            }
            auto parent = search_dir.parent_path();
            if (parent == search_dir) { // Reached the root
                break;
            }
            search_dir = parent;
        }
        return std::nullopt;
    }

    enum class ParseResult {
        Success,
        Help
    };

    std::expected<std::tuple<ParseResult, std::function<void()>>, std::string> parse_arguments(
        const std::vector<std::string>& args,
        arp::param::AppParameters& params) {

        try {
            ::args::ArgumentParser parser(
                "ARPlace: place virtual models on tracked surfaces, markers or in front of the camera.\n",
                "Usage:\n"
                "  ARPlace [--config <json>] [--script <file>] [options]\n"
                "  Without --script, commands are read from standard input. Type 'help' for the list.\n");

            // Define all arguments
            ::args::HelpFlag help(parser, "help", "Display help menu", {'h', "help"});
            ::args::CompletionFlag completion(parser, {"complete"});

            // config file argument
            ::args::ValueFlag<std::string> config_file(parser, "config_file", "ARPlace config file (json)", {'c', "config"});
            ::args::ValueFlag<std::string> script(parser, "script", "Command script to run instead of standard input", {'s', "script"});

            // Placement overrides
            ::args::ValueFlag<std::string> mode(parser, "mode", "Initial placement mode: freeform, surface, marker", {'m', "mode"});
            ::args::ValueFlag<std::string> model(parser, "model", "Model selected at startup", {"model"});
            ::args::Flag show_surfaces(parser, "show_surfaces", "Show plane indicators from the start", {"show-surfaces"});

            // Logging options
            ::args::ValueFlag<std::string> log_level(parser, "level", "Log level: trace, debug, info, warn, error, critical, off (default: info)", {"log-level"});
            ::args::ValueFlag<std::string> log_file(parser, "file", "Optional log file path", {"log-file"});
            ::args::ValueFlagList<std::string> log_modules(parser, "module=level",
                                                           "Raise the minimum level of one module (core, tracking, scene, placement, input, session). Repeatable",
                                                           {"log-module"});

            // Parse arguments
            try {
                parser.Prog(args.front());
                parser.ParseArgs(std::vector<std::string>(args.begin() + 1, args.end()));
            } catch (const ::args::Help&) {
                std::print("{}", parser.Help());
                return std::make_tuple(ParseResult::Help, std::function<void()>{});
            } catch (const ::args::Completion& e) {
                std::print("{}", e.what());
                return std::make_tuple(ParseResult::Help, std::function<void()>{});
            } catch (const ::args::ParseError& e) {
                return std::unexpected(std::format("Parse error: {}\n{}", e.what(), parser.Help()));
            }

            // Initialize logger based on command line arguments
            {
                auto level = arp::core::LogLevel::Info; // Default level
                std::string log_file_path;

                if (log_level) {
                    const auto level_str = ::args::get(log_level);
                    auto parsed = arp::core::parse_log_level(level_str);
                    if (!parsed) {
                        return std::unexpected(std::format(
                            "ERROR: Invalid log level '{}'. Valid levels are: trace, debug, info, warn, error, critical, off",
                            level_str));
                    }
                    level = *parsed;
                }

                if (log_file) {
                    log_file_path = ::args::get(log_file);
                }

                // Initialize the logger with the specified level and optional file
                arp::core::Logger::get().init(level, log_file_path);
                params.log_level = level;
                params.log_file = log_file_path;

                for (const auto& entry : ::args::get(log_modules)) {
                    const auto separator = entry.find('=');
                    const auto module = arp::core::parse_log_module(entry.substr(0, separator));
                    const auto module_level = separator == std::string::npos
                                                  ? std::nullopt
                                                  : arp::core::parse_log_level(entry.substr(separator + 1));
                    if (!module || !module_level) {
                        return std::unexpected(std::format(
                            "ERROR: Invalid log module setting '{}'. Expected <module>=<level>, e.g. tracking=warn",
                            entry));
                    }
                    if (*module_level == arp::core::LogLevel::Off) {
                        arp::core::Logger::get().enable_module(*module, false);
                    } else {
                        arp::core::Logger::get().set_module_level(*module, *module_level);
                    }
                }

                LOG_DEBUG("Logger initialized with level: {}", static_cast<int>(level));
                if (!log_file_path.empty()) {
                    LOG_DEBUG("Logging to file: {}", log_file_path);
                }
            }

            // Check if explicitly displaying help
            if (help) {
                return std::make_tuple(ParseResult::Help, std::function<void()>{});
            }

            if (config_file) {
                params.config_file = ::args::get(config_file);
            }

            if (script) {
                params.script_path = ::args::get(script);
                if (!std::filesystem::exists(params.script_path)) {
                    return std::unexpected(std::format("Script file does not exist: {}", params.script_path.string()));
                }
            }

            // Validate mode if provided
            std::optional<arp::PlacementMode> mode_val;
            if (mode) {
                const auto mode_str = ::args::get(mode);
                mode_val = arp::parse_placement_mode(mode_str);
                if (!mode_val) {
                    return std::unexpected(std::format(
                        "ERROR: Invalid placement mode '{}'. Valid modes are: freeform, surface, marker",
                        mode_str));
                }
            }

            // Create lambda to apply command line overrides after JSON loading
            auto apply_cmd_overrides = [&params,
                                        mode_val,
                                        model_val = model ? std::optional<std::string>(::args::get(model)) : std::optional<std::string>(),
                                        show_surfaces_flag = bool(show_surfaces)]() {
                auto& placement = params.placement;

                if (mode_val) {
                    placement.initial_mode = *mode_val;
                }
                if (model_val) {
                    params.initial_model = model_val;
                }
                if (show_surfaces_flag) {
                    placement.show_surfaces = true;
                }
            };

            return std::make_tuple(ParseResult::Success, apply_cmd_overrides);

        } catch (const std::exception& e) {
            return std::unexpected(std::format("Unexpected error during argument parsing: {}", e.what()));
        }
    }

    std::vector<std::string> convert_args(int argc, const char* const argv[]) {
        return std::vector<std::string>(argv, argv + argc);
    }
} // anonymous namespace

// Public interface
std::expected<std::unique_ptr<arp::param::AppParameters>, std::string>
arp::args::parse_args_and_params(int argc, const char* const argv[]) {

    auto params = std::make_unique<arp::param::AppParameters>();

    // Parse command line arguments
    auto parse_result = parse_arguments(convert_args(argc, argv), *params);
    if (!parse_result) {
        return std::unexpected(parse_result.error());
    }

    auto [result, apply_overrides] = *parse_result;

    // Handle help case
    if (result == ParseResult::Help) {
        std::exit(0);
    }

    // An explicit config must load, the shipped default is optional
    std::optional<std::filesystem::path> config_to_read;
    if (!params->config_file.empty()) {
        config_to_read = params->config_file;
    } else {
        config_to_read = find_config_path("default_config.json");
        if (!config_to_read) {
            LOG_DEBUG("No parameter/default_config.json found, using built-in defaults");
        }
    }

    if (config_to_read) {
        auto app_params_result = arp::param::read_app_params_from_json(*config_to_read);
        if (!app_params_result) {
            return std::unexpected(std::format("Failed to load configuration: {}",
                                               app_params_result.error()));
        }
        params->placement = app_params_result->placement;
        params->simulation = app_params_result->simulation;
        params->config_file = *config_to_read;
    }

    // Apply command line overrides
    if (apply_overrides) {
        apply_overrides();
    }

    return params;
}
