/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "placement/placement_mode.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace arp {

    std::string_view to_string(PlacementMode mode) {
        switch (mode) {
        case PlacementMode::FreeForm: return "freeform";
        case PlacementMode::Surface: return "surface";
        case PlacementMode::Marker: return "marker";
        }
        return "unknown";
    }

    std::optional<PlacementMode> parse_placement_mode(std::string_view name) {
        std::string lowered(name);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lowered == "freeform" || lowered == "free")
            return PlacementMode::FreeForm;
        if (lowered == "surface" || lowered == "plane")
            return PlacementMode::Surface;
        if (lowered == "marker" || lowered == "image")
            return PlacementMode::Marker;
        return std::nullopt;
    }

} // namespace arp
