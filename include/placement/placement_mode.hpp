/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace arp {

    enum class PlacementMode : uint8_t {
        FreeForm,
        Surface,
        Marker
    };

    // "freeform", "surface", "marker"
    std::string_view to_string(PlacementMode mode);

    // Accepts the names produced by to_string(), case-insensitive, plus the
    // aliases "free", "plane" and "image".
    std::optional<PlacementMode> parse_placement_mode(std::string_view name);

} // namespace arp
