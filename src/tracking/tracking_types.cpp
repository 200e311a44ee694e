/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "tracking/tracking_types.hpp"

namespace arp::tracking {

    const char* to_string(AnchorKind kind) {
        switch (kind) {
        case AnchorKind::Surface: return "surface";
        case AnchorKind::Marker: return "marker";
        }
        return "unknown";
    }

} // namespace arp::tracking
