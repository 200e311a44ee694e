/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <istream>
#include <memory>
#include <ostream>

namespace arp {

    namespace param {
        struct AppParameters;
    } // namespace param

    class Application {
    public:
        int run(std::unique_ptr<param::AppParameters> params);

        // Runs the session on the given command stream, printing every result to out
        int runCommands(const param::AppParameters& params, std::istream& in, std::ostream& out);
    };

} // namespace arp
