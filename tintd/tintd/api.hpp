// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef API_HPP
#define API_HPP

#include <string>
#include <string_view>
#include <utility>

namespace tintd {
    bool daemon_start();
    bool daemon_stop();
    bool daemon_is_running();
    void daemon_send(std::string_view s);
    // Sends a request and blocks until the daemon writes back.
    std::string daemon_get(std::string_view s);

    std::pair<double, double> brightness_range();
    std::pair<double, double> intensity_range();
}

#endif // API_HPP
