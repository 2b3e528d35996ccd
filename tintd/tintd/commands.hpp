// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef COMMANDS_HPP
#define COMMANDS_HPP

#include <optional>
#include <nlohmann/json_fwd.hpp>

#include <tintd/gamma.hpp>
#include <tintd/scheduler.hpp>

namespace tintd {

// A message received on the daemon pipe, e.g.
// {"screen": 0, "brightness": 0.5, "color": "red", "intensity": 0.2}
// {"reset": true}
// Without "screen" the command targets every screen.
struct command {
    std::optional<size_t> screen;
    bool reset = false;
    std::optional<double> brightness;
    std::optional<filter_color> color;
    std::optional<double> intensity;
};

// Throws nlohmann::json::exception or std::invalid_argument on malformed input.
command parse_command(const nlohmann::json &msg);
nlohmann::json to_json(const command &cmd);

// Fields left out of the command keep the screen's current target.
// Returns the number of screens the command was applied to.
size_t execute(adjustment_engine &engine, const command &cmd);

// [{"screen": 0, "id": "HDMI-1", "brightness": 1.0, "color": "none", "intensity": 0.0}, ...]
nlohmann::json status(const adjustment_engine &engine);

}

#endif // COMMANDS_HPP
