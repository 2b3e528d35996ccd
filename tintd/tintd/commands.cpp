// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <tintd/commands.hpp>

namespace tintd {

command parse_command(const nlohmann::json &msg) {
    if (!msg.is_object()) {
        throw std::invalid_argument("command must be a json object");
    }

    command cmd;

    if (msg.contains("screen")) {
        const nlohmann::json &screen = msg["screen"];
        if (!screen.is_number_integer())
            throw std::invalid_argument("screen index must be an integer");
        if (!screen.is_number_unsigned())
            throw std::invalid_argument("negative screen index");
        cmd.screen = screen.get<size_t>();
    }

    if (msg.contains("reset"))
        cmd.reset = msg["reset"].get<bool>();

    if (msg.contains("brightness"))
        cmd.brightness = msg["brightness"].get<double>();

    if (msg.contains("color"))
        cmd.color = filter_color_from_name(msg["color"].get<std::string>());

    if (msg.contains("intensity"))
        cmd.intensity = msg["intensity"].get<double>();

    return cmd;
}

nlohmann::json to_json(const command &cmd) {
    nlohmann::json ret = nlohmann::json::object();
    if (cmd.screen)
        ret["screen"] = *cmd.screen;
    if (cmd.reset)
        ret["reset"] = true;
    if (cmd.brightness)
        ret["brightness"] = *cmd.brightness;
    if (cmd.color)
        ret["color"] = std::string(filter_color_name(*cmd.color));
    if (cmd.intensity)
        ret["intensity"] = *cmd.intensity;
    return ret;
}

size_t execute(adjustment_engine &engine, const command &cmd) {
    const std::vector<display_id> ids = engine.displays();

    std::vector<display_id> targets;
    if (cmd.screen) {
        if (*cmd.screen >= ids.size()) {
            spdlog::warn("[commands] invalid screen index: {} ({} screens)", *cmd.screen, ids.size());
            return 0;
        }
        targets.push_back(ids[*cmd.screen]);
    } else {
        targets = ids;
    }

    for (const display_id &id : targets) {
        if (cmd.reset) {
            engine.reset(id);
            continue;
        }
        const adjustment_state cur = engine.target_state(id);
        engine.request_adjustment(id,
                                  cmd.brightness.value_or(cur.brightness),
                                  cmd.color.value_or(cur.color),
                                  cmd.intensity.value_or(cur.intensity));
    }

    return targets.size();
}

nlohmann::json status(const adjustment_engine &engine) {
    nlohmann::json ret = nlohmann::json::array();
    size_t idx = 0;
    for (const auto &[id, state] : engine.snapshot()) {
        ret.push_back({
            {"screen", idx++},
            {"id", id},
            {"brightness", std::max(constants::brightness_min, state.brightness)},
            {"color", std::string(filter_color_name(state.color))},
            {"intensity", state.intensity},
        });
    }
    return ret;
}

}
