// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <CLI/App.hpp>
#include <CLI/Formatter.hpp>
#include <CLI/Config.hpp>

#include <tintd/api.hpp>
#include <tintd/commands.hpp>
#include <tintd/gamma.hpp>
#include <tintd/percentage.hpp>

void start() {
    if (!tintd::daemon_start())
        std::puts("already started");
    std::exit(EXIT_SUCCESS);
}

void stop() {
    if (tintd::daemon_stop()) {
        std::puts("tint stopped");
    } else {
        std::puts("already stopped");
    }
	std::exit(EXIT_SUCCESS);
}

nlohmann::json get_status() {
    return nlohmann::json::parse(tintd::daemon_get("status"));
}

void status() {
    if (!tintd::daemon_is_running()) {
        std::puts("not running");
        std::exit(EXIT_SUCCESS);
    }

    std::string rows;
    for (const auto &scr : get_status()) {
        const std::string color = scr["color"].get<std::string>();
        const std::string filter_str = color == "none" ? color : fmt::format("{} ({}%)", color, int(std::lround(scr["intensity"].get<double>() * 100)));
        fmt::format_to(std::back_inserter(rows),
                       "[screen {}] {}: brightness: {}%, filter: {}\n",
                       scr["screen"].get<int>(),
                       scr["id"].get<std::string>(),
                       int(std::lround(scr["brightness"].get<double>() * 100)),
                       filter_str);
    }

    fmt::print("{}", rows);
	std::exit(EXIT_SUCCESS);
}

template <class T>
struct range {
    T min;
    T max;
    range(T mi, T mx) : min(mi), max(mx) {};

    std::string desc() const {
        return CLI::Range(min, max).get_description();
    }
};

std::string percentage_validator(const std::string &str, range<int> range) {
    const auto p = tintd::parse_percentage(str);
    if (p && tintd::percentage_in_range(*p, range.min, range.max)) {
        return "";
    }
    return fmt::format("Value {} not in range [{} - {}]", str, range.min, range.max);
}

std::optional<tintd::percentage> to_percentage(const std::string &str) {
    if (str.empty())
        return std::nullopt;
    return tintd::parse_percentage(str);
}

constexpr int option_count = 5;
static constexpr std::array<std::array<const char*, 2>, option_count> options {{
    {"-v,--version", "Print version and exit"},
    {"-s,--screen", "Index on which to apply the settings. If omitted, changes will be applied on all screens."},
    {"-b,--brightness", "Set brightness percentage. Use +N or -N for relative changes."},
    {"-c,--color", "Set the filter color."},
    {"-i,--intensity", "Set the filter intensity percentage. Use +N or -N for relative changes."},
}};

enum option_id {
    VERS,
    SCREEN_NUM,
    BRT_PERC,
    COLOR,
    INTENSITY_PERC,
};

int interface(int argc, char **argv) {
    CLI::App app("Software brightness and color filter for X11.", "tint");
	app.add_subcommand("start", "Start the background process.")->callback(start);
	app.add_subcommand("stop", "Stop the background process. Screens are restored to their original gamma.")->callback(stop);
	app.add_subcommand("status", "Show app / screen status.")->callback(status);
	const auto reset_cmd   = app.add_subcommand("reset", "Restore the original gamma of the selected screens.");
	const auto refresh_cmd = app.add_subcommand("refresh", "Detect new screens and write the current settings again.");

	app.add_flag(options[VERS][0], [] ([[maybe_unused]] int64_t t) {
		std::puts(VERSION);
		std::exit(0);
	}, options[VERS][1]);

    int screen_idx = -1;
    std::string brightness_str;
    std::string color_str;
    std::string intensity_str;

    const auto [brt_min, brt_max] = tintd::brightness_range();
    const range brightness_range(int(std::lround(brt_min * 100)), int(std::lround(brt_max * 100)));
    const range intensity_range(0, 100);

    const std::vector<std::string> color_names = [] {
        using enum tintd::filter_color;
        std::vector<std::string> vec;
        for (const auto c : {none, orange, red, green, blue})
            vec.emplace_back(tintd::filter_color_name(c));
        return vec;
    }();

    app.add_option(options[SCREEN_NUM][0], screen_idx, options[SCREEN_NUM][1])->check(CLI::Range(0, 99));
    app.add_option(options[BRT_PERC][0], brightness_str, options[BRT_PERC][1])->check(CLI::Validator([&] (const std::string &s) { return percentage_validator(s, brightness_range); }, brightness_range.desc()));
    app.add_option(options[COLOR][0], color_str, options[COLOR][1])->check(CLI::IsMember(color_names));
    app.add_option(options[INTENSITY_PERC][0], intensity_str, options[INTENSITY_PERC][1])->check(CLI::Validator([&] (const std::string &s) { return percentage_validator(s, intensity_range); }, intensity_range.desc()));

    spdlog::debug("parsing options");
	try {
		if (argc == 1) {
			app.parse("-h");
		} else {
			app.parse(argc, argv);
		}
	} catch (const CLI::ParseError &e) {
		return app.exit(e);
	}

    if (!tintd::daemon_is_running()) {
        std::puts("tint is not running. Run 'tint start' first.");
        return EXIT_FAILURE;
    }

    if (refresh_cmd->parsed()) {
        tintd::daemon_send("refresh");
        return EXIT_SUCCESS;
    }

    const bool single_screen = app.count("--screen") > 0;

    tintd::command cmd;
    if (single_screen)
        cmd.screen = size_t(screen_idx);

    if (reset_cmd->parsed()) {
        cmd.reset = true;
        tintd::daemon_send(tintd::to_json(cmd).dump());
        return EXIT_SUCCESS;
    }

    const std::optional<tintd::percentage> brightness = to_percentage(brightness_str);
    const std::optional<tintd::percentage> intensity  = to_percentage(intensity_str);
    if (!color_str.empty())
        cmd.color = tintd::filter_color_from_name(color_str);

    const bool relative = (brightness && brightness->relative) || (intensity && intensity->relative);

    if (!relative) {
        if (brightness)
            cmd.brightness = tintd::resolve(*brightness, 0., tintd::brightness_range());
        if (intensity)
            cmd.intensity = tintd::resolve(*intensity, 0., tintd::intensity_range());
        spdlog::debug("sending: {}", tintd::to_json(cmd).dump());
        tintd::daemon_send(tintd::to_json(cmd).dump());
        return EXIT_SUCCESS;
    }

    // Relative changes depend on each screen's current values.
    const nlohmann::json screens = get_status();

    if (single_screen && size_t(screen_idx) >= screens.size()) {
        fmt::print("Invalid screen number. Run `tint status` to check for valid ones.\n");
        return EXIT_FAILURE;
    }

    for (const auto &scr : screens) {
        const size_t idx = scr["screen"].get<size_t>();
        if (single_screen && idx != size_t(screen_idx))
            continue;

        tintd::command scr_cmd = cmd;
        scr_cmd.screen = idx;
        if (brightness)
            scr_cmd.brightness = tintd::resolve(*brightness, scr["brightness"].get<double>(), tintd::brightness_range());
        if (intensity)
            scr_cmd.intensity = tintd::resolve(*intensity, scr["intensity"].get<double>(), tintd::intensity_range());

        spdlog::debug("sending: {}", tintd::to_json(scr_cmd).dump());
        tintd::daemon_send(tintd::to_json(scr_cmd).dump());
    }

	return EXIT_SUCCESS;
}

int main(int argc, char **argv) {
    spdlog::cfg::load_env_levels();
    return interface(argc, argv);
}
