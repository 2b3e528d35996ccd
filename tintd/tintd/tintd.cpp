// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <thread>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <sdbus-c++/Error.h>

#include <tintd/file.hpp>
#include <tintd/utils.hpp>
#include <tintd/sd-dbus.hpp>
#include <tintd/config.hpp>
#include <tintd/constants.hpp>
#include <tintd/randr_display.hpp>
#include <tintd/scheduler.hpp>
#include <tintd/commands.hpp>

using namespace tintd;

void refresh(adjustment_engine &engine) {
    const size_t added = engine.refresh_displays();
    if (added > 0) {
        spdlog::info("[refresh] {} new display(s)", added);
    }
    engine.reapply();
}

void handle_message(adjustment_engine &engine, const named_pipe &pipe, const std::string &data) {
    if (data == "refresh") {
        refresh(engine);
        return;
    }

    if (data == "status") {
        // Will block execution until the client reads from the pipe.
        file_write(pipe.path(), status(engine).dump());
        return;
    }

    try {
        const command cmd = parse_command(nlohmann::json::parse(data));
        const size_t n = execute(engine, cmd);
        spdlog::debug("[message] applied to {} screen(s): {}", n, data);
    } catch (const nlohmann::json::exception &e) {
        spdlog::error("[message] {}", e.what());
    } catch (const std::invalid_argument &e) {
        spdlog::error("[message] {}", e.what());
    }
}

int message_loop() {
    std::unique_ptr<randr_display_server> dsp = [] {
        try {
            return std::make_unique<randr_display_server>();
        } catch (const std::runtime_error &e) {
            spdlog::error("[x11] {}", e.what());
            return std::unique_ptr<randr_display_server>();
        }
    }();

    if (!dsp) {
        fmt::print("No X11 displays detected. There is nothing to do!\n");
        return EXIT_SUCCESS;
    }

    const config conf;

    adjustment_engine engine(*dsp, std::chrono::milliseconds(conf.engine.apply_period_ms));

    if (engine.displays().empty()) {
        fmt::print("No displays with gamma support. There is nothing to do!\n");
        return EXIT_SUCCESS;
    }

    spdlog::info("[x11] {} screen(s) with gamma support", engine.displays().size());

    const named_pipe pipe(xdg_runtime_dir() / constants::fifo_filename);

    const auto proxy = [&pipe] () -> std::unique_ptr<sdbus::IProxy> {
        try {
            return dbus::on_system_sleep([path = pipe.path()] (bool sleep) {
                if (!sleep)
                    file_write(path, "refresh");
            });
        } catch (const sdbus::Error &e) {
            spdlog::warn("[dbus] sleep notifications unavailable: {}", e.what());
            return nullptr;
        }
    }();

    std::optional<std::jthread> refresh_thread;
    if (conf.gamma.refresh_s > 0) {
        refresh_thread.emplace([&engine, &conf] (std::stop_token stoken) {
            spdlog::debug("[gamma refresh] start");
            while (true) {
                jthread_wait_until(std::chrono::seconds(conf.gamma.refresh_s), stoken);
                if (stoken.stop_requested()) {
                    spdlog::debug("[gamma refresh] stop requested");
                    return;
                }
                SPDLOG_TRACE("[gamma refresh]");
                refresh(engine);
            }
        });
    }

	while (true) {
        const std::string data = [&] {
            try {
                return file_read(pipe.path());
            } catch (const std::exception &e) {
                spdlog::error("[pipe] read failed: {}", e.what());
                return std::string();
            }
        }();

		if (data == "stop")
			break;

        if (data.empty())
            continue;

        handle_message(engine, pipe, data);
	}

    refresh_thread.reset();

    if (conf.gamma.restore_on_exit) {
        spdlog::debug("restoring original gamma");
        engine.restore_all();
    }

    spdlog::debug("{:=^60}", "end");
	return EXIT_SUCCESS;
}

int main(int argc, char **argv) {
    if (argc > 1 && std::strcmp(argv[1], "-v") == 0) {
        std::puts(VERSION);
        std::exit(EXIT_SUCCESS);
    }

    std::filesystem::create_directories(xdg_state_dir() / "tintd");
    spdlog::set_level(spdlog::level::warn);
    spdlog::cfg::load_env_levels();
    spdlog::set_default_logger(spdlog::rotating_logger_mt("tintd", xdg_state_dir() / "tintd/logs/tintd.log", 1048576 * 5, 3));
    spdlog::flush_every(std::chrono::seconds(10));
    spdlog::info("tintd v{}", VERSION);

    lockfile flock(xdg_runtime_dir() / constants::flock_filename, false);
    if (flock.locked()) {
        return -1;
    }

    return message_loop();
}
