// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <stdexcept>
#include <unistd.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <tintd/api.hpp>
#include <tintd/file.hpp>
#include <tintd/constants.hpp>

namespace tintd {

bool daemon_start() {

    if (daemon_is_running())
        return false;

    const pid_t pid = fork();

    if (pid > 0)
        return true;

    if (pid == 0) {
        execl(CMAKE_INSTALL_DAEMON_PATH, CMAKE_INSTALL_DAEMON_PATH, nullptr);
        throw std::runtime_error(fmt::format("execl({}) fail\n", CMAKE_INSTALL_DAEMON_PATH));
    }

    throw std::runtime_error("fork() fail");
}

bool daemon_stop() {
    if (daemon_is_running()) {
        daemon_send("stop");
        return true;
    }
    return false;
}

bool daemon_is_running() {
    lockfile flock(xdg_runtime_dir() / constants::flock_filename, false);
    return flock.locked();
}

void daemon_send(std::string_view s) {
    lockfile flock(xdg_runtime_dir() / constants::flock_filename_cli, true);
    spdlog::debug("[api] send: {}", s);
    file_write(xdg_runtime_dir() / constants::fifo_filename, s);
}

std::string daemon_get(std::string_view s) {
    lockfile flock(xdg_runtime_dir() / constants::flock_filename_cli, true);
    file_write(xdg_runtime_dir() / constants::fifo_filename, s);
    return file_read(xdg_runtime_dir() / constants::fifo_filename);
}

std::pair<double, double> brightness_range() {
    return {constants::brightness_min, constants::brightness_max};
}

std::pair<double, double> intensity_range() {
    return {constants::intensity_min, constants::intensity_max};
}

}
