// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <array>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <string>
#include <string_view>
#include <sstream>
#include <stdexcept>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <tintd/file.hpp>

namespace tintd {

named_pipe::named_pipe(std::filesystem::path filepath) : filepath_(filepath) {
    fd_ = mkfifo(filepath_.c_str(), S_IFIFO | 0640);
    if (fd_ < 0) {
        spdlog::error("[named_pipe] mkfifo error: {}", filepath_.string());
    }
}

std::filesystem::path named_pipe::path() const {
    return filepath_;
}

named_pipe::~named_pipe() {
    std::error_code ec;
    std::filesystem::remove(filepath_, ec);
}

lockfile::lockfile(std::filesystem::path filepath, bool wait)
    : filepath_(filepath),
      fd_(open(filepath_.c_str(), O_WRONLY | O_CREAT, 0640)) {

    if (fd_ < 0) {
        throw std::runtime_error(fmt::format("[lockfile] open() failed: {}", filepath_.string()));
    }

    fl_.l_type   = F_WRLCK;
    fl_.l_whence = SEEK_SET;
    fl_.l_start  = 0;
    fl_.l_len    = 1;
    fnctl_op_    = fcntl(fd_, wait ? F_SETLKW : F_SETLK, &fl_);
}

bool lockfile::locked() const {
    return fnctl_op_ < 0;
}

lockfile::~lockfile() {
    if (fnctl_op_ == 0) {
        fl_.l_type = F_UNLCK;
        fcntl(fd_, F_SETLK, &fl_);
        std::error_code ec;
        std::filesystem::remove(filepath_, ec);
    }
    close(fd_);
}

std::string file_read(std::filesystem::path filepath) {
    std::ifstream fs(filepath);
    fs.exceptions(std::ifstream::failbit);

    std::ostringstream buf;
    buf << fs.rdbuf();

    return buf.str();
}

void file_write(std::filesystem::path filepath, std::string_view data) {
    std::ofstream fs(filepath);
    fs.exceptions(std::ofstream::failbit);
    fs.write(data.data(), data.size());
}

std::string env(std::string_view var) {
    const auto s = std::getenv(var.data());
    return s ? s : "";
}

namespace {
std::filesystem::path xdg_dir(const std::array<std::array<std::string_view, 2>, 2> &env_vars, std::string_view name) {
    std::filesystem::path ret;

    for (const auto &arr : env_vars) {
        if (arr[0].empty()) {
            ret = arr[1];
            break;
        }

        const std::string env_var = env(arr[0]);
        if (!env_var.empty()) {
            ret = fmt::format("{}{}", env_var, arr[1]);
            break;
        }
    }

    if (ret.is_relative())
        throw std::runtime_error(fmt::format("{} should be absolute", name));

    return ret;
}
}

std::filesystem::path xdg_config_dir() {
    return xdg_dir({{
        {"XDG_CONFIG_HOME", ""},
        {"HOME", "/.config"}
    }}, "xdg_config_dir");
}

std::filesystem::path xdg_state_dir() {
    return xdg_dir({{
        {"XDG_STATE_HOME", ""},
        {"HOME", "/.local/state"}
    }}, "xdg_state_dir");
}

std::filesystem::path xdg_runtime_dir() {
    return xdg_dir({{
        {"XDG_RUNTIME_DIR", ""},
        {"", "/var/run"}
    }}, "xdg_runtime_dir");
}

} // namespace tintd
