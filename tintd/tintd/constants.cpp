// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <tintd/constants.hpp>
#include <string_view>

namespace tintd {
namespace constants {
constexpr std::string_view flock_filename     = "tintd-lock";
constexpr std::string_view flock_filename_cli = "tintd-lock-cli";
constexpr std::string_view fifo_filename      = "tintd-fifo";
constexpr std::string_view config_filename    = "tintconf.json";
constexpr double brightness_min  = 0.05;
constexpr double brightness_max  = 1.0;
constexpr double intensity_min   = 0.0;
constexpr double intensity_max   = 1.0;
constexpr int    apply_period_ms = 100;
constexpr int    refresh_s       = 10;
}}
