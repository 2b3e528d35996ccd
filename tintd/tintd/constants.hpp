// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CONSTANTS_HPP
#define CONSTANTS_HPP

#include <string_view>

namespace tintd {
namespace constants {
extern const std::string_view flock_filename;
extern const std::string_view flock_filename_cli;
extern const std::string_view fifo_filename;
extern const std::string_view config_filename;
extern const double brightness_min;
extern const double brightness_max;
extern const double intensity_min;
extern const double intensity_max;
extern const int apply_period_ms;
extern const int refresh_s;
}}

#endif // CONSTANTS_HPP
