// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef GAMMA_HPP
#define GAMMA_HPP

#include <array>
#include <string_view>
#include <vector>

namespace tintd {

enum class filter_color {
    none,
    orange,
    red,
    green,
    blue,
};

std::string_view filter_color_name(filter_color);
// Throws std::invalid_argument on unknown names.
filter_color filter_color_from_name(std::string_view);

// Normalized transfer table, one sample sequence per channel.
// All three channels have the same size, samples are in [0, 1].
struct gamma_table {
    std::vector<double> red;
    std::vector<double> green;
    std::vector<double> blue;

    size_t size() const;
    bool valid() const;
    bool operator==(const gamma_table &) const = default;
};

// Identity ramp of the given size, as set by the X server on startup.
gamma_table linear_table(size_t sz);

// Per-channel multipliers applied after brightness scaling.
std::array<double, 3> channel_weights(filter_color color, double intensity);

// Derives a new table from the baseline. Pure and deterministic.
gamma_table compute_table(const gamma_table &baseline, double brightness, filter_color color, double intensity);

}

#endif // GAMMA_HPP
