// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <cmath>
#include <span>
#include <stdexcept>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <tintd/gamma.hpp>
#include <tintd/constants.hpp>

namespace tintd {

std::string_view filter_color_name(filter_color color) {
    using enum filter_color;
    switch (color) {
    case none:
        return "none";
    case orange:
        return "orange";
    case red:
        return "red";
    case green:
        return "green";
    case blue:
        return "blue";
    }
    return "error: more colors than names";
}

filter_color filter_color_from_name(std::string_view name) {
    using enum filter_color;
    for (const filter_color color : {none, orange, red, green, blue}) {
        if (filter_color_name(color) == name)
            return color;
    }
    throw std::invalid_argument(fmt::format("unknown filter color: {}", name));
}

size_t gamma_table::size() const {
    return red.size();
}

bool gamma_table::valid() const {
    if (red.empty() || green.size() != red.size() || blue.size() != red.size())
        return false;

    const auto in_range = [] (double x) { return x >= 0. && x <= 1.; };
    return std::ranges::all_of(red, in_range)
        && std::ranges::all_of(green, in_range)
        && std::ranges::all_of(blue, in_range);
}

gamma_table linear_table(size_t sz) {
    gamma_table table;
    table.red.resize(sz);
    for (size_t i = 0; i < sz; ++i) {
        table.red[i] = sz > 1 ? double(i) / (sz - 1) : 1.;
    }
    table.green = table.red;
    table.blue  = table.red;
    return table;
}

// Boosted channels are capped by the final clamp in compute_table.
std::array<double, 3> channel_weights(filter_color color, double intensity) {
    const double i   = std::isnan(intensity) ? constants::intensity_max
                     : std::clamp(intensity, constants::intensity_min, constants::intensity_max);
    const double cut = 1. - 0.8 * i;

    using enum filter_color;
    switch (color) {
    case orange:
        return {1. + 0.5 * i, 1. - 0.3 * i, cut};
    case red:
        return {1. + 0.3 * i, cut, cut};
    case green:
        return {cut, 1. + 0.3 * i, cut};
    case blue:
        return {cut, cut, 1. + 0.3 * i};
    case none:
        break;
    }
    return {1., 1., 1.};
}

gamma_table compute_table(const gamma_table &baseline, double brightness, filter_color color, double intensity) {
    const double brt     = std::isnan(brightness) ? constants::brightness_max
                         : std::clamp(brightness, constants::brightness_min, constants::brightness_max);
    const auto   weights = channel_weights(color, intensity);

    SPDLOG_TRACE("[gamma] compute_table(brt: {}, color: {}, weights: [{}, {}, {}])",
                 brt, filter_color_name(color), weights[0], weights[1], weights[2]);

    gamma_table out;
    const std::array<std::span<const double>, 3> in {baseline.red, baseline.green, baseline.blue};
    const std::array<std::vector<double>*, 3> channels {&out.red, &out.green, &out.blue};

    for (size_t c = 0; c < channels.size(); ++c) {
        std::vector<double> &dst = *channels[c];
        dst.resize(in[c].size());
        for (size_t i = 0; i < in[c].size(); ++i) {
            dst[i] = std::clamp((in[c][i] * brt) * weights[c], 0., 1.);
        }
    }

    return out;
}

}
