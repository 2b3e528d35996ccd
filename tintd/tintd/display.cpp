// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <cmath>
#include <limits>
#include <span>
#include <stdexcept>

#include <tintd/display.hpp>

namespace tintd {

namespace {
constexpr double ramp_max = std::numeric_limits<uint16_t>::max();
}

gamma_table table_from_ramps(const std::vector<uint16_t> &ramps) {
    if (ramps.empty() || ramps.size() % 3 != 0) {
        throw std::runtime_error("gamma ramp size is not a multiple of 3");
    }

    const size_t sz (ramps.size() / 3);
    const std::span r (ramps.begin(), sz);
    const std::span g (r.end(), sz);
    const std::span b (g.end(), sz);

    const auto normalize = [] (uint16_t v) { return v / ramp_max; };

    gamma_table table;
    table.red.resize(sz);
    table.green.resize(sz);
    table.blue.resize(sz);
    std::ranges::transform(r, table.red.begin(), normalize);
    std::ranges::transform(g, table.green.begin(), normalize);
    std::ranges::transform(b, table.blue.begin(), normalize);
    return table;
}

std::vector<uint16_t> ramps_from_table(const gamma_table &table) {
    const size_t sz (table.size());
    if (table.green.size() != sz || table.blue.size() != sz) {
        throw std::runtime_error("gamma table channels differ in size");
    }

    std::vector<uint16_t> ramps (sz * 3);
    const std::span r (ramps.begin(), sz);
    const std::span g (r.end(), sz);
    const std::span b (g.end(), sz);

    const auto quantize = [] (double v) { return uint16_t(std::lround(std::clamp(v, 0., 1.) * ramp_max)); };

    std::ranges::transform(table.red, r.begin(), quantize);
    std::ranges::transform(table.green, g.begin(), quantize);
    std::ranges::transform(table.blue, b.begin(), quantize);
    return ramps;
}

}
