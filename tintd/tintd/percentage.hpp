// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef PERCENTAGE_HPP
#define PERCENTAGE_HPP

#include <optional>
#include <string_view>
#include <utility>

namespace tintd {

// A percentage, either absolute ("50") or relative to the current value ("+10", "-10").
struct percentage {
    double val;
    bool relative;
};

// Empty optional on anything that isn't a plain finite number with an optional sign.
std::optional<percentage> parse_percentage(std::string_view str);

// Absolute values must be in [min, max], relative steps in [-max, max].
bool percentage_in_range(percentage p, int min, int max);

// Applies the percentage to a [0, 1] value, clamped to the given range.
double resolve(percentage p, double current, std::pair<double, double> range);

}

#endif // PERCENTAGE_HPP
