// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

#include <tintd/percentage.hpp>
#include <tintd/utils.hpp>

namespace tintd {

std::optional<percentage> parse_percentage(std::string_view str) {
    const bool relative = str.starts_with('+') || str.starts_with('-');
    const bool negative = str.starts_with('-');
    const std::string digits(relative ? str.substr(1) : str);

    // std::stod would also take leading blanks, a second sign, "nan" and "inf".
    if (digits.empty() || !(std::isdigit(static_cast<unsigned char>(digits[0])) || digits[0] == '.'))
        return std::nullopt;

    size_t pos = 0;
    double val;
    try {
        val = std::stod(digits, &pos);
    } catch (const std::logic_error &) {
        return std::nullopt;
    }

    if (pos != digits.size() || !std::isfinite(val))
        return std::nullopt;

    return percentage {negative ? -val : val, relative};
}

bool percentage_in_range(percentage p, int min, int max) {
    if (p.relative)
        return std::abs(p.val) <= max;
    return p.val >= min && p.val <= max;
}

double resolve(percentage p, double current, std::pair<double, double> range) {
    const double val = remap(p.val, 0., 100., 0., 1.);
    return std::clamp(p.relative ? current + val : val, range.first, range.second);
}

}
