// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef GAMMA_STORE_HPP
#define GAMMA_STORE_HPP

#include <map>
#include <optional>
#include <vector>

#include <tintd/display.hpp>
#include <tintd/gamma.hpp>

namespace tintd {

// Original transfer tables, captured the first time a display is seen.
// A captured baseline is never modified afterwards and never handed out by
// reference. Not thread-safe.
class gamma_store {
    display_server *dsp_;
    std::map<display_id, gamma_table> baselines_;
public:
    explicit gamma_store(display_server &dsp);

    // Returns the number of newly captured baselines.
    // Displays whose table cannot be read are left out.
    size_t capture_baseline();

    std::optional<gamma_table> baseline(const display_id &id) const;
    bool has_baseline(const display_id &id) const;
    std::vector<display_id> displays() const;

    // Writes the captured table back verbatim.
    // False if there is no baseline or the write was rejected.
    bool restore_baseline(const display_id &id);
};

}

#endif // GAMMA_STORE_HPP
