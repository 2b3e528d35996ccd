// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef DISPLAY_HPP
#define DISPLAY_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <tintd/gamma.hpp>

namespace tintd {

// Stable name of a display for the duration of the session, e.g. "HDMI-1".
using display_id = std::string;

// Access to the platform's display enumeration and transfer tables.
// Implementations are not thread-safe: callers serialize access.
// Failures are reported by throwing std::runtime_error (or a subclass).
class display_server {
public:
    virtual ~display_server() = default;

    virtual std::vector<display_id> displays() = 0;
    virtual gamma_table read_gamma(const display_id &id) = 0;
    virtual void write_gamma(const display_id &id, const gamma_table &table) = 0;
};

// Conversion between normalized tables and the 16-bit ramps used by the
// hardware, laid out as [r0..rn, g0..gn, b0..bn].
// Every 16-bit value survives a round-trip unchanged.
gamma_table table_from_ramps(const std::vector<uint16_t> &ramps);
std::vector<uint16_t> ramps_from_table(const gamma_table &table);

}

#endif // DISPLAY_HPP
