// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef RANDR_DISPLAY_HPP
#define RANDR_DISPLAY_HPP

#include <vector>

#include <tintd/display.hpp>
#include <tintd/x11-xcb.hpp>

namespace tintd {

// X11 RandR backend. Every call to displays() re-enumerates the outputs,
// so hotplugged screens show up and unplugged ones stop resolving.
class randr_display_server : public display_server {
    xcb::connection conn_;
    std::vector<xcb::randr::output> outputs_;

    const xcb::randr::output &find(const display_id &id) const;
public:
    randr_display_server();
    std::vector<display_id> displays() override;
    gamma_table read_gamma(const display_id &id) override;
    void write_gamma(const display_id &id, const gamma_table &table) override;
};

}

#endif // RANDR_DISPLAY_HPP
