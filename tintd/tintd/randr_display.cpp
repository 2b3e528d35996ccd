// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <stdexcept>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <tintd/randr_display.hpp>

namespace tintd {

randr_display_server::randr_display_server()
: conn_() {
    if (!conn_.extension_present("RANDR")) {
        throw std::runtime_error("RANDR extension not available");
    }
    outputs_ = xcb::randr::outputs(conn_, conn_.first_screen());
}

const xcb::randr::output &randr_display_server::find(const display_id &id) const {
    const auto it = std::ranges::find(outputs_, id, &xcb::randr::output::id);
    if (it == outputs_.end()) {
        throw std::runtime_error(fmt::format("[randr] unknown output: {}", id));
    }
    return *it;
}

std::vector<display_id> randr_display_server::displays() {
    outputs_ = xcb::randr::outputs(conn_, conn_.first_screen());

    std::vector<display_id> ret(outputs_.size());
    std::ranges::transform(outputs_, ret.begin(), &xcb::randr::output::id);
    return ret;
}

gamma_table randr_display_server::read_gamma(const display_id &id) {
    const auto &out = find(id);
    return table_from_ramps(xcb::randr::get_gamma(conn_, out.crtc_id));
}

void randr_display_server::write_gamma(const display_id &id, const gamma_table &table) {
    const auto &out = find(id);
    if (table.size() != out.ramp_size) {
        throw std::runtime_error(fmt::format("[randr] {}: table size {} does not match ramp size {}", id, table.size(), out.ramp_size));
    }
    SPDLOG_TRACE("[randr] [{}] set_gamma (crtc: {})", id, out.crtc_id);
    xcb::randr::set_gamma(conn_, out.crtc_id, ramps_from_table(table));
}

}
