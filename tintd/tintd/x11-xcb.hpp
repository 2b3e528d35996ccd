// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef X11_XCB_HPP
#define X11_XCB_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <xcb/xcb.h>
#include <xcb/randr.h>

namespace tintd {
namespace xcb {

void throw_if(xcb_generic_error_t *err, std::string err_str);

class connection {
    xcb_connection_t *addr_;
    std::vector<xcb_screen_t*> screens_;
public:
    connection();
    ~connection();
    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;
    xcb_connection_t* get() const;
    xcb_screen_t* first_screen() const;
    bool extension_present(std::string name) const;
};

namespace randr {
    struct output {
        std::string id;
        xcb_randr_crtc_t crtc_id;
        uint16_t ramp_size;
    };

    // Outputs currently driven by a CRTC.
    std::vector<output> outputs(const connection &conn, xcb_screen_t *screen);
    std::vector<uint16_t> get_gamma(const connection &conn, xcb_randr_crtc_t crtc);
    void set_gamma(const connection &conn, xcb_randr_crtc_t crtc, const std::vector<uint16_t> &ramps);
} // namespace randr

} // namespace xcb
} // namespace tintd

#endif // X11_XCB_HPP
