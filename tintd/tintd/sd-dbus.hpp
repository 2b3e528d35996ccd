// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SD_DBUS_HPP
#define SD_DBUS_HPP

#include <memory>
#include <string>
#include <functional>
#include <sdbus-c++/IProxy.h>

namespace tintd {
namespace dbus {

std::unique_ptr<sdbus::IProxy> register_signal_handler(
    std::string service,
    std::string obj_path,
    std::string interface,
    std::string signal_name,
    std::function<void(sdbus::Signal &signal)> handler);

// login1 PrepareForSleep: the handler receives true before suspend, false on resume.
std::unique_ptr<sdbus::IProxy> on_system_sleep(std::function<void(bool sleep)> fn);

} // namespace dbus
} // namespace tintd

#endif // SD_DBUS_HPP
