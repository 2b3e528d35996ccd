// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <tintd/utils.hpp>

namespace tintd {

double lerp(double a, double b, double t) {
    return (b * t) + (a * (1. - t));
}

double invlerp(double x, double a, double b) {
    if (b - a <= 0.) {
        throw std::invalid_argument("invlerp: empty range");
    }
    return (x - a) / (b - a);
}

double remap(double x, double a, double b, double ka, double kb) {
    return lerp(ka, kb, invlerp(x, a, b));
}

void jthread_wait_until(std::chrono::milliseconds ms, std::stop_token stoken) {
    using namespace std::chrono;
    std::mutex mutex;
    std::unique_lock lock(mutex);
    std::condition_variable_any()
            .wait_until(lock, stoken, steady_clock::now() + ms, [&] { return stoken.stop_requested(); });
}

}
