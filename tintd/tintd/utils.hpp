// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef UTILS_HPP
#define UTILS_HPP

#include <chrono>
#include <cstdlib>
#include <memory>
#include <stop_token>

namespace tintd {
// scale value in a [0, 1] range
double invlerp(double val, double min, double max);
// interpolate betweeen a and b
double lerp(double a, double b, double t);
// convert from one range to another
double remap(double val, double min, double max, double new_min, double new_max);

// Sleeps for the given time, or until a stop is requested on the token.
void jthread_wait_until(std::chrono::milliseconds ms, std::stop_token stoken);

template <class T>
struct c_deleter {
	void operator()(T *ptr) { std::free(ptr); }
};

template <class T>
using c_unique_ptr = std::unique_ptr<T, c_deleter<T>>;
}

#endif // UTILS_HPP
