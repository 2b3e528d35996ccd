// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

#include <tintd/display.hpp>
#include <tintd/gamma.hpp>
#include <tintd/gamma_store.hpp>
#include <tintd/constants.hpp>

namespace tintd {

struct adjustment_state {
    double brightness       = constants::brightness_max;
    filter_color color      = filter_color::none;
    double intensity        = constants::intensity_min;

    bool operator==(const adjustment_state &) const = default;
};

// Owns per-display adjustment state and rate-limits gamma writes.
//
// Requests only overwrite the pending state of a display. A periodic cycle,
// started lazily by the first request, materializes the pending states and
// stops as soon as a pass leaves nothing pending. A display is written only
// when its pending state differs from what was last applied.
//
// Every member function is safe to call from any thread.
class adjustment_engine {
public:
    struct display_status {
        display_id id;
        adjustment_state state;
    };

    adjustment_engine(display_server &dsp, std::chrono::milliseconds period);
    ~adjustment_engine();
    adjustment_engine(const adjustment_engine &) = delete;
    adjustment_engine(adjustment_engine &&) = delete;

    void request_adjustment(const display_id &id, double brightness, filter_color color, double intensity);
    // Immediate write of the captured baseline, bypassing the cycle.
    // A pending request is left in place and applied on the next pass.
    void reset(const display_id &id);

    double       current_brightness(const display_id &id) const;
    filter_color current_filter_color(const display_id &id) const;
    double       current_filter_intensity(const display_id &id) const;

    // Pending state if there is one, otherwise the last applied state.
    adjustment_state target_state(const display_id &id) const;

    // One pass of the apply cycle. Returns the number of writes issued.
    size_t apply_pending();

    // Captures baselines of displays that appeared since the last call.
    size_t refresh_displays();
    // Writes the last applied state of every display again,
    // for when the gamma ramps were changed behind our back.
    void reapply();
    void restore_all();

    std::vector<display_id> displays() const;
    std::vector<display_status> snapshot() const;
    bool cycle_running() const;

private:
    display_server *dsp_;
    gamma_store store_;
    std::chrono::milliseconds period_;
    std::map<display_id, adjustment_state> pending_;
    std::map<display_id, adjustment_state> last_applied_;
    bool cycle_running_ = false;
    mutable std::mutex mutex_;
    std::jthread cycle_;

    static adjustment_state sanitize(adjustment_state);
    adjustment_state applied_state(const display_id &id) const;
    size_t apply_locked();
    bool write(const display_id &id, const adjustment_state &state);
    void start_cycle();
    void cycle_loop(std::stop_token stoken);
};

}

#endif // SCHEDULER_HPP
