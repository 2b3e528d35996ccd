// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <cmath>
#include <exception>
#include <spdlog/spdlog.h>

#include <tintd/scheduler.hpp>
#include <tintd/utils.hpp>

namespace tintd {

adjustment_engine::adjustment_engine(display_server &dsp, std::chrono::milliseconds period)
: dsp_(&dsp),
  store_(dsp),
  period_(period) {
    std::lock_guard lock(mutex_);
    const size_t n = store_.capture_baseline();
    spdlog::info("[engine] {} display(s) with baseline, apply period: {}ms", n, period_.count());
}

adjustment_engine::~adjustment_engine() {
    cycle_.request_stop();
    if (cycle_.joinable())
        cycle_.join();
}

adjustment_state adjustment_engine::sanitize(adjustment_state state) {
    using namespace constants;
    // NaN compares false against both bounds and would pass through std::clamp.
    return {
        std::isnan(state.brightness) ? brightness_max : std::clamp(state.brightness, brightness_min, brightness_max),
        state.color,
        std::isnan(state.intensity) ? intensity_max : std::clamp(state.intensity, intensity_min, intensity_max),
    };
}

adjustment_state adjustment_engine::applied_state(const display_id &id) const {
    const auto it = last_applied_.find(id);
    return it != last_applied_.end() ? it->second : adjustment_state{};
}

void adjustment_engine::request_adjustment(const display_id &id, double brightness, filter_color color, double intensity) {
    const adjustment_state state = sanitize({brightness, color, intensity});

    std::lock_guard lock(mutex_);
    SPDLOG_TRACE("[engine] [{}] request(brt: {}, color: {}, intensity: {})", id, state.brightness, filter_color_name(state.color), state.intensity);
    pending_[id] = state;
    start_cycle();
}

void adjustment_engine::reset(const display_id &id) {
    std::lock_guard lock(mutex_);

    if (!store_.has_baseline(id)) {
        spdlog::debug("[engine] [{}] reset: unknown display", id);
        return;
    }

    store_.restore_baseline(id);
    last_applied_[id] = adjustment_state{};
    spdlog::debug("[engine] [{}] reset to baseline", id);
}

double adjustment_engine::current_brightness(const display_id &id) const {
    std::lock_guard lock(mutex_);
    return std::max(constants::brightness_min, applied_state(id).brightness);
}

filter_color adjustment_engine::current_filter_color(const display_id &id) const {
    std::lock_guard lock(mutex_);
    return applied_state(id).color;
}

double adjustment_engine::current_filter_intensity(const display_id &id) const {
    std::lock_guard lock(mutex_);
    return applied_state(id).intensity;
}

adjustment_state adjustment_engine::target_state(const display_id &id) const {
    std::lock_guard lock(mutex_);
    const auto it = pending_.find(id);
    return it != pending_.end() ? it->second : applied_state(id);
}

// False only when there is no baseline to derive from.
// A rejected write is logged and still counts as issued.
bool adjustment_engine::write(const display_id &id, const adjustment_state &state) {
    const auto baseline = store_.baseline(id);
    if (!baseline) {
        return false;
    }

    try {
        dsp_->write_gamma(id, compute_table(*baseline, state.brightness, state.color, state.intensity));
    } catch (const std::exception &e) {
        spdlog::warn("[engine] [{}] gamma write failed: {}", id, e.what());
    }
    return true;
}

size_t adjustment_engine::apply_locked() {
    size_t writes = 0;

    for (const auto &[id, state] : pending_) {
        if (state == applied_state(id)) {
            SPDLOG_TRACE("[engine] [{}] unchanged, skipping", id);
            continue;
        }

        if (!write(id, state)) {
            spdlog::debug("[engine] [{}] no baseline, skipping", id);
            continue;
        }

        last_applied_[id] = state;
        ++writes;
    }

    pending_.clear();
    return writes;
}

size_t adjustment_engine::apply_pending() {
    std::lock_guard lock(mutex_);
    return apply_locked();
}

// Must be called with mutex_ held.
void adjustment_engine::start_cycle() {
    if (cycle_running_)
        return;

    cycle_running_ = true;
    // The previous cycle, if any, has already left the critical section
    // for good: replacing it only joins a finishing thread.
    cycle_ = std::jthread([this] (std::stop_token stoken) {
        cycle_loop(stoken);
    });
    SPDLOG_TRACE("[engine] cycle started");
}

void adjustment_engine::cycle_loop(std::stop_token stoken) {
    while (true) {
        jthread_wait_until(period_, stoken);

        if (stoken.stop_requested())
            return;

        std::lock_guard lock(mutex_);
        const size_t writes = apply_locked();
        SPDLOG_TRACE("[engine] cycle pass: {} write(s)", writes);

        if (pending_.empty()) {
            cycle_running_ = false;
            SPDLOG_TRACE("[engine] cycle stopped");
            return;
        }
    }
}

size_t adjustment_engine::refresh_displays() {
    std::lock_guard lock(mutex_);
    return store_.capture_baseline();
}

void adjustment_engine::reapply() {
    std::lock_guard lock(mutex_);
    for (const display_id &id : store_.displays()) {
        const adjustment_state state = applied_state(id);
        if (state == adjustment_state{}) {
            store_.restore_baseline(id);
        } else {
            write(id, state);
        }
    }
}

void adjustment_engine::restore_all() {
    std::lock_guard lock(mutex_);
    pending_.clear();
    for (const display_id &id : store_.displays()) {
        store_.restore_baseline(id);
        last_applied_[id] = adjustment_state{};
    }
}

std::vector<display_id> adjustment_engine::displays() const {
    std::lock_guard lock(mutex_);
    return store_.displays();
}

std::vector<adjustment_engine::display_status> adjustment_engine::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<display_status> ret;
    for (const display_id &id : store_.displays()) {
        ret.push_back({id, applied_state(id)});
    }
    return ret;
}

bool adjustment_engine::cycle_running() const {
    std::lock_guard lock(mutex_);
    return cycle_running_;
}

}
