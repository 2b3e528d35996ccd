// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <chrono>
#include <functional>
#include <limits>
#include <thread>
#include <gtest/gtest.h>

#include <tintd/scheduler.hpp>
#include "fake_display.hpp"

using namespace tintd;
using namespace std::chrono_literals;
using tintd::test::calibrated_table;
using tintd::test::fake_display_server;

namespace {

// Long enough that the background cycle never fires during a test:
// passes are driven by hand through apply_pending().
constexpr auto manual_period = std::chrono::hours(1);

bool wait_for(const std::function<bool()> &pred, std::chrono::milliseconds timeout = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

class scheduler : public ::testing::Test {
protected:
    fake_display_server dsp;

    void SetUp() override {
        dsp.connect("HDMI-1");
        dsp.connect("DP-1", linear_table(1024));
    }
};

}

TEST_F(scheduler, initial_state) {
    adjustment_engine engine(dsp, manual_period);

    EXPECT_EQ(engine.displays(), (std::vector<display_id>{"DP-1", "HDMI-1"}));
    EXPECT_DOUBLE_EQ(engine.current_brightness("HDMI-1"), 1.0);
    EXPECT_EQ(engine.current_filter_color("HDMI-1"), filter_color::none);
    EXPECT_DOUBLE_EQ(engine.current_filter_intensity("HDMI-1"), 0.0);
    EXPECT_FALSE(engine.cycle_running());
    EXPECT_EQ(dsp.write_count("HDMI-1"), 0);
}

TEST_F(scheduler, unknown_display_reports_defaults) {
    adjustment_engine engine(dsp, manual_period);
    EXPECT_DOUBLE_EQ(engine.current_brightness("VGA-1"), 1.0);
    EXPECT_EQ(engine.current_filter_color("VGA-1"), filter_color::none);
    EXPECT_DOUBLE_EQ(engine.current_filter_intensity("VGA-1"), 0.0);
}

TEST_F(scheduler, request_is_clamped) {
    adjustment_engine engine(dsp, manual_period);

    engine.request_adjustment("HDMI-1", 0.0, filter_color::red, 1.7);
    const adjustment_state target = engine.target_state("HDMI-1");
    EXPECT_DOUBLE_EQ(target.brightness, 0.05);
    EXPECT_EQ(target.color, filter_color::red);
    EXPECT_DOUBLE_EQ(target.intensity, 1.0);

    // Not applied until the next pass.
    EXPECT_DOUBLE_EQ(engine.current_brightness("HDMI-1"), 1.0);

    EXPECT_EQ(engine.apply_pending(), 1u);
    EXPECT_DOUBLE_EQ(engine.current_brightness("HDMI-1"), 0.05);
    EXPECT_EQ(engine.current_filter_color("HDMI-1"), filter_color::red);
    EXPECT_DOUBLE_EQ(engine.current_filter_intensity("HDMI-1"), 1.0);
    EXPECT_EQ(dsp.table("HDMI-1"), compute_table(calibrated_table(), 0.05, filter_color::red, 1.0));
}

TEST_F(scheduler, nan_request_is_sanitized) {
    adjustment_engine engine(dsp, manual_period);
    const double nan = std::numeric_limits<double>::quiet_NaN();

    engine.request_adjustment("HDMI-1", nan, filter_color::red, nan);
    EXPECT_EQ(engine.target_state("HDMI-1"), (adjustment_state{1.0, filter_color::red, 1.0}));
    EXPECT_EQ(engine.apply_pending(), 1u);

    EXPECT_DOUBLE_EQ(engine.current_brightness("HDMI-1"), 1.0);
    EXPECT_DOUBLE_EQ(engine.current_filter_intensity("HDMI-1"), 1.0);
    EXPECT_EQ(dsp.table("HDMI-1"), compute_table(calibrated_table(), 1.0, filter_color::red, 1.0));
    EXPECT_TRUE(dsp.table("HDMI-1").valid());

    engine.request_adjustment("HDMI-1", nan, filter_color::red, nan);
    EXPECT_EQ(engine.apply_pending(), 0u);
    EXPECT_EQ(dsp.write_count("HDMI-1"), 1);
}

TEST_F(scheduler, identical_requests_write_once) {
    adjustment_engine engine(dsp, manual_period);

    for (int i = 0; i < 10; ++i)
        engine.request_adjustment("HDMI-1", 0.7, filter_color::orange, 0.4);
    EXPECT_EQ(engine.apply_pending(), 1u);

    engine.request_adjustment("HDMI-1", 0.7, filter_color::orange, 0.4);
    EXPECT_EQ(engine.apply_pending(), 0u);
    EXPECT_EQ(dsp.write_count("HDMI-1"), 1);
}

TEST_F(scheduler, last_request_wins) {
    adjustment_engine engine(dsp, manual_period);

    engine.request_adjustment("HDMI-1", 0.2, filter_color::blue, 0.1);
    engine.request_adjustment("HDMI-1", 0.9, filter_color::green, 0.3);
    engine.request_adjustment("HDMI-1", 0.5, filter_color::orange, 0.6);
    EXPECT_EQ(engine.apply_pending(), 1u);

    EXPECT_EQ(dsp.write_count("HDMI-1"), 1);
    EXPECT_EQ(dsp.table("HDMI-1"), compute_table(calibrated_table(), 0.5, filter_color::orange, 0.6));
    EXPECT_DOUBLE_EQ(engine.current_brightness("HDMI-1"), 0.5);
}

TEST_F(scheduler, only_requested_display_is_written) {
    adjustment_engine engine(dsp, manual_period);

    engine.request_adjustment("DP-1", 0.5, filter_color::none, 0.0);
    EXPECT_EQ(engine.apply_pending(), 1u);

    EXPECT_EQ(dsp.write_count("DP-1"), 1);
    EXPECT_EQ(dsp.write_count("HDMI-1"), 0);
    EXPECT_EQ(dsp.table("HDMI-1"), calibrated_table());
}

TEST_F(scheduler, default_request_is_skipped) {
    adjustment_engine engine(dsp, manual_period);

    engine.request_adjustment("HDMI-1", 1.0, filter_color::none, 0.0);
    EXPECT_EQ(engine.apply_pending(), 0u);
    EXPECT_EQ(dsp.write_count("HDMI-1"), 0);
}

TEST_F(scheduler, derives_from_baseline_not_current_ramp) {
    adjustment_engine engine(dsp, manual_period);

    engine.request_adjustment("HDMI-1", 0.5, filter_color::none, 0.0);
    engine.apply_pending();
    engine.request_adjustment("HDMI-1", 0.8, filter_color::none, 0.0);
    engine.apply_pending();

    EXPECT_EQ(dsp.table("HDMI-1"), compute_table(calibrated_table(), 0.8, filter_color::none, 0.0));
}

TEST_F(scheduler, reset_restores_baseline) {
    adjustment_engine engine(dsp, manual_period);

    engine.request_adjustment("HDMI-1", 0.3, filter_color::red, 0.9);
    engine.apply_pending();
    ASSERT_NE(dsp.table("HDMI-1"), calibrated_table());

    engine.reset("HDMI-1");
    EXPECT_EQ(dsp.table("HDMI-1"), calibrated_table());
    EXPECT_DOUBLE_EQ(engine.current_brightness("HDMI-1"), 1.0);
    EXPECT_EQ(engine.current_filter_color("HDMI-1"), filter_color::none);
    EXPECT_DOUBLE_EQ(engine.current_filter_intensity("HDMI-1"), 0.0);

    // Going back to the reset state is a no-op.
    engine.request_adjustment("HDMI-1", 1.0, filter_color::none, 0.0);
    EXPECT_EQ(engine.apply_pending(), 0u);
}

TEST_F(scheduler, reset_keeps_pending_request) {
    adjustment_engine engine(dsp, manual_period);

    engine.request_adjustment("HDMI-1", 0.3, filter_color::red, 0.9);
    engine.reset("HDMI-1");
    EXPECT_EQ(dsp.table("HDMI-1"), calibrated_table());
    EXPECT_EQ(dsp.write_count("HDMI-1"), 1);

    EXPECT_EQ(engine.apply_pending(), 1u);
    EXPECT_EQ(dsp.table("HDMI-1"), compute_table(calibrated_table(), 0.3, filter_color::red, 0.9));
    EXPECT_DOUBLE_EQ(engine.current_brightness("HDMI-1"), 0.3);
}

TEST_F(scheduler, reset_of_unknown_display) {
    adjustment_engine engine(dsp, manual_period);
    engine.reset("VGA-1");
    EXPECT_EQ(dsp.write_count("VGA-1"), 0);
}

TEST_F(scheduler, display_without_baseline_is_skipped) {
    dsp.connect("eDP-1");
    dsp.make_unreadable("eDP-1");
    adjustment_engine engine(dsp, manual_period);

    engine.request_adjustment("eDP-1", 0.4, filter_color::none, 0.0);
    EXPECT_EQ(engine.apply_pending(), 0u);
    EXPECT_EQ(dsp.write_count("eDP-1"), 0);
    EXPECT_DOUBLE_EQ(engine.current_brightness("eDP-1"), 1.0);
}

TEST_F(scheduler, rejected_write_is_contained) {
    adjustment_engine engine(dsp, manual_period);
    dsp.reject_writes("HDMI-1");

    engine.request_adjustment("HDMI-1", 0.4, filter_color::none, 0.0);
    engine.request_adjustment("DP-1", 0.4, filter_color::none, 0.0);
    EXPECT_EQ(engine.apply_pending(), 2u);

    EXPECT_EQ(dsp.write_count("HDMI-1"), 1);
    EXPECT_DOUBLE_EQ(engine.current_brightness("HDMI-1"), 0.4);
    EXPECT_EQ(dsp.table("DP-1"), compute_table(linear_table(1024), 0.4, filter_color::none, 0.0));
}

TEST_F(scheduler, vanished_display_is_contained) {
    adjustment_engine engine(dsp, manual_period);
    dsp.disconnect("DP-1");

    engine.request_adjustment("DP-1", 0.4, filter_color::none, 0.0);
    engine.request_adjustment("HDMI-1", 0.6, filter_color::none, 0.0);
    EXPECT_EQ(engine.apply_pending(), 2u);
    EXPECT_EQ(dsp.table("HDMI-1"), compute_table(calibrated_table(), 0.6, filter_color::none, 0.0));
}

TEST_F(scheduler, cycle_applies_and_stops) {
    adjustment_engine engine(dsp, 20ms);

    engine.request_adjustment("HDMI-1", 0.5, filter_color::orange, 0.5);
    EXPECT_TRUE(engine.cycle_running());

    ASSERT_TRUE(wait_for([&] { return !engine.cycle_running(); }));
    EXPECT_EQ(dsp.write_count("HDMI-1"), 1);
    EXPECT_DOUBLE_EQ(engine.current_brightness("HDMI-1"), 0.5);

    // A later request restarts it.
    engine.request_adjustment("HDMI-1", 0.6, filter_color::orange, 0.5);
    EXPECT_TRUE(engine.cycle_running());
    ASSERT_TRUE(wait_for([&] { return !engine.cycle_running(); }));
    EXPECT_EQ(dsp.write_count("HDMI-1"), 2);
    EXPECT_DOUBLE_EQ(engine.current_brightness("HDMI-1"), 0.6);
}

TEST_F(scheduler, burst_is_coalesced) {
    adjustment_engine engine(dsp, 200ms);

    for (int i = 1; i <= 50; ++i)
        engine.request_adjustment("HDMI-1", i / 100., filter_color::none, 0.0);

    ASSERT_TRUE(wait_for([&] { return !engine.cycle_running(); }));
    EXPECT_LE(dsp.write_count("HDMI-1"), 2);
    EXPECT_DOUBLE_EQ(engine.current_brightness("HDMI-1"), 0.5);
    EXPECT_EQ(dsp.table("HDMI-1"), compute_table(calibrated_table(), 0.5, filter_color::none, 0.0));
}

TEST_F(scheduler, destruction_stops_cycle) {
    {
        adjustment_engine engine(dsp, manual_period);
        engine.request_adjustment("HDMI-1", 0.5, filter_color::none, 0.0);
        EXPECT_TRUE(engine.cycle_running());
    }
    EXPECT_EQ(dsp.write_count("HDMI-1"), 0);
}

TEST_F(scheduler, refresh_captures_new_displays) {
    adjustment_engine engine(dsp, manual_period);

    dsp.connect("VGA-1", linear_table(256));
    dsp.overwrite("HDMI-1", linear_table(256));
    EXPECT_EQ(engine.refresh_displays(), 1u);
    EXPECT_EQ(engine.displays(), (std::vector<display_id>{"DP-1", "HDMI-1", "VGA-1"}));

    // HDMI-1 keeps the table captured at startup.
    engine.request_adjustment("HDMI-1", 0.5, filter_color::none, 0.0);
    engine.apply_pending();
    EXPECT_EQ(dsp.table("HDMI-1"), compute_table(calibrated_table(), 0.5, filter_color::none, 0.0));
}

TEST_F(scheduler, reapply_writes_current_state) {
    adjustment_engine engine(dsp, manual_period);

    engine.request_adjustment("HDMI-1", 0.5, filter_color::red, 0.5);
    engine.apply_pending();

    dsp.overwrite("HDMI-1", linear_table(256));
    dsp.overwrite("DP-1", linear_table(16));
    engine.reapply();

    EXPECT_EQ(dsp.table("HDMI-1"), compute_table(calibrated_table(), 0.5, filter_color::red, 0.5));
    EXPECT_EQ(dsp.table("DP-1"), linear_table(1024));
}

TEST_F(scheduler, restore_all) {
    adjustment_engine engine(dsp, manual_period);

    engine.request_adjustment("HDMI-1", 0.5, filter_color::red, 0.5);
    engine.request_adjustment("DP-1", 0.5, filter_color::blue, 0.5);
    engine.apply_pending();
    engine.request_adjustment("DP-1", 0.2, filter_color::blue, 0.5);

    engine.restore_all();
    EXPECT_EQ(engine.apply_pending(), 0u);

    EXPECT_EQ(dsp.table("HDMI-1"), calibrated_table());
    EXPECT_EQ(dsp.table("DP-1"), linear_table(1024));
    EXPECT_DOUBLE_EQ(engine.current_brightness("DP-1"), 1.0);
}

TEST_F(scheduler, snapshot_is_sorted) {
    adjustment_engine engine(dsp, manual_period);
    engine.request_adjustment("HDMI-1", 0.5, filter_color::green, 0.25);
    engine.apply_pending();

    const auto snap = engine.snapshot();
    ASSERT_EQ(snap.size(), 2u);
    EXPECT_EQ(snap[0].id, "DP-1");
    EXPECT_EQ(snap[0].state, adjustment_state{});
    EXPECT_EQ(snap[1].id, "HDMI-1");
    EXPECT_EQ(snap[1].state, (adjustment_state{0.5, filter_color::green, 0.25}));
}
