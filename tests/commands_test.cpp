// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <chrono>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <gtest/gtest.h>

#include <tintd/commands.hpp>
#include "fake_display.hpp"

using namespace tintd;
using nlohmann::json;
using tintd::test::calibrated_table;
using tintd::test::fake_display_server;

namespace {
constexpr auto manual_period = std::chrono::hours(1);

class commands : public ::testing::Test {
protected:
    fake_display_server dsp;

    void SetUp() override {
        dsp.connect("HDMI-1");
        dsp.connect("DP-1");
    }
};
}

TEST(parse_command, full_message) {
    const command cmd = parse_command(json::parse(R"({"screen": 1, "brightness": 0.5, "color": "orange", "intensity": 0.25})"));
    EXPECT_EQ(cmd.screen, 1u);
    EXPECT_FALSE(cmd.reset);
    EXPECT_EQ(cmd.brightness, 0.5);
    EXPECT_EQ(cmd.color, filter_color::orange);
    EXPECT_EQ(cmd.intensity, 0.25);
}

TEST(parse_command, partial_message) {
    const command cmd = parse_command(json::parse(R"({"brightness": 0.3})"));
    EXPECT_FALSE(cmd.screen);
    EXPECT_FALSE(cmd.color);
    EXPECT_FALSE(cmd.intensity);
    EXPECT_EQ(cmd.brightness, 0.3);

    const command reset = parse_command(json::parse(R"({"reset": true, "screen": 0})"));
    EXPECT_TRUE(reset.reset);
    EXPECT_EQ(reset.screen, 0u);
}

TEST(parse_command, malformed) {
    EXPECT_THROW(parse_command(json::parse("[1, 2]")), std::invalid_argument);
    EXPECT_THROW(parse_command(json::parse(R"({"screen": -1})")), std::invalid_argument);
    EXPECT_THROW(parse_command(json::parse(R"({"color": "purple"})")), std::invalid_argument);
    EXPECT_THROW(parse_command(json::parse(R"({"brightness": "high"})")), json::exception);
    EXPECT_THROW(parse_command(json::parse(R"({"screen": "1"})")), std::invalid_argument);
}

TEST(parse_command, screen_must_be_an_unsigned_integer) {
    EXPECT_THROW(parse_command(json::parse(R"({"screen": 1.5})")), std::invalid_argument);
    EXPECT_THROW(parse_command(json::parse(R"({"screen": 1.0})")), std::invalid_argument);
    EXPECT_THROW(parse_command(json::parse(R"({"screen": -4294967296})")), std::invalid_argument);

    const command big = parse_command(json::parse(R"({"screen": 4294967296})"));
    EXPECT_EQ(big.screen, size_t(4294967296));
}

TEST(parse_command, json_round_trip) {
    command cmd;
    cmd.screen = 2;
    cmd.color  = filter_color::blue;
    cmd.intensity = 0.75;

    const json j = to_json(cmd);
    EXPECT_EQ(j, json::parse(R"({"screen": 2, "color": "blue", "intensity": 0.75})"));

    const command back = parse_command(j);
    EXPECT_EQ(back.screen, cmd.screen);
    EXPECT_EQ(back.color, cmd.color);
    EXPECT_EQ(back.intensity, cmd.intensity);
    EXPECT_FALSE(back.brightness);
}

TEST_F(commands, screen_index_follows_sorted_ids) {
    adjustment_engine engine(dsp, manual_period);

    command cmd;
    cmd.screen = 1;
    cmd.brightness = 0.4;
    EXPECT_EQ(execute(engine, cmd), 1u);

    EXPECT_DOUBLE_EQ(engine.target_state("HDMI-1").brightness, 0.4);
    EXPECT_DOUBLE_EQ(engine.target_state("DP-1").brightness, 1.0);
}

TEST_F(commands, missing_fields_keep_target) {
    adjustment_engine engine(dsp, manual_period);

    engine.request_adjustment("DP-1", 0.6, filter_color::red, 0.3);

    command cmd;
    cmd.screen = 0;
    cmd.intensity = 0.9;
    execute(engine, cmd);

    EXPECT_EQ(engine.target_state("DP-1"), (adjustment_state{0.6, filter_color::red, 0.9}));
}

TEST_F(commands, no_screen_targets_all) {
    adjustment_engine engine(dsp, manual_period);

    command cmd;
    cmd.color = filter_color::orange;
    cmd.intensity = 0.5;
    EXPECT_EQ(execute(engine, cmd), 2u);
    EXPECT_EQ(engine.apply_pending(), 2u);

    EXPECT_EQ(engine.current_filter_color("DP-1"), filter_color::orange);
    EXPECT_EQ(engine.current_filter_color("HDMI-1"), filter_color::orange);
}

TEST_F(commands, invalid_screen_is_ignored) {
    adjustment_engine engine(dsp, manual_period);

    command cmd;
    cmd.screen = 5;
    cmd.brightness = 0.2;
    EXPECT_EQ(execute(engine, cmd), 0u);
    EXPECT_EQ(engine.apply_pending(), 0u);
}

TEST_F(commands, huge_screen_index_does_not_wrap) {
    adjustment_engine engine(dsp, manual_period);

    const command cmd = parse_command(json::parse(R"({"screen": 4294967296, "brightness": 0.2})"));
    EXPECT_EQ(execute(engine, cmd), 0u);
    EXPECT_DOUBLE_EQ(engine.target_state("DP-1").brightness, 1.0);
}

TEST_F(commands, reset) {
    adjustment_engine engine(dsp, manual_period);
    engine.request_adjustment("HDMI-1", 0.2, filter_color::green, 1.0);
    engine.apply_pending();

    command cmd;
    cmd.reset = true;
    EXPECT_EQ(execute(engine, cmd), 2u);
    EXPECT_EQ(dsp.table("HDMI-1"), calibrated_table());
    EXPECT_DOUBLE_EQ(engine.current_brightness("HDMI-1"), 1.0);
}

TEST_F(commands, status) {
    adjustment_engine engine(dsp, manual_period);
    engine.request_adjustment("HDMI-1", 0.2, filter_color::green, 1.0);
    engine.apply_pending();

    const json s = status(engine);
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s[0]["screen"], 0);
    EXPECT_EQ(s[0]["id"], "DP-1");
    EXPECT_EQ(s[0]["color"], "none");
    EXPECT_EQ(s[1]["id"], "HDMI-1");
    EXPECT_DOUBLE_EQ(s[1]["brightness"].get<double>(), 0.2);
    EXPECT_EQ(s[1]["color"], "green");
    EXPECT_DOUBLE_EQ(s[1]["intensity"].get<double>(), 1.0);
}
