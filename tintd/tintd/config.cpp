// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <tintd/config.hpp>
#include <tintd/file.hpp>
#include <tintd/constants.hpp>

using nlohmann::json;
using namespace tintd;

void config::defaults()
{
	engine.apply_period_ms = constants::apply_period_ms;

	gamma.refresh_s        = constants::refresh_s;
	gamma.restore_on_exit  = true;
}

void config::sanitize()
{
	engine.apply_period_ms = std::clamp(engine.apply_period_ms, 10, 5000);
	gamma.refresh_s        = std::clamp(gamma.refresh_s, 0, 3600);
}

config::config()
: config(xdg_config_dir() / constants::config_filename)
{
}

config::config(std::filesystem::path filepath)
: filepath_(filepath)
{
	defaults();

	file_parse();

	sanitize();

	file_pretty_write();
}

void config::from_json(const json &in)
{
	engine.apply_period_ms = in.at("engine").at("apply_period_ms").get<int>();

	gamma.refresh_s        = in.at("gamma").at("refresh_s").get<int>();
	gamma.restore_on_exit  = in.at("gamma").at("restore_on_exit").get<bool>();
}

json config::to_json() const
{
	return {
		{"engine", {
				{"apply_period_ms", engine.apply_period_ms},
		}},

		{"gamma", {
				{"refresh_s", gamma.refresh_s},
				{"restore_on_exit", gamma.restore_on_exit},
		}},
	};
}

void config::file_pretty_write() const
{
	try {
		std::filesystem::create_directories(filepath_.parent_path());
		std::ofstream fs(filepath_);
		fs.exceptions(std::fstream::failbit);
		fs << std::setw(4) << config::to_json();
	} catch (const std::exception &e) {
		spdlog::warn("[config] cannot write {}: {}", filepath_.string(), e.what());
	}
}

void config::file_parse()
{
	const std::string data = [&] {
		try {
			return file_read(filepath_);
		} catch (const std::exception &) {
			return std::string();
		}
	}();

	if (data.empty())
		return;

	try {
		from_json(json::parse(data));
	} catch (const json::exception &e) {
		spdlog::warn("[config] {}: {}, using defaults", filepath_.string(), e.what());
		defaults();
	}
}
