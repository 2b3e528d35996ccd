// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <filesystem>
#include <nlohmann/json_fwd.hpp>

namespace tintd {
class config {

	void defaults();
	void sanitize();

	void file_parse();
	void file_pretty_write() const;

	void from_json(const nlohmann::json &data);

    std::filesystem::path filepath_;
public:

    struct engine {
        int apply_period_ms;
    } engine;

    struct gamma {
        int refresh_s;
        bool restore_on_exit;
    } gamma;

    // Reads the config file, falling back to defaults for anything missing
    // or malformed, and writes the result back.
	config();
	explicit config(std::filesystem::path filepath);

	nlohmann::json to_json() const;
};
}

#endif // CONFIG_HPP
