// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>

#include <smartdimd/curve.hpp>

namespace smartdimd {
class config {

	void defaults();
	void sanitize();

	void file_parse();
	void file_pretty_write() const;

	void from_json(const nlohmann::json &data);

    std::filesystem::path filepath_;
public:
    size_t samples;
    int refresh_seconds;
    curve_tuning tuning;

    // Defaults only, no file access.
    config();

    // Reads the file, falling back to defaults for anything missing or invalid,
    // then writes the complete configuration back.
    config(std::filesystem::path filepath);

    // Values from a json object, no file access.
    config(const nlohmann::json &data);

    nlohmann::json to_json() const;

    static std::filesystem::path default_filepath();
};
}

#endif // CONFIG_HPP
