// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <algorithm>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <smartdimd/config.hpp>
#include <smartdimd/file.hpp>
#include <smartdimd/utils.hpp>
#include <smartdimd/constants.hpp>

using nlohmann::json;
using namespace smartdimd;

void config::defaults() {
    samples           = constants::samples_default;
    refresh_seconds   = constants::refresh_seconds_default;
    tuning            = curve_tuning{};
}

void config::sanitize() {
    samples                = sanitize_samples(samples);
    refresh_seconds        = std::clamp(refresh_seconds, 0, 60 * 60);
    tuning.guard_width     = std::clamp(tuning.guard_width, 0., 0.5);
    tuning.rolloff         = std::clamp(tuning.rolloff, 0.002, 0.5);
    tuning.kelvin_max      = std::clamp(tuning.kelvin_max, 1000., constants::kelvin_reference);
    tuning.kelvin_min      = std::clamp(tuning.kelvin_min, 1000., tuning.kelvin_max);
    if (tuning.white_cap.has_value()) {
        tuning.white_cap = clamp_unit(*tuning.white_cap);
    }
}

config::config() {
    defaults();
}

config::config(std::filesystem::path filepath) : filepath_(std::move(filepath)) {
	defaults();
	file_parse();
	sanitize();
	file_pretty_write();
}

config::config(const json &data) {
	defaults();
	from_json(data);
	sanitize();
}

std::filesystem::path config::default_filepath() {
    return xdg_config_dir() / constants::config_filename;
}

// Keys are optional, missing ones keep their default value.
void config::from_json(const json &in) {
    if (!in.is_object())
        return;

    // signed, so that negative values clamp to the minimum instead of wrapping
    const int64_t n = in.value("samples", int64_t(samples));
    samples         = n < 0 ? 0 : size_t(n);
    refresh_seconds = in.value("refresh_seconds", refresh_seconds);

    tuning.guard_width       = in.value("guard_width", tuning.guard_width);
    tuning.rolloff           = in.value("rolloff", tuning.rolloff);
    tuning.warmth_beta_curve = in.value("warmth_beta_curve", tuning.warmth_beta_curve);
    tuning.kelvin_min        = in.value("kelvin_min", tuning.kelvin_min);
    tuning.kelvin_max        = in.value("kelvin_max", tuning.kelvin_max);

    if (in.contains("white_cap")) {
        const json &cap = in["white_cap"];
        tuning.white_cap = cap.is_number() ? std::optional<double>(cap.get<double>()) : std::nullopt;
    }
}

json config::to_json() const {
	return {
		{"samples", samples},
		{"refresh_seconds", refresh_seconds},
		{"guard_width", tuning.guard_width},
		{"rolloff", tuning.rolloff},
		{"white_cap", tuning.white_cap.has_value() ? json(*tuning.white_cap) : json(nullptr)},
		{"warmth_beta_curve", tuning.warmth_beta_curve},
		{"kelvin_min", tuning.kelvin_min},
		{"kelvin_max", tuning.kelvin_max},
	};
}

void config::file_pretty_write() const {
    std::filesystem::create_directories(filepath_.parent_path());
	std::ofstream fs(filepath_);
	fs.exceptions(std::fstream::failbit);
	fs << std::setw(4) << config::to_json();
}

void config::file_parse() {
	const std::string data = [&] {
		try {
			return file_read(filepath_);
		} catch (const std::ios_base::failure &e) {
            spdlog::info("[config] {} not readable, using defaults", filepath_.string());
			return std::string();
		}
	}();

	const json jdata = [&] {
		try {
			return json::parse(data);
		} catch (const json::exception &e) {
            if (!data.empty())
                spdlog::warn("[config] parse error: {}", e.what());
			return json();
		}
	}();

	try {
		from_json(jdata);
	} catch (const json::exception &e) {
		spdlog::warn("[config] invalid value: {}, using defaults", e.what());
		defaults();
	}
}
