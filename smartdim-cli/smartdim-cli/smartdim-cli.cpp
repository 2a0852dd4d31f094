// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <array>
#include <cmath>
#include <cstdio>
#include <limits>
#include <optional>
#include <nlohmann/json.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <CLI/App.hpp>
#include <CLI/Formatter.hpp>
#include <CLI/Config.hpp>

#include <smartdimd/api.hpp>
#include <smartdimd/config.hpp>
#include <smartdimd/session.hpp>
#include <smartdimd/curve.hpp>
#include <smartdimd/utils.hpp>

void start() {
    if (!smartdimd::daemon_start())
        std::puts("already started");
    std::exit(EXIT_SUCCESS);
}

void stop() {
    if (smartdimd::daemon_stop()) {
        std::puts("smartdim stopped");
    } else {
        std::puts("already stopped");
    }
	std::exit(EXIT_SUCCESS);
}

void status() {
    if (!smartdimd::daemon_is_running()) {
        std::puts("not running");
        std::exit(EXIT_SUCCESS);
    }

    const nlohmann::json st = smartdimd::daemon_status();
    fmt::print("running, {} output(s)\n", st["outputs"].get<size_t>());
    fmt::print("intensity: {}%{}\n", std::lround(st["intensity"].get<double>() * 100), st["brightness_muted"].get<bool>() ? " (muted)" : "");
    if (st["kelvin"].is_number()) {
        fmt::print("kelvin: {:.0f}K{}\n", st["kelvin"].get<double>(), st["warmth_muted"].get<bool>() ? " (muted)" : "");
    } else {
        fmt::print("warmth: {}%{}\n", std::lround(st["warmth"].get<double>() * 100), st["warmth_muted"].get<bool>() ? " (muted)" : "");
    }
    if (st["flat"].is_number())
        fmt::print("flat: {}%\n", std::lround(st["flat"].get<double>() * 100));
    fmt::print("curve installed: {} (generation {})\n", st["enabled"].get<bool>() ? "yes" : "no", st["generation"].get<uint64_t>());
	std::exit(EXIT_SUCCESS);
}

void require_daemon() {
    if (!smartdimd::daemon_is_running()) {
        std::puts("smartdim is not running.\nType: `smartdim start`");
        std::exit(EXIT_SUCCESS);
    }
}

template <class T>
struct range {
    T min;
    T max;
    range(T mi, T mx) : min(mi), max(mx) {};

    std::string desc() const {
        return CLI::Range(min, max).get_description();
    }
};

template <class T>
std::string relative_validator(const std::string &str, bool &relative_flag, range<T> range) {
    if (str.starts_with("+") || str.starts_with("-")) {
        relative_flag = true;
        return "";
	}

    const T val = std::is_integral<T>::value ? std::stoi(str) : std::stod(str);
    if (val >= range.min && val <= range.max) {
        return "";
    }

    return fmt::format("Value {} not in range [{} - {}]", val, range.min, range.max);
};

// Absolute percentage, or relative to the daemon's current value.
double control_value(int perc, bool relative, std::string_view key) {
    if (!relative) {
        return smartdimd::perc_to_control(perc);
    }
    const nlohmann::json st = smartdimd::daemon_status();
    return smartdimd::clamp_unit(st[key].get<double>() + smartdimd::perc_to_control(perc));
}

int print_curve(double intensity, double warmth, std::optional<double> kelvin, size_t samples) {
    smartdimd::config conf(smartdimd::config::default_filepath());
    if (samples > 0)
        conf.samples = smartdimd::sanitize_samples(samples);

    const std::optional<smartdimd::rgb_curve> curve = smartdimd::build_session_curve(intensity, warmth, kelvin, conf);

    if (!curve.has_value()) {
        std::puts("restore defaults");
        return EXIT_SUCCESS;
    }

    fmt::print("x,r,g,b\n");
    for (size_t i = 0; i < curve->size(); ++i) {
        fmt::print("{:.6f},{:.6f},{:.6f},{:.6f}\n", smartdimd::sample_x(i, curve->size()), curve->r()[i], curve->g()[i], curve->b()[i]);
    }
    return EXIT_SUCCESS;
}

int interface(int argc, char **argv)
{
    enum option_id {
        VERS,
        INTENSITY,
        WARMTH,
        KELVIN,
        FLAT,
        TOGGLE_BRIGHTNESS,
        TOGGLE_WARMTH,
    };

    constexpr int option_count = 7;
    const std::array<std::array<std::string, 2>, option_count> options {{
    {"-v,--version", "Print version and exit"},
    {"-i,--intensity", "Dimming intensity percentage. 0 disables dimming. Prefix with + or - for relative changes."},
    {"-w,--warmth", "Warmth percentage. 0 is neutral (6500K), 100 is 1900K. Prefix with + or - for relative changes."},
    {"-k,--kelvin", "Set the white point directly, in kelvins. Overrides warmth until warmth is set again."},
    {"--flat", "Apply a flat table at the given percentage. Useful to check whether the display honors gamma tables."},
    {"--toggle-brightness", "Mute or unmute dimming, keeping its value."},
    {"--toggle-warmth", "Mute or unmute warmth, keeping its value."},
    }};
    std::array<bool, option_count> rel_fl {};

    CLI::App app("Software screen dimming and warmth for X11 and GNOME.", "smartdim");

	app.add_subcommand("start", "Start the background process.")->callback(start);
	app.add_subcommand("stop", "Stop the background process.")->callback(stop);
	app.add_subcommand("status", "Show the current settings.")->callback(status);
	app.add_subcommand("reset", "Restore the original display colors, keeping the current settings.")->callback([] {
        require_daemon();
        smartdimd::daemon_send_command("reset");
        std::exit(EXIT_SUCCESS);
    });
	app.add_subcommand("reapply", "Apply the current settings again.")->callback([] {
        require_daemon();
        smartdimd::daemon_send_command("reapply");
        std::exit(EXIT_SUCCESS);
    });

	app.add_flag(options[VERS][0], [] ([[maybe_unused]] int64_t t) {
		std::puts(VERSION);
		std::exit(0);
	}, options[VERS][1]);

    constexpr int invalid_val = std::numeric_limits<int>::min();

    const range perc_range(0, 100);
    const range kelvin_range(1000, 6500);

    int intensity = invalid_val;
    int warmth    = invalid_val;
    int kelvin    = invalid_val;
    int flat      = invalid_val;
    bool toggle_brightness = false;
    bool toggle_warmth     = false;

    app.add_option(options[INTENSITY][0], intensity, options[INTENSITY][1])->check(CLI::Validator([&] (const std::string &s) { return relative_validator(s, rel_fl[INTENSITY], perc_range); }, perc_range.desc()));
    app.add_option(options[WARMTH][0], warmth, options[WARMTH][1])->check(CLI::Validator([&] (const std::string &s) { return relative_validator(s, rel_fl[WARMTH], perc_range); }, perc_range.desc()));
    app.add_option(options[KELVIN][0], kelvin, options[KELVIN][1])->check(CLI::Range(kelvin_range.min, kelvin_range.max));
    app.add_option(options[FLAT][0], flat, options[FLAT][1])->check(CLI::Range(perc_range.min, perc_range.max));
    app.add_flag(options[TOGGLE_BRIGHTNESS][0], toggle_brightness, options[TOGGLE_BRIGHTNESS][1]);
    app.add_flag(options[TOGGLE_WARMTH][0], toggle_warmth, options[TOGGLE_WARMTH][1]);

    struct {
        int intensity = 0;
        int warmth    = 0;
        int kelvin    = invalid_val;
        size_t samples = 0;
    } curve_opts;

    CLI::App *curve_cmd = app.add_subcommand("curve", "Print the table for the given settings as CSV, without applying it.");
    curve_cmd->add_option("-i,--intensity", curve_opts.intensity, "Dimming intensity percentage.")->check(CLI::Range(perc_range.min, perc_range.max));
    curve_cmd->add_option("-w,--warmth", curve_opts.warmth, "Warmth percentage.")->check(CLI::Range(perc_range.min, perc_range.max));
    curve_cmd->add_option("-k,--kelvin", curve_opts.kelvin, "White point in kelvins.")->check(CLI::Range(kelvin_range.min, kelvin_range.max));
    curve_cmd->add_option("-n,--samples", curve_opts.samples, "Number of samples. Defaults to the configured value.")->check(CLI::Range(smartdimd::constants::samples_min, smartdimd::constants::samples_max));

    spdlog::debug("parsing options...");
	try {
		if (argc == 1) {
			app.parse("-h");
		} else {
			app.parse(argc, argv);
		}
	} catch (const CLI::ParseError &e) {
		return app.exit(e);
	}

    if (*curve_cmd) {
        return print_curve(smartdimd::perc_to_control(curve_opts.intensity),
                           smartdimd::perc_to_control(curve_opts.warmth),
                           curve_opts.kelvin != invalid_val ? std::optional<double>(curve_opts.kelvin) : std::nullopt,
                           curve_opts.samples);
    }

    require_daemon();

    if (toggle_brightness)
        smartdimd::daemon_send_command("toggle-brightness");
    if (toggle_warmth)
        smartdimd::daemon_send_command("toggle-warmth");

    if (flat != invalid_val) {
        smartdimd::daemon_send_update({{"flat", smartdimd::perc_to_control(flat)}});
        return EXIT_SUCCESS;
    }

    nlohmann::json msg = nlohmann::json::object();
    if (intensity != invalid_val)
        msg["intensity"] = control_value(intensity, rel_fl[INTENSITY], "intensity");
    if (warmth != invalid_val)
        msg["warmth"] = control_value(warmth, rel_fl[WARMTH], "warmth");
    if (kelvin != invalid_val)
        msg["kelvin"] = kelvin;

    if (!msg.empty()) {
        spdlog::debug("writing to daemon...");
        smartdimd::daemon_send_update(msg);
    }

	return EXIT_SUCCESS;
}

int main(int argc, char **argv) {
    spdlog::cfg::load_env_levels();
    try {
        return interface(argc, argv);
    } catch (const std::exception &e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }
}
