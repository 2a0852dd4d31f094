// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SESSION_HPP
#define SESSION_HPP

#include <cstdint>
#include <optional>
#include <nlohmann/json_fwd.hpp>

#include <smartdimd/config.hpp>
#include <smartdimd/consumer.hpp>

namespace smartdimd {

// Last applied controls. Owned by whoever drives the consumer,
// the curve builders never see it.
struct session_state {
    double intensity = 0.;
    double warmth    = 0.;

    // explicit white point, replaces the warmth slider while set
    std::optional<double> kelvin;

    // diagnostic flat level, replaces the controls until they are set again
    std::optional<double> flat;

    // a muted control keeps its value but contributes the identity
    bool brightness_muted = false;
    bool warmth_muted     = false;

    // a curve is currently installed
    bool enabled = false;

    // number of curves installed so far
    uint64_t generation = 0;
};

void store_intensity(session_state &state, double val);
void store_warmth(session_state &state, double val);
void store_kelvin(session_state &state, double kelvin);

// Curve for the given controls. The kelvin override, when set, replaces warmth.
// std::nullopt means "restore the platform defaults".
std::optional<rgb_curve> build_session_curve(double intensity,
                                             double warmth,
                                             std::optional<double> kelvin,
                                             const config &conf);

// Rebuild from the stored values and apply, or restore the platform
// defaults when nothing is active. Used after wake-up and for refreshes.
void reapply(session_state &state, curve_consumer &consumer, const config &conf);

void set_intensity(session_state &state, curve_consumer &consumer, const config &conf, double val);
void set_warmth(session_state &state, curve_consumer &consumer, const config &conf, double val);
void set_kelvin(session_state &state, curve_consumer &consumer, const config &conf, double kelvin);

void toggle_brightness(session_state &state, curve_consumer &consumer, const config &conf);
void toggle_warmth(session_state &state, curve_consumer &consumer, const config &conf);

// Restore the platform colors, keeping values and mute flags.
// Drops the flat level.
void reset(session_state &state, curve_consumer &consumer);

// Uniform output level on every channel, kept across reapply until a
// control is set, toggled or reset.
// Useful to check whether the platform honors transfer tables at all.
void apply_flat(session_state &state, curve_consumer &consumer, const config &conf, double level);

// Applies { "intensity", "warmth", "kelvin", "flat" }, all optional.
// Throws nlohmann::json::exception on values of the wrong type.
void handle_message(session_state &state, curve_consumer &consumer, const config &conf, const nlohmann::json &msg);

nlohmann::json status_json(const session_state &state, const curve_consumer &consumer);
}

#endif // SESSION_HPP
