// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <smartdimd/session.hpp>
#include <smartdimd/compose.hpp>
#include <smartdimd/brightness.hpp>
#include <smartdimd/warmth.hpp>
#include <smartdimd/utils.hpp>
#include <smartdimd/constants.hpp>

namespace smartdimd {

void store_intensity(session_state &state, double val) {
    state.intensity = clamp_unit(val);
    state.flat.reset();
}

void store_warmth(session_state &state, double val) {
    state.warmth = clamp_unit(val);
    state.kelvin.reset();
    state.flat.reset();
}

void store_kelvin(session_state &state, double kelvin) {
    state.kelvin = std::clamp(kelvin, 1000., constants::kelvin_reference);
    state.flat.reset();
}

std::optional<rgb_curve> build_session_curve(double intensity, double warmth, std::optional<double> kelvin, const config &conf) {
    if (!kelvin.has_value()) {
        return compose_controls(intensity, warmth, conf.samples, conf.tuning);
    }

    const rgb_curve tint = build_kelvin_curve(*kelvin, conf.samples, 1., conf.tuning.rolloff);
    if (clamp_unit(intensity) <= constants::activation_threshold) {
        return tint;
    }
    return compose(build_brightness_curve(intensity, conf.samples, conf.tuning), tint);
}

void reapply(session_state &state, curve_consumer &consumer, const config &conf) {
    if (state.flat.has_value()) {
        spdlog::debug("[session] flat level: {:.2f}", *state.flat);
        consumer.apply(flat_curve(*state.flat, conf.samples));
        state.enabled = true;
        ++state.generation;
        return;
    }

    const double intensity = state.brightness_muted ? 0. : state.intensity;

    if (state.kelvin.has_value() && !state.warmth_muted) {
        spdlog::debug("[session] intensity: {:.3f} kelvin: {:.0f}", intensity, *state.kelvin);
        consumer.apply(*build_session_curve(intensity, 0., state.kelvin, conf));
        state.enabled = true;
        ++state.generation;
        return;
    }

    const double warmth = state.warmth_muted ? 0. : state.warmth;
    state.enabled = compose_and_apply(consumer, intensity, warmth, conf.samples, conf.tuning);
    if (state.enabled) {
        ++state.generation;
    }
}

void set_intensity(session_state &state, curve_consumer &consumer, const config &conf, double val) {
    store_intensity(state, val);
    reapply(state, consumer, conf);
}

void set_warmth(session_state &state, curve_consumer &consumer, const config &conf, double val) {
    store_warmth(state, val);
    reapply(state, consumer, conf);
}

void set_kelvin(session_state &state, curve_consumer &consumer, const config &conf, double kelvin) {
    store_kelvin(state, kelvin);
    reapply(state, consumer, conf);
}

void toggle_brightness(session_state &state, curve_consumer &consumer, const config &conf) {
    state.brightness_muted = !state.brightness_muted;
    state.flat.reset();
    spdlog::debug("[session] brightness {}", state.brightness_muted ? "muted" : "unmuted");
    reapply(state, consumer, conf);
}

void toggle_warmth(session_state &state, curve_consumer &consumer, const config &conf) {
    state.warmth_muted = !state.warmth_muted;
    state.flat.reset();
    spdlog::debug("[session] warmth {}", state.warmth_muted ? "muted" : "unmuted");
    reapply(state, consumer, conf);
}

void reset(session_state &state, curve_consumer &consumer) {
    spdlog::debug("[session] reset");
    consumer.restore();
    state.flat.reset();
    state.enabled = false;
}

void apply_flat(session_state &state, curve_consumer &consumer, const config &conf, double level) {
    state.flat = clamp_unit(level);
    reapply(state, consumer, conf);
}

void handle_message(session_state &state, curve_consumer &consumer, const config &conf, const nlohmann::json &msg) {
    if (msg.contains("flat")) {
        apply_flat(state, consumer, conf, msg["flat"].get<double>());
        return;
    }

    if (msg.contains("intensity"))
        store_intensity(state, msg["intensity"].get<double>());
    if (msg.contains("warmth"))
        store_warmth(state, msg["warmth"].get<double>());
    if (msg.contains("kelvin"))
        store_kelvin(state, msg["kelvin"].get<double>());

    reapply(state, consumer, conf);
}

nlohmann::json status_json(const session_state &state, const curve_consumer &consumer) {
    return {
        {"intensity", state.intensity},
        {"warmth", state.warmth},
        {"kelvin", state.kelvin.has_value() ? nlohmann::json(*state.kelvin) : nlohmann::json(nullptr)},
        {"flat", state.flat.has_value() ? nlohmann::json(*state.flat) : nlohmann::json(nullptr)},
        {"brightness_muted", state.brightness_muted},
        {"warmth_muted", state.warmth_muted},
        {"enabled", state.enabled},
        {"generation", state.generation},
        {"outputs", consumer.output_count()},
    };
}

}
