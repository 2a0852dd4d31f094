// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <cmath>
#include <algorithm>
#include <spdlog/spdlog.h>

#include <smartdimd/warmth.hpp>
#include <smartdimd/utils.hpp>
#include <smartdimd/constants.hpp>

namespace smartdimd {

// Blackbody approximation by Tanner Helland.
// https://tannerhelland.com/2012/09/18/convert-temperature-rgb-algorithm-code.html
std::array<double, 3> kelvin_to_rgb(double kelvin) {
    const double k = std::clamp(kelvin, 1000., 40000.) / 100.;

    const double r = [k] {
        if (k <= 66.)
            return 255.;
        return std::clamp(329.698727446 * std::pow(k - 60., -0.1332047592), 0., 255.);
    }();

    const double g = [k] {
        const double val = k <= 66.
                ? 99.4708025861 * std::log(k) - 161.1195681661
                : 288.1221695283 * std::pow(k - 60., -0.0755148492);
        return std::clamp(val, 0., 255.);
    }();

    const double b = [k] {
        if (k >= 66.)
            return 255.;
        if (k <= 19.)
            return 0.;
        return std::clamp(138.5177312231 * std::log(k - 10.) - 305.0447927307, 0., 255.);
    }();

    return {r / 255., g / 255., b / 255.};
}

std::array<double, 3> kelvin_to_gains(double kelvin, bool preserve_peak) {
    const auto ref = kelvin_to_rgb(constants::kelvin_reference);
    const auto tgt = kelvin_to_rgb(kelvin);

    std::array<double, 3> gains;
    for (size_t c = 0; c < gains.size(); ++c)
        gains[c] = tgt[c] / std::max(1e-6, ref[c]);

    if (preserve_peak) {
        const double peak = *std::ranges::max_element(gains);
        if (peak > 1.) {
            for (double &g : gains)
                g /= peak;
        }
    }

    return gains;
}

double warmth_to_kelvin(double s, double kelvin_min, double kelvin_max) {
    // exact endpoints, the mired round trip is off by an ulp
    if (s <= 0.)
        return kelvin_max;
    if (s >= 1.)
        return kelvin_min;
    const double m = lerp(mired(kelvin_max), mired(kelvin_min), clamp_unit(s));
    return std::clamp(1e6 / m, kelvin_min, kelvin_max);
}

double warmth_beta(double s) {
    // near 1 until 40%, then eases down to ~0.90
    if (s < 0.4)
        return 1. - 0.02 * (s / 0.4);
    const double u = (s - 0.4) / 0.6;
    return 0.98 - 0.08 * std::pow(u, 1.2);
}

std::optional<warmth_params> warmth_params_from_slider(double warmth, const curve_tuning &tuning) {
    warmth = clamp_unit(warmth);
    if (warmth <= constants::activation_threshold) {
        return std::nullopt;
    }

    const double s      = remap_slider(warmth);
    const double kelvin = warmth_to_kelvin(s, tuning.kelvin_min, tuning.kelvin_max);
    const auto   gains  = kelvin_to_gains(kelvin);
    const double beta   = tuning.warmth_beta_curve ? warmth_beta(s) : 1.;

    SPDLOG_TRACE("[warmth] strength: {:.3f} remap: {:.3f} -> {:.0f}K gains: ({:.3f}, {:.3f}, {:.3f}) beta: {:.3f}",
                 warmth, s, kelvin, gains[0], gains[1], gains[2], beta);

    return warmth_params {kelvin, gains[0], gains[1], gains[2], beta};
}

rgb_curve build_warmth_curve(const warmth_params &params, size_t n, double rolloff) {
    n = sanitize_samples(n);
    rolloff = std::clamp(rolloff, 0.002, 1.);

    const std::array<double, 3> gains {params.r_gain, params.g_gain, params.b_gain};
    rgb_curve ret;

    for (size_t c = 0; c < gains.size(); ++c) {
        std::vector<double> &ys = ret.channels[c];
        ys.resize(n);

        for (size_t i = 0; i < n; ++i) {
            const double x = sample_x(i, n);
            // soft shoulder near white, pulls highlights down by up to 7%
            const double shoulder = 1. - 0.07 * smoothstep(1. - rolloff, 1., x);
            ys[i] = std::min(1., x * gains[c]) * shoulder * params.beta;
        }

        // channels may flatten out at different points
        clamp_monotone(ys);
    }

    return ret;
}

rgb_curve build_warmth_curve(double warmth, size_t n, const curve_tuning &tuning) {
    const auto params = warmth_params_from_slider(warmth, tuning);
    if (!params.has_value()) {
        return identity_curve(n);
    }
    return build_warmth_curve(*params, n, tuning.rolloff);
}

rgb_curve build_kelvin_curve(double kelvin, size_t n, double beta, double rolloff) {
    kelvin = std::clamp(kelvin, 1000., constants::kelvin_reference);
    const auto gains = kelvin_to_gains(kelvin);
    return build_warmth_curve({kelvin, gains[0], gains[1], gains[2], clamp_unit(beta)}, n, rolloff);
}

}
