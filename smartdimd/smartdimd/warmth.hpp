// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef WARMTH_HPP
#define WARMTH_HPP

#include <array>
#include <optional>
#include <smartdimd/curve.hpp>

namespace smartdimd {

struct warmth_params {
    double kelvin;
    double r_gain;
    double g_gain;
    double b_gain;
    double beta;
};

// Approximate blackbody white point, channels in [0, 1].
std::array<double, 3> kelvin_to_rgb(double kelvin);

// Per-channel gains moving the 6500K reference white to the target white.
// With preserve_peak, gains are scaled down so that none exceeds 1.
std::array<double, 3> kelvin_to_gains(double kelvin, bool preserve_peak = true);

// Interpolates in mired space between kelvin_max (s = 0) and kelvin_min (s = 1).
double warmth_to_kelvin(double s,
                        double kelvin_min = constants::kelvin_min,
                        double kelvin_max = constants::kelvin_max);

// Mild global dim that grows as the white point gets warmer.
double warmth_beta(double s);

// std::nullopt when the warmth is below the activation threshold.
std::optional<warmth_params> warmth_params_from_slider(double warmth, const curve_tuning &tuning = {});

rgb_curve build_warmth_curve(const warmth_params &params,
                             size_t n,
                             double rolloff = constants::rolloff_default);

// Identity curve for an inactive warmth.
rgb_curve build_warmth_curve(double warmth, size_t n, const curve_tuning &tuning = {});

// Tint to an explicit white point, bypassing the slider mapping.
rgb_curve build_kelvin_curve(double kelvin,
                             size_t n,
                             double beta = 1.,
                             double rolloff = constants::rolloff_default);
}

#endif // WARMTH_HPP
