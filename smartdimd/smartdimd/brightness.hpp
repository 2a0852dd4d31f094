// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef BRIGHTNESS_HPP
#define BRIGHTNESS_HPP

#include <optional>
#include <smartdimd/curve.hpp>

namespace smartdimd {

// Subtractive dimming parameters.
// Below the guard the curve is the identity, above guard + guard_width
// it is offset-subtracted, in between the two are blended with a smoothstep.
// beta is a uniform multiplier applied last.
struct brightness_params {
    double guard;
    double guard_width;
    double offset;
    double beta;
};

// Three phases over the remapped slider value s, split in thirds:
// highlights are pulled down first, global dimming comes in last.
brightness_params brightness_params_at(double s, double guard_width = constants::guard_width_default);

// Remaps the slider value and evaluates the phases.
// std::nullopt when the intensity is below the activation threshold.
std::optional<brightness_params> brightness_params_from_slider(
        double intensity,
        double guard_width = constants::guard_width_default);

rgb_curve build_brightness_curve(const brightness_params &params,
                                 size_t n,
                                 std::optional<double> white_cap = std::nullopt);

// Identity curve for an inactive intensity.
rgb_curve build_brightness_curve(double intensity, size_t n, const curve_tuning &tuning = {});
}

#endif // BRIGHTNESS_HPP
