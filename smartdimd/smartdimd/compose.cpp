// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <cmath>
#include <spdlog/spdlog.h>

#include <smartdimd/compose.hpp>
#include <smartdimd/brightness.hpp>
#include <smartdimd/warmth.hpp>
#include <smartdimd/utils.hpp>
#include <smartdimd/constants.hpp>

namespace smartdimd {

rgb_curve compose(const rgb_curve &base, const rgb_curve &tint) {
    rgb_curve ret;

    for (size_t c = 0; c < ret.channels.size(); ++c) {
        const std::vector<double> &b = base.channels[c];
        const std::vector<double> &t = tint.channels[c];
        std::vector<double> &out = ret.channels[c];

        out.resize(b.size());
        if (t.empty())
            continue;

        const double last = double(t.size() - 1);
        for (size_t i = 0; i < b.size(); ++i) {
            const size_t j = size_t(std::lround(clamp_unit(b[i]) * last));
            out[i] = t[j];
        }
    }

    return ret;
}

std::optional<rgb_curve> compose_controls(double intensity, double warmth, size_t n, const curve_tuning &tuning) {
    intensity = clamp_unit(intensity);
    warmth    = clamp_unit(warmth);

    if (intensity <= constants::activation_threshold && warmth <= constants::activation_threshold) {
        return std::nullopt;
    }

    // Composing with the identity would only quantize the other curve
    // to the sample grid, so an inactive control is left out entirely.
    if (warmth <= constants::activation_threshold) {
        return build_brightness_curve(intensity, n, tuning);
    }
    if (intensity <= constants::activation_threshold) {
        return build_warmth_curve(warmth, n, tuning);
    }

    const rgb_curve brightness = build_brightness_curve(intensity, n, tuning);
    const rgb_curve tint       = build_warmth_curve(warmth, n, tuning);
    return compose(brightness, tint);
}

bool compose_and_apply(curve_consumer &consumer, double intensity, double warmth, size_t n, const curve_tuning &tuning) {
    const std::optional<rgb_curve> curve = compose_controls(intensity, warmth, n, tuning);

    if (!curve.has_value()) {
        spdlog::debug("[compose] both controls inactive, restoring defaults");
        consumer.restore();
        return false;
    }

    spdlog::debug("[compose] intensity: {:.3f} warmth: {:.3f} n: {} -> {} output(s)",
                  intensity, warmth, curve->size(), consumer.output_count());
    consumer.apply(*curve);
    return true;
}

}
