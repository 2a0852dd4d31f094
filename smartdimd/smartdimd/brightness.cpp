// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <array>
#include <algorithm>
#include <spdlog/spdlog.h>

#include <smartdimd/brightness.hpp>
#include <smartdimd/utils.hpp>
#include <smartdimd/constants.hpp>

namespace smartdimd {

namespace {
struct phase {
    double s_begin;
    double s_end;
    double guard[2];
    double offset[2];
    double beta[2];
};

constexpr double split_a = 1. / 3.;
constexpr double split_b = 2. / 3.;

// Each phase starts where the previous one ends.
constexpr std::array<phase, 3> phases {{
    { 0.,      split_a, {0.94, 0.84}, {0.00, 0.14}, {1.00, 0.97} },
    { split_a, split_b, {0.84, 0.60}, {0.14, 0.26}, {0.97, 0.90} },
    { split_b, 1.,      {0.60, 0.38}, {0.26, 0.44}, {0.90, 0.55} },
}};
}

brightness_params brightness_params_at(double s, double guard_width) {
    s = clamp_unit(s);

    const phase &p = [s] () -> const phase& {
        if (s <= split_a)
            return phases[0];
        if (s <= split_b)
            return phases[1];
        return phases[2];
    }();

    const double u = invlerp(s, p.s_begin, p.s_end);

    return {
        lerp(p.guard[0], p.guard[1], u),
        guard_width,
        lerp(p.offset[0], p.offset[1], u),
        lerp(p.beta[0], p.beta[1], u),
    };
}

std::optional<brightness_params> brightness_params_from_slider(double intensity, double guard_width) {
    intensity = clamp_unit(intensity);
    if (intensity <= constants::activation_threshold) {
        return std::nullopt;
    }

    const double s = remap_slider(intensity);
    const brightness_params ret = brightness_params_at(s, guard_width);

    SPDLOG_TRACE("[brightness] intensity: {:.3f} remap: {:.3f} -> guard: {:.3f} offset: {:.3f} beta: {:.3f}",
                 intensity, s, ret.guard, ret.offset, ret.beta);

    return ret;
}

rgb_curve build_brightness_curve(const brightness_params &params, size_t n, std::optional<double> white_cap) {
    n = sanitize_samples(n);

    const double edge0 = params.guard;
    const double edge1 = std::min(0.999, params.guard + std::max(0.002, params.guard_width));

    std::vector<double> ys(n);

    for (size_t i = 0; i < n; ++i) {
        const double x = sample_x(i, n);

        // subtract above the guard, keeping the distance between nearby tones
        const double y_sub = std::max(0., x - params.offset);
        const double w     = smoothstep(edge0, edge1, x);

        ys[i] = lerp(x, y_sub, w) * params.beta;
    }

    // Capping every sample keeps the ceiling in place after the monotone pass.
    if (white_cap.has_value()) {
        const double cap = clamp_unit(*white_cap);
        for (double &y : ys)
            y = std::min(y, cap);
    }

    clamp_monotone(ys);

    return gray_curve(std::move(ys));
}

rgb_curve build_brightness_curve(double intensity, size_t n, const curve_tuning &tuning) {
    const auto params = brightness_params_from_slider(intensity, tuning.guard_width);
    if (!params.has_value()) {
        return identity_curve(n);
    }
    return build_brightness_curve(*params, n, tuning.white_cap);
}

}
