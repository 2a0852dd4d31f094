// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <cmath>
#include <span>
#include <limits>
#include <algorithm>

#include <smartdimd/curve.hpp>
#include <smartdimd/utils.hpp>
#include <smartdimd/constants.hpp>

namespace smartdimd {

size_t sanitize_samples(size_t n) {
    return std::clamp(n, constants::samples_min, constants::samples_max);
}

double sample_x(size_t i, size_t n) {
    return double(i) / double(n - 1);
}

void clamp_monotone(std::vector<double> &samples) {
    for (double &v : samples)
        v = clamp_unit(v);
    for (size_t i = 1; i < samples.size(); ++i)
        samples[i] = std::max(samples[i], samples[i - 1]);
}

double smoothstep(double edge0, double edge1, double x) {
    if (x <= edge0)
        return 0.;
    if (x >= edge1)
        return 1.;
    const double t = (x - edge0) / (edge1 - edge0);
    return t * t * (3. - 2. * t);
}

double remap_slider(double raw) {
    constexpr double pre_gamma = 0.75;
    constexpr double k = 0.35;

    const double s = std::pow(clamp_unit(raw), pre_gamma);
    const double d = s - 0.5;

    // slope is 1 + k at the midpoint and 1 - k at both ends
    return clamp_unit(0.5 + d * (1. + k * (1. - 2. * std::abs(d))));
}

rgb_curve gray_curve(std::vector<double> samples) {
    rgb_curve ret;
    ret.channels.fill(samples);
    return ret;
}

rgb_curve identity_curve(size_t n) {
    n = sanitize_samples(n);
    std::vector<double> xs(n);
    for (size_t i = 0; i < n; ++i)
        xs[i] = sample_x(i, n);
    return gray_curve(std::move(xs));
}

rgb_curve flat_curve(double level, size_t n) {
    return gray_curve(std::vector<double>(sanitize_samples(n), clamp_unit(level)));
}

bool is_monotone(const std::vector<double> &samples) {
    for (size_t i = 0; i < samples.size(); ++i) {
        if (samples[i] < 0. || samples[i] > 1.)
            return false;
        if (i > 0 && samples[i] < samples[i - 1])
            return false;
    }
    return true;
}

// The gamma ramp is a set of unsigned 16-bit values for each of the three color channels.
// Ramp size varies on different systems (usually 256, 1024 or 2048),
// while curves are built with a fixed sample count, so each ramp entry
// is interpolated between the two nearest curve samples.
std::vector<uint16_t> to_gamma_ramps(const rgb_curve &curve, size_t ramp_sz) {
    std::vector<uint16_t> ramps (ramp_sz * 3);
    const size_t n = curve.size();
    if (n == 0 || ramp_sz == 0) {
        return ramps;
    }

    constexpr double max = std::numeric_limits<uint16_t>::max();

    for (size_t c = 0; c < curve.channels.size(); ++c) {
        const std::span out (ramps.begin() + c * ramp_sz, ramp_sz);
        const std::vector<double> &samples = curve.channels[c];

        for (size_t i = 0; i < ramp_sz; ++i) {
            const double pos  = ramp_sz > 1 ? double(i) * double(n - 1) / double(ramp_sz - 1) : 0.;
            const size_t idx  = std::min(size_t(std::floor(pos)), n - 1);
            const size_t next = std::min(idx + 1, n - 1);
            const double val  = lerp(samples[idx], samples[next], mant(pos));
            out[i] = uint16_t(std::lround(clamp_unit(val) * max));
        }
    }

    return ramps;
}

}
