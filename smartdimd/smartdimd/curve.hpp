// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CURVE_HPP
#define CURVE_HPP

#include <array>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <optional>

#include <smartdimd/constants.hpp>

namespace smartdimd {

// One transfer curve per color channel, sampled at n equally spaced
// points over [0, 1]. Every channel has the same length.
struct rgb_curve {
    std::array<std::vector<double>, 3> channels;

    std::vector<double> &r() { return channels[0]; }
    std::vector<double> &g() { return channels[1]; }
    std::vector<double> &b() { return channels[2]; }
    const std::vector<double> &r() const { return channels[0]; }
    const std::vector<double> &g() const { return channels[1]; }
    const std::vector<double> &b() const { return channels[2]; }

    size_t size() const { return channels[0].size(); }
    bool operator==(const rgb_curve &) const = default;
};

// Knobs shared by the curve builders.
struct curve_tuning {
    double guard_width = constants::guard_width_default;
    double rolloff     = constants::rolloff_default;
    // ceiling for the brightest output value
    std::optional<double> white_cap;
    bool   warmth_beta_curve = true;
    double kelvin_min = constants::kelvin_min;
    double kelvin_max = constants::kelvin_max;
};

// Clamp the sample count into the supported range.
size_t sanitize_samples(size_t n);

// Input value of sample i out of n.
double sample_x(size_t i, size_t n);

// Clamp every sample into [0, 1], then make the sequence non-decreasing
// with a single forward pass.
void clamp_monotone(std::vector<double> &samples);

// Hermite interpolation. Requires edge0 < edge1.
double smoothstep(double edge0, double edge1, double x);

// Perceptual warp of a linear slider value: gamma pre-emphasis for
// the low end, followed by a symmetric S-curve around the midpoint.
// Maps 0 to 0 and 1 to 1, non-decreasing in between.
double remap_slider(double raw);

rgb_curve identity_curve(size_t n);
rgb_curve flat_curve(double level, size_t n);

// Same curve on all three channels.
rgb_curve gray_curve(std::vector<double> samples);

bool is_monotone(const std::vector<double> &samples);

// Resample each channel linearly to ramp_sz entries and scale to 16 bits.
// Layout: [ r..., g..., b... ], as expected by the display server.
std::vector<uint16_t> to_gamma_ramps(const rgb_curve &curve, size_t ramp_sz);
}

#endif // CURVE_HPP
