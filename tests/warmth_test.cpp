// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <gtest/gtest.h>

#include <smartdimd/warmth.hpp>
#include <smartdimd/curve.hpp>

using namespace smartdimd;

TEST(KelvinToRgb, ReferenceWhite) {
    const auto rgb = kelvin_to_rgb(6500.);
    EXPECT_EQ(rgb[0], 1.);
    EXPECT_GT(rgb[1], 0.99);
    EXPECT_GT(rgb[2], 0.97);
}

TEST(KelvinToRgb, WarmHasNoBlue) {
    const auto rgb = kelvin_to_rgb(1900.);
    EXPECT_EQ(rgb[0], 1.);
    EXPECT_EQ(rgb[2], 0.);
    EXPECT_GT(rgb[1], 0.);
    EXPECT_LT(rgb[1], 1.);
}

TEST(KelvinToRgb, ClampedInput) {
    EXPECT_EQ(kelvin_to_rgb(10.), kelvin_to_rgb(1000.));
    EXPECT_EQ(kelvin_to_rgb(1e6), kelvin_to_rgb(40000.));
    for (double k = 1000.; k <= 40000.; k += 500.) {
        for (double c : kelvin_to_rgb(k)) {
            EXPECT_GE(c, 0.);
            EXPECT_LE(c, 1.);
        }
    }
}

TEST(KelvinToGains, ReferenceIsNeutral) {
    for (double g : kelvin_to_gains(6500.))
        EXPECT_NEAR(g, 1., 1e-12);
}

TEST(KelvinToGains, PeakPreserved) {
    for (double k : {1000., 1900., 3400., 5000., 6500., 9000., 20000.}) {
        const auto gains = kelvin_to_gains(k);
        EXPECT_LE(*std::max_element(gains.begin(), gains.end()), 1. + 1e-12) << k << "K";
    }
    // cooler than the reference boosts blue without preserve_peak
    const auto raw = kelvin_to_gains(20000., false);
    EXPECT_GT(*std::max_element(raw.begin(), raw.end()), 1.);
}

TEST(WarmthToKelvin, Endpoints) {
    EXPECT_EQ(warmth_to_kelvin(0.), 6500.);
    EXPECT_EQ(warmth_to_kelvin(1.), 1900.);
    EXPECT_EQ(warmth_to_kelvin(-0.5), 6500.);
    EXPECT_EQ(warmth_to_kelvin(2.), 1900.);
    EXPECT_EQ(warmth_to_kelvin(1., 3000., 5000.), 3000.);
}

TEST(WarmthToKelvin, MiredMidpoint) {
    const double mid = 1e6 / ((1e6 / 6500. + 1e6 / 1900.) / 2.);
    EXPECT_NEAR(warmth_to_kelvin(0.5), mid, 1e-9);
}

TEST(WarmthToKelvin, Decreasing) {
    double prev = 1e9;
    for (int i = 0; i <= 100; ++i) {
        const double k = warmth_to_kelvin(i / 100.);
        EXPECT_LE(k, prev);
        EXPECT_GE(k, 1900. - 1e-9);
        EXPECT_LE(k, 6500. + 1e-9);
        prev = k;
    }
}

TEST(WarmthBeta, Shape) {
    EXPECT_EQ(warmth_beta(0.), 1.);
    EXPECT_NEAR(warmth_beta(0.4), 0.98, 1e-12);
    EXPECT_NEAR(warmth_beta(1.), 0.90, 1e-12);
}

TEST(WarmthParams, InactiveBelowThreshold) {
    EXPECT_FALSE(warmth_params_from_slider(0.).has_value());
    EXPECT_FALSE(warmth_params_from_slider(0.001).has_value());
}

TEST(WarmthParams, FullWarmth) {
    const auto p = warmth_params_from_slider(1.);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->kelvin, 1900.);
    EXPECT_NEAR(p->beta, 0.90, 1e-9);
    EXPECT_LE(std::max({p->r_gain, p->g_gain, p->b_gain}), 1. + 1e-12);
    EXPECT_EQ(p->b_gain, 0.);
}

TEST(WarmthParams, BetaCurveDisabled) {
    curve_tuning tuning;
    tuning.warmth_beta_curve = false;
    EXPECT_EQ(warmth_params_from_slider(0.8, tuning)->beta, 1.);
}

TEST(WarmthCurve, IdentityWhenInactive) {
    EXPECT_EQ(build_warmth_curve(0., 512), identity_curve(512));
}

TEST(WarmthCurve, MonotoneChannels) {
    for (double w : {0.01, 0.25, 0.5, 0.75, 1.}) {
        const rgb_curve c = build_warmth_curve(w, 512);
        for (const auto &ch : c.channels)
            EXPECT_TRUE(is_monotone(ch)) << "warmth " << w;
    }
}

TEST(WarmthCurve, BlueBelowRed) {
    const rgb_curve c = build_warmth_curve(0.7, 256);
    for (size_t i = 0; i < c.size(); ++i)
        EXPECT_LE(c.b()[i], c.r()[i]);
    EXPECT_LT(c.b().back(), c.g().back());
}

TEST(WarmthCurve, HighlightShoulder) {
    const warmth_params neutral {6500., 1., 1., 1., 1.};
    const rgb_curve c = build_warmth_curve(neutral, 101, 0.08);
    EXPECT_NEAR(c.r().back(), 0.93, 1e-12);
    EXPECT_NEAR(c.r()[50], 0.5, 1e-12);
}

TEST(KelvinCurve, ReferenceIsNearIdentity) {
    const rgb_curve c = build_kelvin_curve(6500., 101, 1., 0.08);
    EXPECT_NEAR(c.g()[50], 0.5, 1e-9);
}

TEST(KelvinCurve, ClampsKelvin) {
    EXPECT_EQ(build_kelvin_curve(10000., 64), build_kelvin_curve(6500., 64));
    EXPECT_EQ(build_kelvin_curve(200., 64), build_kelvin_curve(1000., 64));
}
