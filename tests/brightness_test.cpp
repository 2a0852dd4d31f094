// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <gtest/gtest.h>

#include <smartdimd/brightness.hpp>
#include <smartdimd/curve.hpp>

using namespace smartdimd;

namespace {
void expect_params_near(const brightness_params &a, const brightness_params &b, double eps) {
    EXPECT_NEAR(a.guard, b.guard, eps);
    EXPECT_NEAR(a.offset, b.offset, eps);
    EXPECT_NEAR(a.beta, b.beta, eps);
}
}

TEST(BrightnessParams, InactiveBelowThreshold) {
    EXPECT_FALSE(brightness_params_from_slider(0.).has_value());
    EXPECT_FALSE(brightness_params_from_slider(0.001).has_value());
    EXPECT_FALSE(brightness_params_from_slider(-1.).has_value());
    EXPECT_TRUE(brightness_params_from_slider(0.01).has_value());
}

TEST(BrightnessParams, PhaseEndpoints) {
    expect_params_near(brightness_params_at(0.), {0.94, 0.05, 0.00, 1.00}, 1e-12);
    expect_params_near(brightness_params_at(1. / 3.), {0.84, 0.05, 0.14, 0.97}, 1e-9);
    expect_params_near(brightness_params_at(2. / 3.), {0.60, 0.05, 0.26, 0.90}, 1e-9);
    expect_params_near(brightness_params_at(1.), {0.38, 0.05, 0.44, 0.55}, 1e-12);
}

TEST(BrightnessParams, ContinuousAcrossPhases) {
    for (double split : {1. / 3., 2. / 3.}) {
        expect_params_near(brightness_params_at(split - 1e-9), brightness_params_at(split + 1e-9), 1e-6);
    }
}

TEST(BrightnessParams, GuardWidthIsPassedThrough) {
    EXPECT_EQ(brightness_params_at(0.5, 0.12).guard_width, 0.12);
}

TEST(BrightnessParams, FullIntensity) {
    const auto p = brightness_params_from_slider(1.);
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->guard, 0.38, 1e-9);
    EXPECT_NEAR(p->offset, 0.44, 1e-9);
    EXPECT_NEAR(p->beta, 0.55, 1e-9);
}

TEST(BrightnessCurve, IdentityWhenInactive) {
    EXPECT_EQ(build_brightness_curve(0., 256), identity_curve(256));
    EXPECT_EQ(build_brightness_curve(0.0005, 64), identity_curve(64));
}

TEST(BrightnessCurve, FullIntensity) {
    const rgb_curve c = build_brightness_curve(1., 512);
    ASSERT_EQ(c.size(), 512u);
    EXPECT_EQ(c.r().front(), 0.);
    EXPECT_NEAR(c.r().back(), 0.56 * 0.55, 1e-6);
    // below the guard only beta applies
    const size_t i = 100;
    EXPECT_NEAR(c.r()[i], sample_x(i, 512) * 0.55, 1e-9);
}

TEST(BrightnessCurve, ChannelsIdenticalAndMonotone) {
    for (double intensity : {0.05, 0.2, 0.35, 0.5, 0.7, 0.9, 1.}) {
        const rgb_curve c = build_brightness_curve(intensity, 300);
        EXPECT_EQ(c.r(), c.g());
        EXPECT_EQ(c.g(), c.b());
        EXPECT_TRUE(is_monotone(c.r())) << "intensity " << intensity;
    }
}

TEST(BrightnessCurve, DarkerWithIntensity) {
    const rgb_curve low  = build_brightness_curve(0.3, 256);
    const rgb_curve high = build_brightness_curve(0.8, 256);
    EXPECT_LT(high.r().back(), low.r().back());
    for (size_t i = 0; i < 256; ++i)
        EXPECT_LE(high.r()[i], low.r()[i] + 1e-12);
}

TEST(BrightnessCurve, NeverBrighterThanInput) {
    for (double intensity : {0.01, 0.5, 1.}) {
        const rgb_curve c = build_brightness_curve(intensity, 128);
        for (size_t i = 0; i < c.size(); ++i)
            EXPECT_LE(c.r()[i], sample_x(i, c.size()) + 1e-12);
    }
}

TEST(BrightnessCurve, WhiteCap) {
    curve_tuning tuning;
    tuning.white_cap = 0.5;
    const rgb_curve c = build_brightness_curve(0.1, 256, tuning);
    EXPECT_NEAR(c.r().back(), 0.5, 1e-12);
    for (double v : c.r())
        EXPECT_LE(v, 0.5);
    EXPECT_TRUE(is_monotone(c.r()));
}

TEST(BrightnessCurve, DegenerateGuardWidth) {
    const brightness_params p {0.5, 0., 0.2, 1.};
    const rgb_curve c = build_brightness_curve(p, 1001);
    EXPECT_TRUE(is_monotone(c.r()));
    EXPECT_NEAR(c.r()[400], 0.4, 1e-12);
    EXPECT_NEAR(c.r()[1000], 0.8, 1e-12);
}

TEST(BrightnessCurve, GuardNearWhite) {
    const brightness_params p {0.9995, 0.05, 0.3, 1.};
    const rgb_curve c = build_brightness_curve(p, 64);
    EXPECT_TRUE(is_monotone(c.r()));
}

TEST(BrightnessCurve, TwoSamples) {
    const rgb_curve c = build_brightness_curve(1., 2);
    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ(c.r()[0], 0.);
    EXPECT_NEAR(c.r()[1], 0.308, 1e-6);
}
