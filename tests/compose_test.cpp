// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <gtest/gtest.h>

#include <smartdimd/compose.hpp>
#include <smartdimd/brightness.hpp>
#include <smartdimd/warmth.hpp>
#include <smartdimd/curve.hpp>

#include "recording_consumer.hpp"

using namespace smartdimd;

TEST(Compose, IdentityBaseYieldsTint) {
    const rgb_curve tint = gray_curve({0., 0.5, 0.8, 1.});
    EXPECT_EQ(compose(identity_curve(4), tint), tint);
}

TEST(Compose, IdentityTintYieldsQuantizedBase) {
    const rgb_curve base = gray_curve({0., 0.1, 0.2, 0.3});
    const rgb_curve out  = compose(base, identity_curve(4));
    EXPECT_EQ(out.r(), (std::vector<double> {0., 0., 1. / 3., 1. / 3.}));
}

TEST(Compose, PerChannelLookup) {
    rgb_curve tint = identity_curve(3);
    tint.r() = {0.2, 0.2, 0.2};
    tint.b() = {0., 0., 0.};
    const rgb_curve out = compose(gray_curve({0., 0.5, 1.}), tint);
    EXPECT_EQ(out.r(), (std::vector<double> {0.2, 0.2, 0.2}));
    EXPECT_EQ(out.g(), (std::vector<double> {0., 0.5, 1.}));
    EXPECT_EQ(out.b(), (std::vector<double> {0., 0., 0.}));
}

TEST(Compose, OutputLengthFollowsBase) {
    const rgb_curve out = compose(identity_curve(8), identity_curve(4));
    EXPECT_EQ(out.size(), 8u);
    EXPECT_TRUE(is_monotone(out.r()));
}

TEST(ComposeControls, BothInactiveIsRestore) {
    EXPECT_FALSE(compose_controls(0., 0.).has_value());
    EXPECT_FALSE(compose_controls(0.001, 0.0005).has_value());
    EXPECT_FALSE(compose_controls(-2., -1.).has_value());
}

TEST(ComposeControls, OnlyWarmth) {
    const auto curve = compose_controls(0., 0.6, 256);
    ASSERT_TRUE(curve.has_value());
    EXPECT_EQ(*curve, build_warmth_curve(0.6, 256));
}

TEST(ComposeControls, OnlyBrightness) {
    const auto curve = compose_controls(0.6, 0., 256);
    ASSERT_TRUE(curve.has_value());
    EXPECT_EQ(*curve, build_brightness_curve(0.6, 256));
}

TEST(ComposeControls, BothActive) {
    const auto curve = compose_controls(0.5, 0.5, 512);
    ASSERT_TRUE(curve.has_value());
    EXPECT_EQ(*curve, compose(build_brightness_curve(0.5, 512), build_warmth_curve(0.5, 512)));
}

TEST(ComposeControls, Idempotent) {
    EXPECT_EQ(compose_controls(0.42, 0.77, 300), compose_controls(0.42, 0.77, 300));
}

TEST(ComposeControls, TuningIsUsed) {
    curve_tuning tuning;
    tuning.white_cap = 0.3;
    const auto curve = compose_controls(0.2, 0., 128, tuning);
    ASSERT_TRUE(curve.has_value());
    EXPECT_LE(curve->r().back(), 0.3);
}

TEST(ComposeControls, PropertySweep) {
    for (size_t n : {2u, 3u, 17u, 256u, 1024u}) {
        for (double intensity : {0., 0.002, 0.25, 0.5, 0.75, 1.}) {
            for (double warmth : {0., 0.002, 0.3, 0.6, 1.}) {
                const auto curve = compose_controls(intensity, warmth, n);
                if (!curve.has_value())
                    continue;
                ASSERT_EQ(curve->size(), n);
                for (const auto &ch : curve->channels) {
                    ASSERT_EQ(ch.size(), n);
                    EXPECT_TRUE(is_monotone(ch)) << "n " << n << " intensity " << intensity << " warmth " << warmth;
                }
            }
        }
    }
}

TEST(ComposeAndApply, RestoresWhenInactive) {
    recording_consumer consumer;
    EXPECT_FALSE(compose_and_apply(consumer, 0., 0.));
    EXPECT_EQ(consumer.restores, 1);
    EXPECT_TRUE(consumer.applied.empty());
}

TEST(ComposeAndApply, AppliesCurve) {
    recording_consumer consumer;
    EXPECT_TRUE(compose_and_apply(consumer, 0.4, 0.3, 64));
    EXPECT_EQ(consumer.restores, 0);
    ASSERT_EQ(consumer.applied.size(), 1u);
    EXPECT_EQ(consumer.last(), *compose_controls(0.4, 0.3, 64));
}

TEST(ComposeAndApply, NoOutputs) {
    recording_consumer consumer;
    consumer.outputs = 0;
    EXPECT_TRUE(compose_and_apply(consumer, 1., 1.));
    EXPECT_EQ(consumer.applied.size(), 1u);
}
