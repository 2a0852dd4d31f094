// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef COMPOSE_HPP
#define COMPOSE_HPP

#include <optional>
#include <smartdimd/curve.hpp>
#include <smartdimd/consumer.hpp>

namespace smartdimd {

// Function composition tint(base(x)), per channel, with nearest-sample
// lookup into tint. Both curves are expected to have the same size:
// base values are mapped to indices using tint's own size.
rgb_curve compose(const rgb_curve &base, const rgb_curve &tint);

// Dim first, then tint the dimmed value.
// std::nullopt means "restore the platform defaults" and is returned
// only when both controls are below the activation threshold.
std::optional<rgb_curve> compose_controls(double intensity,
                                          double warmth,
                                          size_t n = constants::samples_default,
                                          const curve_tuning &tuning = {});

// Builds the combined curve and hands it to the consumer, or asks the consumer
// to restore its defaults. Returns true if a curve was applied.
bool compose_and_apply(curve_consumer &consumer,
                       double intensity,
                       double warmth,
                       size_t n = constants::samples_default,
                       const curve_tuning &tuning = {});
}

#endif // COMPOSE_HPP
