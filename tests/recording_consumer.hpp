// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef RECORDING_CONSUMER_HPP
#define RECORDING_CONSUMER_HPP

#include <vector>
#include <smartdimd/consumer.hpp>

// Keeps every curve it is given instead of touching a display.
class recording_consumer : public smartdimd::curve_consumer {
public:
    std::vector<smartdimd::rgb_curve> applied;
    int restores = 0;
    size_t outputs = 1;

    void apply(const smartdimd::rgb_curve &curve) override {
        applied.push_back(curve);
    }

    void restore() override {
        ++restores;
    }

    size_t output_count() const override {
        return outputs;
    }

    const smartdimd::rgb_curve &last() const {
        return applied.back();
    }
};

#endif // RECORDING_CONSUMER_HPP
