// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CONSUMER_HPP
#define CONSUMER_HPP

#include <smartdimd/curve.hpp>

namespace smartdimd {

// Anything able to install a transfer curve on the displays it manages.
class curve_consumer {
public:
    virtual ~curve_consumer() = default;

    // Install the curve on every managed display.
    virtual void apply(const rgb_curve &curve) = 0;

    // Drop the installed curve and go back to the platform's own gamma.
    virtual void restore() = 0;

    // Number of displays reached by apply/restore.
    virtual size_t output_count() const = 0;
};

}

#endif // CONSUMER_HPP
