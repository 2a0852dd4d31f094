// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <cmath>
#include <algorithm>
#include <smartdimd/utils.hpp>

namespace smartdimd {

double lerp(double a, double b, double t) {
    return (b * t) + (a * (1. - t));
}

double invlerp(double x, double a, double b) {
    return (x - a) / (b - a);
}

double mant(double x) {
    return x - std::floor(x);
}

double clamp_unit(double x) {
    if (std::isnan(x))
        return 0.;
    return std::clamp(x, 0., 1.);
}

double mired(double kelvin) {
    return 1e6 / kelvin;
}

}
