// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdlib>
#include <memory>

namespace smartdimd {
// scale value in a [0, 1] range
double invlerp(double val, double min, double max);
// interpolate betweeen a and b
double lerp(double a, double b, double t);
// get the fractional part of a floating point number
double mant(double x);
// clamp to [0, 1]
double clamp_unit(double x);
// reciprocal megakelvin
double mired(double kelvin);

template <class T>
struct c_deleter {
	void operator()(T *ptr) { std::free(ptr); }
};

template <class T>
using c_unique_ptr = std::unique_ptr<T, c_deleter<T>>;
}

#endif // UTILS_HPP
