// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CONSTANTS_HPP
#define CONSTANTS_HPP

#include <cstddef>
#include <string_view>

namespace smartdimd {
namespace constants {
extern const std::string_view flock_filename;
extern const std::string_view flock_filename_cli;
extern const std::string_view fifo_filename;
extern const std::string_view config_filename;

// Controls at or below this value are exact identity.
extern const double activation_threshold;

extern const size_t samples_min;
extern const size_t samples_max;
extern const size_t samples_default;

extern const double kelvin_min;
extern const double kelvin_max;
extern const double kelvin_reference;

extern const double guard_width_default;
extern const double rolloff_default;
extern const int    refresh_seconds_default;
}}

#endif // CONSTANTS_HPP
