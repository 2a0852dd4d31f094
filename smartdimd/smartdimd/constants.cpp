// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <smartdimd/constants.hpp>
#include <string_view>

namespace smartdimd {
namespace constants {
constexpr std::string_view flock_filename     = "smartdimd-lock";
constexpr std::string_view flock_filename_cli = "smartdim-cli-lock";
constexpr std::string_view fifo_filename      = "smartdimd-fifo";
constexpr std::string_view config_filename    = "smartdim.json";

constexpr double activation_threshold = 1e-3;

constexpr size_t samples_min     = 2;
constexpr size_t samples_max     = 4096;
constexpr size_t samples_default = 512;

constexpr double kelvin_min       = 1900.;
constexpr double kelvin_max       = 6500.;
constexpr double kelvin_reference = 6500.;

constexpr double guard_width_default  = 0.05;
constexpr double rolloff_default      = 0.08;
constexpr int refresh_seconds_default = 10;
}}
