// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <sdbus-c++/IConnection.h>
#include <sdbus-c++/Error.h>

#include <smartdimd/gamma.hpp>
#include <smartdimd/curve.hpp>
#include <smartdimd/file.hpp>

using namespace smartdimd;

namespace {
// Ramps read at start-up may be unusable (e.g. another program crashed while dimming):
// an empty or mis-sized ramp is replaced by the identity.
std::vector<uint16_t> initial_or_identity(std::vector<uint16_t> ramps, size_t ramp_sz) {
    if (ramps.size() != ramp_sz * 3) {
        spdlog::warn("[gamma] unexpected initial ramp size {}, using identity", ramps.size());
        return to_gamma_ramps(identity_curve(ramp_sz), ramp_sz);
    }
    return ramps;
}
}

randr_gamma::randr_gamma()
: outputs_(xcb::randr::outputs(x_connection_, x_connection_.first_screen())) {
    initial_ramps_.reserve(outputs_.size());
    for (const auto &output : outputs_) {
        initial_ramps_.push_back(initial_or_identity(xcb::randr::get_gamma(x_connection_, output.crtc_id), output.ramp_size));
    }
}

void randr_gamma::apply(const rgb_curve &curve) {
    if (outputs_.empty()) {
        spdlog::warn("[x11] no outputs, curve not applied");
        return;
    }
    for (const auto &output : outputs_) {
        SPDLOG_TRACE("[x11] [{}] set_gamma, ramp size: {}", output.id, output.ramp_size);
        xcb::randr::set_gamma(x_connection_, output.crtc_id, to_gamma_ramps(curve, output.ramp_size));
    }
}

void randr_gamma::restore() {
    for (size_t i = 0; i < outputs_.size(); ++i) {
        xcb::randr::set_gamma(x_connection_, outputs_[i].crtc_id, initial_ramps_[i]);
    }
    spdlog::debug("[x11] restored {} output(s)", outputs_.size());
}

size_t randr_gamma::output_count() const {
    return outputs_.size();
}

randr_gamma::~randr_gamma() {
    try {
        restore();
    } catch (const std::exception &e) {
        spdlog::error("[x11] restore failed: {}", e.what());
    }
}

mutter_gamma::mutter_gamma()
: dbus_connection_(sdbus::createSessionBusConnection()),
  outputs_(dbus::mutter::display_config_get_resources()) {
    initial_ramps_.reserve(outputs_.size());
    for (const auto &output : outputs_) {
        initial_ramps_.push_back(initial_or_identity(dbus::mutter::get_gamma(*dbus_connection_, output.serial, output.crtc), output.ramp_size));
    }
}

void mutter_gamma::apply(const rgb_curve &curve) {
    if (outputs_.empty()) {
        spdlog::warn("[mutter] no outputs, curve not applied");
        return;
    }
    for (const auto &output : outputs_) {
        SPDLOG_TRACE("[mutter] [{}] set_gamma, ramp size: {}", output.name, output.ramp_size);
        dbus::mutter::set_gamma(*dbus_connection_, output.serial, output.crtc, to_gamma_ramps(curve, output.ramp_size));
    }
}

void mutter_gamma::restore() {
    for (size_t i = 0; i < outputs_.size(); ++i) {
        dbus::mutter::set_gamma(*dbus_connection_, outputs_[i].serial, outputs_[i].crtc, initial_ramps_[i]);
    }
    spdlog::debug("[mutter] restored {} output(s)", outputs_.size());
}

size_t mutter_gamma::output_count() const {
    return outputs_.size();
}

mutter_gamma::~mutter_gamma() {
    try {
        restore();
    } catch (const sdbus::Error &e) {
        spdlog::error("[mutter] restore failed: {}", e.what());
    }
}

std::unique_ptr<curve_consumer> smartdimd::display_gamma() {
    if (!env("WAYLAND_DISPLAY").empty()) {
        spdlog::info("[gamma] wayland session, using mutter");
        return std::make_unique<mutter_gamma>();
    }
    spdlog::info("[gamma] using x11 randr");
    return std::make_unique<randr_gamma>();
}
