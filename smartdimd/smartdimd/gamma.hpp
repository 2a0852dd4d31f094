// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef GAMMA_HPP
#define GAMMA_HPP

#include <memory>
#include <vector>
#include <sdbus-c++/IConnection.h>

#include <smartdimd/consumer.hpp>
#include <smartdimd/x11-xcb.hpp>
#include <smartdimd/sd-dbus.hpp>

namespace smartdimd {

// X11 RandR. The ramps found at start-up are what restore() puts back,
// which is also done on destruction.
class randr_gamma : public curve_consumer {
public:
    randr_gamma();
    ~randr_gamma() override;
    randr_gamma(const randr_gamma &) = delete;
    randr_gamma(randr_gamma &&) = delete;

    void apply(const rgb_curve &curve) override;
    void restore() override;
    size_t output_count() const override;

private:
    xcb::connection x_connection_;
    std::vector<xcb::randr::output> outputs_;
    std::vector<std::vector<uint16_t>> initial_ramps_;
};

// GNOME Mutter over D-Bus, for Wayland sessions.
class mutter_gamma : public curve_consumer {
public:
    mutter_gamma();
    ~mutter_gamma() override;
    mutter_gamma(const mutter_gamma &) = delete;
    mutter_gamma(mutter_gamma &&) = delete;

    void apply(const rgb_curve &curve) override;
    void restore() override;
    size_t output_count() const override;

private:
    std::unique_ptr<sdbus::IConnection> dbus_connection_;
    std::vector<dbus::mutter::output> outputs_;
    std::vector<std::vector<uint16_t>> initial_ramps_;
};

// Mutter when running under Wayland, RandR otherwise.
std::unique_ptr<curve_consumer> display_gamma();
}

#endif // GAMMA_HPP
