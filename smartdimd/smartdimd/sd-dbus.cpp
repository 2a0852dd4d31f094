// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <map>
#include <tuple>
#include <string>
#include <functional>

#include <spdlog/spdlog.h>
#include <sdbus-c++/sdbus-c++.h>
#include <smartdimd/sd-dbus.hpp>

namespace smartdimd {
namespace dbus {

namespace {
const std::string mutter_destination ("org.gnome.Mutter.DisplayConfig");
const std::string mutter_object_path ("/org/gnome/Mutter/DisplayConfig");
const std::string mutter_interface   ("org.gnome.Mutter.DisplayConfig");
}

std::unique_ptr<sdbus::IProxy> register_signal_handler(
    std::string service,
    std::string obj_path,
    std::string interface,
    std::string signal_name,
    std::function<void(sdbus::Signal &signal)> handler) {
    auto proxy = sdbus::createProxy(service, obj_path);
    proxy->registerSignalHandler(interface, signal_name, handler);
    proxy->finishRegistration();
    return proxy;
}

std::unique_ptr<sdbus::IProxy> on_system_sleep(std::function<void(sdbus::Signal &signal)> fn) {
    return dbus::register_signal_handler(
            "org.freedesktop.login1",
            "/org/freedesktop/login1",
            "org.freedesktop.login1.Manager",
            "PrepareForSleep",
            fn);
}

std::vector<uint16_t> mutter::get_gamma(sdbus::IConnection &conn, uint32_t serial, uint32_t crtc) {
    std::tuple<std::vector<uint16_t>, std::vector<uint16_t>, std::vector<uint16_t>> reply;
    try {
        auto proxy (sdbus::createProxy(conn, mutter_destination, mutter_object_path));
        proxy->callMethod("GetCrtcGamma").onInterface(mutter_interface).withArguments(serial, crtc).storeResultsTo(reply);
    } catch (const sdbus::Error &e) {
        spdlog::error("[mutter] [get_gamma] {}", e.what());
        return {};
    }

    const auto &[r, g, b] = reply;
    std::vector<uint16_t> ramps;
    ramps.reserve(r.size() * 3);
    ramps.insert(ramps.end(), r.begin(), r.end());
    ramps.insert(ramps.end(), g.begin(), g.end());
    ramps.insert(ramps.end(), b.begin(), b.end());
    return ramps;
}

// https://gitlab.gnome.org/GNOME/mutter/-/blob/main/data/dbus-interfaces/org.gnome.Mutter.DisplayConfig.xml
// signature: (ua(uxiiiiiuaua{sv})a(uxiausauaua{sv})a(uxuudu)ii)
// crtcs:     a(ux iiiii u au a{sv})
// outputs:   a(uxi au s au au a{sv})
// modes:     a(uxu udu)
std::vector<mutter::output> mutter::display_config_get_resources() {
    using au   = std::vector<uint32_t>;
    using a_sv = std::map<std::string, sdbus::Variant>;
    using crtc_t   = sdbus::Struct<uint32_t, int64_t, int32_t, int32_t, int32_t, int32_t, int32_t, uint32_t, au, a_sv>;
    using output_t = sdbus::Struct<uint32_t, int64_t, int32_t, au, std::string, au, au, a_sv>;
    using mode_t   = sdbus::Struct<uint32_t, int64_t, uint32_t, uint32_t, double, uint32_t>;

    std::tuple<uint32_t, std::vector<crtc_t>, std::vector<output_t>, std::vector<mode_t>, int32_t, int32_t> reply;

    const auto connection (sdbus::createSessionBusConnection());

    try {
        auto proxy (sdbus::createProxy(*connection, mutter_destination, mutter_object_path));
        proxy->callMethod("GetResources").onInterface(mutter_interface).withArguments().storeResultsTo(reply);
    } catch (const sdbus::Error &e) {
        spdlog::error("[mutter] {}", e.what());
        return {};
    }

    const auto &[serial, crtcs, outputs, modes, max_width, max_height] = reply;

    std::vector<mutter::output> out_vec;

    for (const output_t &output : outputs) {
        // -1 when the output is not driven
        if (output.get<2>() < 0)
            continue;

        const a_sv &properties (output.get<7>());

        mutter::output out;
        out.serial    = serial;
        out.crtc      = uint32_t(output.get<2>());
        out.ramp_size = mutter::get_gamma(*connection, out.serial, out.crtc).size() / 3;
        out.name      = properties.contains("display-name")
                ? properties.at("display-name").get<std::string>()
                : output.get<4>();

        spdlog::info("[mutter] found: {}, gamma ramp size: {}", out.name, out.ramp_size);
        out_vec.push_back(out);
    }

    return out_vec;
}

void mutter::set_gamma(sdbus::IConnection &conn, uint32_t serial, uint32_t crtc, const std::vector<uint16_t> &ramps) {
    const size_t sz (ramps.size() / 3);
    const std::vector<uint16_t> r (ramps.begin(), ramps.begin() + sz);
    const std::vector<uint16_t> g (ramps.begin() + sz, ramps.begin() + 2 * sz);
    const std::vector<uint16_t> b (ramps.begin() + 2 * sz, ramps.end());

    try {
        const auto proxy (sdbus::createProxy(conn, mutter_destination, mutter_object_path));
        proxy->callMethod("SetCrtcGamma").onInterface(mutter_interface).withArguments(serial, crtc, r, g, b);
    } catch (const sdbus::Error &e) {
        spdlog::error("[mutter] [set_gamma] {}", e.what());
    }
}

} // namespace dbus
} // namespace smartdimd
