// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SD_DBUS_HPP
#define SD_DBUS_HPP

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <sdbus-c++/IProxy.h>
#include <sdbus-c++/IConnection.h>

namespace smartdimd {
namespace dbus {

std::unique_ptr<sdbus::IProxy> register_signal_handler(
    std::string service,
    std::string obj_path,
    std::string interface,
    std::string signal_name,
    std::function<void(sdbus::Signal &signal)> handler);

// logind PrepareForSleep. The signal carries true before sleeping, false on wake-up.
std::unique_ptr<sdbus::IProxy> on_system_sleep(std::function<void(sdbus::Signal &signal)> fn);

namespace mutter {
struct output {
    uint32_t serial;
    std::string name;
    uint32_t crtc;
    size_t ramp_size;
};
std::vector<mutter::output> display_config_get_resources();

// Current ramps, laid out as [ r..., g..., b... ].
std::vector<uint16_t> get_gamma(sdbus::IConnection&, uint32_t serial, uint32_t crtc);
void set_gamma(sdbus::IConnection&, uint32_t serial, uint32_t crtc, const std::vector<uint16_t> &ramps);
} // namespace mutter

} // namespace dbus
} // namespace smartdimd

#endif // SD_DBUS_HPP
