// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef API_HPP
#define API_HPP

#include <string_view>
#include <nlohmann/json_fwd.hpp>

namespace smartdimd {
    // Returns false if it's already started.
    bool daemon_start();

    // Returns false if it's already stopped.
    bool daemon_stop();

    // Check if it's running.
    bool daemon_is_running();

    // Send a plain command: "reset", "reapply", "toggle-brightness", "toggle-warmth".
    void daemon_send_command(std::string_view cmd);

    // Send a control update, see session.hpp: handle_message().
    void daemon_send_update(const nlohmann::json &msg);

    // Current session state.
    nlohmann::json daemon_status();

    // Convert a percentage to a [0, 1] control value. Negative percentages stay negative.
    double perc_to_control(int perc);
}

#endif // API_HPP
