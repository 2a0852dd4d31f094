// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <stdexcept>
#include <algorithm>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <smartdimd/api.hpp>
#include <smartdimd/file.hpp>
#include <smartdimd/constants.hpp>

namespace smartdimd {

namespace {
void _daemon_send(std::string_view s) {
    lockfile flock(xdg_runtime_dir() / constants::flock_filename_cli, true);
    file_write(xdg_runtime_dir() / constants::fifo_filename, s);
}

std::string _daemon_get(std::string_view s) {
    lockfile flock(xdg_runtime_dir() / constants::flock_filename_cli, true);
    file_write(xdg_runtime_dir() / constants::fifo_filename, s);
    return file_read(xdg_runtime_dir() / constants::fifo_filename);
}
}

bool daemon_start() {
    if (daemon_is_running()) {
        return false;
    }

    const pid_t pid = fork();

    if (pid > 0) {
        return true;
    }

    if (pid == 0) {
        execl(CMAKE_INSTALL_DAEMON_PATH, CMAKE_INSTALL_DAEMON_PATH, nullptr);
        throw std::runtime_error(fmt::format("execl({}) fail", CMAKE_INSTALL_DAEMON_PATH));
    }

    throw std::runtime_error("fork() fail");
}

bool daemon_stop() {
    if (daemon_is_running()) {
        _daemon_send("stop");
        return true;
    }
    return false;
}

bool daemon_is_running() {
    lockfile flock(xdg_runtime_dir() / constants::flock_filename, false);
    return flock.locked();
}

void daemon_send_command(std::string_view cmd) {
    spdlog::debug("[api] sending: {}", cmd);
    _daemon_send(cmd);
}

void daemon_send_update(const nlohmann::json &msg) {
    spdlog::debug("[api] sending: {}", msg.dump());
    _daemon_send(msg.dump());
}

nlohmann::json daemon_status() {
    return nlohmann::json::parse(_daemon_get("status"));
}

double perc_to_control(int perc) {
    return std::clamp(perc, -100, 100) / 100.;
}

}
