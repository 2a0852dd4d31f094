// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <mutex>
#include <thread>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <condition_variable>
#include <stop_token>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <sdbus-c++/IProxy.h>
#include <sdbus-c++/Message.h>
#include <sdbus-c++/Error.h>

#include <smartdimd/file.hpp>
#include <smartdimd/config.hpp>
#include <smartdimd/constants.hpp>
#include <smartdimd/gamma.hpp>
#include <smartdimd/sd-dbus.hpp>
#include <smartdimd/session.hpp>

using namespace smartdimd;

void jthread_wait_until(std::chrono::milliseconds ms, std::stop_token stoken) {
    std::mutex mutex;
    std::unique_lock lock(mutex);
    std::condition_variable_any()
            .wait_until(lock, stoken, std::chrono::system_clock::now() + ms, [&] { return stoken.stop_requested(); });
}

std::string trim(std::string s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Wake-up notifications need the system bus, which may not be there.
std::unique_ptr<sdbus::IProxy> wake_handler(const std::filesystem::path &pipe_filepath) {
    try {
        return dbus::on_system_sleep([pipe_filepath] (sdbus::Signal &sig) {
            bool sleep;
            sig >> sleep;
            if (!sleep) {
                spdlog::info("[logind] resumed from sleep");
                file_write(pipe_filepath, "reapply");
            }
        });
    } catch (const sdbus::Error &e) {
        spdlog::warn("[logind] sleep notifications unavailable: {}", e.what());
        return nullptr;
    }
}

int message_loop() {
    const std::unique_ptr<curve_consumer> gamma = display_gamma();

    if (gamma->output_count() == 0) {
        spdlog::warn("No outputs with gamma support found, curves will not be applied.");
    }

    const config conf(config::default_filepath());
    spdlog::info("config: {}", conf.to_json().dump());

    session_state state;
    std::mutex state_mutex;

    named_pipe pipe(xdg_runtime_dir() / constants::fifo_filename);
    const auto proxy = wake_handler(pipe.path());

    // Other programs may overwrite the ramps (or the display server may
    // reset them on reconfiguration), reapply periodically while enabled.
    std::jthread refresh_thr;
    if (conf.refresh_seconds > 0) {
        refresh_thr = std::jthread([&] (std::stop_token stoken) {
            spdlog::debug("[gamma refresh] start");
            while (true) {
                jthread_wait_until(std::chrono::seconds(conf.refresh_seconds), stoken);
                if (stoken.stop_requested()) {
                    spdlog::debug("[gamma refresh] stop requested");
                    return;
                }
                std::lock_guard lk(state_mutex);
                if (!state.enabled)
                    continue;
                spdlog::trace("[gamma refresh] reapply");
                try {
                    reapply(state, *gamma, conf);
                } catch (const std::exception &e) {
                    spdlog::error("[gamma refresh] {}", e.what());
                }
            }
        });
    }

    while (true) {
        const std::string data = trim(file_read(pipe.path()));
        spdlog::debug("[pipe] received: {}", data);

        std::lock_guard lk(state_mutex);

        try {
            if (data == "stop") {
                break;
            } else if (data == "status") {
                // blocks until the client reads from the pipe
                file_write(pipe.path(), status_json(state, *gamma).dump());
            } else if (data == "reset") {
                reset(state, *gamma);
            } else if (data == "reapply") {
                reapply(state, *gamma, conf);
            } else if (data == "toggle-brightness") {
                toggle_brightness(state, *gamma, conf);
            } else if (data == "toggle-warmth") {
                toggle_warmth(state, *gamma, conf);
            } else {
                handle_message(state, *gamma, conf, nlohmann::json::parse(data));
            }
        } catch (const nlohmann::json::exception &e) {
            spdlog::error("[pipe] invalid message: {}", e.what());
        } catch (const std::exception &e) {
            spdlog::error("[pipe] {}", e.what());
        }
    }

    refresh_thr.request_stop();
    if (refresh_thr.joinable())
        refresh_thr.join();

    reset(state, *gamma);
    spdlog::info("stopped");
	return EXIT_SUCCESS;
}

int main(int argc, char **argv) {
    if (argc > 1 && strcmp(argv[1], "-v") == 0) {
        std::puts(VERSION);
        std::exit(EXIT_SUCCESS);
    }

    std::filesystem::create_directories(xdg_state_dir() / "smartdimd");
    spdlog::set_level(spdlog::level::warn);
    spdlog::set_default_logger(spdlog::rotating_logger_mt("smartdimd", xdg_state_dir() / "smartdimd/logs/smartdimd.log", 1048576 * 5, 3));
    spdlog::cfg::load_env_levels();
    spdlog::flush_every(std::chrono::seconds(10));
    spdlog::info("smartdimd v{}", VERSION);

    lockfile flock(xdg_runtime_dir() / constants::flock_filename, false);
    if (flock.locked()) {
        spdlog::warn("already running");
        return EXIT_FAILURE;
    }

    try {
        return message_loop();
    } catch (const std::exception &e) {
        spdlog::critical("{}", e.what());
        spdlog::shutdown();
        return EXIT_FAILURE;
    }
}
