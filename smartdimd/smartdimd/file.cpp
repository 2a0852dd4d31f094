// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <fstream>
#include <filesystem>
#include <string>
#include <string_view>
#include <sstream>
#include <cerrno>
#include <stdexcept>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <smartdimd/file.hpp>

namespace smartdimd {

named_pipe::named_pipe(std::filesystem::path filepath) : filepath_(filepath) {
    // a stale fifo left by a crashed daemon is reused
    if (mkfifo(filepath_.c_str(), S_IFIFO | 0640) < 0 && errno != EEXIST) {
        spdlog::error("[named_pipe] mkfifo error on {}", filepath_.string());
    }
}

std::filesystem::path named_pipe::path() const {
    return filepath_;
}

named_pipe::~named_pipe() {
    std::error_code ec;
    std::filesystem::remove(filepath_, ec);
}

lockfile::lockfile(std::filesystem::path filepath, bool wait)
    : filepath_(filepath),
      fd_(open(filepath_.c_str(), O_WRONLY | O_CREAT, 0640)) {

    if (fd_ < 0) {
        throw std::runtime_error(fmt::format("[lockfile] open({}) failed", filepath_.string()));
    }

    fl_.l_type   = F_WRLCK;
    fl_.l_whence = SEEK_SET;
    fl_.l_start  = 0;
    fl_.l_len    = 1;
    fnctl_op_    = fcntl(fd_, wait ? F_SETLKW : F_SETLK, &fl_);
}

bool lockfile::locked() const {
    return fnctl_op_ < 0;
}

lockfile::~lockfile() {
    if (fnctl_op_ >= 0) {
        fl_.l_type = F_UNLCK;
        fcntl(fd_, F_SETLK, &fl_);
    }
    close(fd_);
}

std::string file_read(std::filesystem::path filepath) {
    std::ifstream fs(filepath);
    fs.exceptions(std::ifstream::failbit);

    std::ostringstream buf;
    buf << fs.rdbuf();

    return buf.str();
}

void file_write(std::filesystem::path filepath, std::string_view data) {
    std::ofstream fs(filepath);
    fs.exceptions(std::ofstream::failbit);
    fs.write(data.data(), data.size());
}

std::string env(std::string_view var) {
    const std::string name(var);
    const char *s = std::getenv(name.c_str());
    return s ? s : "";
}

namespace {
// $var, or $HOME + home_suffix when unset.
std::filesystem::path xdg_dir(std::string_view var, std::string_view home_suffix, std::string_view fallback = "") {
    std::filesystem::path ret;

    if (const std::string val = env(var); !val.empty()) {
        ret = val;
    } else if (const std::string home = env("HOME"); !home.empty() && !home_suffix.empty()) {
        ret = fmt::format("{}{}", home, home_suffix);
    } else {
        ret = fallback;
    }

    if (ret.is_relative())
        throw std::runtime_error(fmt::format("{} should be absolute", var));

    return ret;
}
}

std::filesystem::path xdg_config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", "/.config");
}

std::filesystem::path xdg_state_dir() {
    return xdg_dir("XDG_STATE_HOME", "/.local/state");
}

std::filesystem::path xdg_runtime_dir() {
    return xdg_dir("XDG_RUNTIME_DIR", "", "/var/run");
}

} // namespace smartdimd
