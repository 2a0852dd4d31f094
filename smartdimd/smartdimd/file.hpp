// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef FILE_HPP
#define FILE_HPP

#include <string>
#include <string_view>
#include <filesystem>
#include <fcntl.h>

namespace smartdimd {

class named_pipe {
    std::filesystem::path filepath_;
public:
    named_pipe(std::filesystem::path filepath);
    named_pipe(const named_pipe &) = delete;
    std::filesystem::path path() const;
    ~named_pipe();
};

// Advisory write lock on the first byte of a file.
// With wait = false, locked() tells whether another process holds it.
class lockfile {
    std::filesystem::path filepath_;
	int fd_;
	int fnctl_op_;
	flock fl_;
public:
    lockfile(std::filesystem::path filepath, bool wait);
    lockfile(const lockfile &) = delete;
    bool locked() const;
    ~lockfile();
};

std::string file_read(std::filesystem::path filepath);
void file_write(std::filesystem::path filepath, std::string_view data);

std::string env(std::string_view var);

// https://specifications.freedesktop.org/basedir-spec/basedir-spec-latest.html
std::filesystem::path xdg_config_dir();
std::filesystem::path xdg_state_dir();
std::filesystem::path xdg_runtime_dir();
}

#endif // FILE_HPP
