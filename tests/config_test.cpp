// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <filesystem>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include <gtest/gtest.h>

#include <smartdimd/config.hpp>
#include <smartdimd/file.hpp>

using namespace smartdimd;
using nlohmann::json;

TEST(Config, Defaults) {
    const config conf;
    EXPECT_EQ(conf.samples, 512u);
    EXPECT_EQ(conf.refresh_seconds, 10);
    EXPECT_EQ(conf.tuning.guard_width, 0.05);
    EXPECT_EQ(conf.tuning.rolloff, 0.08);
    EXPECT_FALSE(conf.tuning.white_cap.has_value());
    EXPECT_TRUE(conf.tuning.warmth_beta_curve);
    EXPECT_EQ(conf.tuning.kelvin_min, 1900.);
    EXPECT_EQ(conf.tuning.kelvin_max, 6500.);
}

TEST(Config, FromJson) {
    const config conf(json {
        {"samples", 1024},
        {"guard_width", 0.1},
        {"white_cap", 0.9},
        {"warmth_beta_curve", false},
        {"kelvin_min", 2700},
    });
    EXPECT_EQ(conf.samples, 1024u);
    EXPECT_EQ(conf.tuning.guard_width, 0.1);
    EXPECT_EQ(conf.tuning.white_cap, 0.9);
    EXPECT_FALSE(conf.tuning.warmth_beta_curve);
    EXPECT_EQ(conf.tuning.kelvin_min, 2700.);
    EXPECT_EQ(conf.tuning.rolloff, 0.08);
}

TEST(Config, NullWhiteCap) {
    const config conf(json {{"white_cap", nullptr}});
    EXPECT_FALSE(conf.tuning.white_cap.has_value());
}

TEST(Config, Sanitize) {
    const config conf(json {
        {"samples", 1},
        {"guard_width", 3.},
        {"rolloff", 0.},
        {"white_cap", 1.5},
        {"kelvin_min", 8000},
        {"kelvin_max", 9000},
        {"refresh_seconds", -4},
    });
    EXPECT_EQ(conf.samples, 2u);
    EXPECT_EQ(conf.tuning.guard_width, 0.5);
    EXPECT_EQ(conf.tuning.rolloff, 0.002);
    EXPECT_EQ(conf.tuning.white_cap, 1.);
    EXPECT_EQ(conf.tuning.kelvin_max, 6500.);
    EXPECT_EQ(conf.tuning.kelvin_min, 6500.);
    EXPECT_EQ(conf.refresh_seconds, 0);
}

TEST(Config, NegativeSamples) {
    EXPECT_EQ(config(json {{"samples", -5}}).samples, 2u);
    EXPECT_EQ(config(json {{"samples", 0}}).samples, 2u);
    EXPECT_EQ(config(json {{"samples", 100000}}).samples, 4096u);
}

TEST(Config, NotAnObject) {
    const config conf(json::array({1, 2, 3}));
    EXPECT_EQ(conf.samples, 512u);
}

TEST(Config, WrongType) {
    const json bad {{"samples", "many"}};
    EXPECT_THROW(config conf(bad), json::exception);
}

class ConfigFileTest : public ::testing::Test {
protected:
    std::filesystem::path dir;
    std::filesystem::path file;

    void SetUp() override {
        dir  = std::filesystem::temp_directory_path() / ("smartdim-test-" + std::to_string(getpid()));
        file = dir / "smartdim.json";
        std::filesystem::remove_all(dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }
};

TEST_F(ConfigFileTest, MissingFileWritesDefaults) {
    const config conf(file);
    EXPECT_EQ(conf.samples, 512u);
    ASSERT_TRUE(std::filesystem::exists(file));
    EXPECT_EQ(json::parse(file_read(file)), config().to_json());
}

TEST_F(ConfigFileTest, ReadsAndRewrites) {
    std::filesystem::create_directories(dir);
    file_write(file, R"({ "samples": 64, "rolloff": 0.9 })");

    const config conf(file);
    EXPECT_EQ(conf.samples, 64u);
    EXPECT_EQ(conf.tuning.rolloff, 0.5);

    const json written = json::parse(file_read(file));
    EXPECT_EQ(written["samples"], 64);
    EXPECT_EQ(written["rolloff"], 0.5);
    EXPECT_TRUE(written.contains("kelvin_max"));
    EXPECT_FALSE(written.contains("intensity"));
}

TEST_F(ConfigFileTest, CorruptFileFallsBack) {
    std::filesystem::create_directories(dir);
    file_write(file, "{ not json");

    const config conf(file);
    EXPECT_EQ(conf.samples, 512u);
    EXPECT_EQ(json::parse(file_read(file)), config().to_json());
}

TEST_F(ConfigFileTest, InvalidValueFallsBack) {
    std::filesystem::create_directories(dir);
    file_write(file, R"({ "samples": "all", "rolloff": 0.1 })");

    const config conf(file);
    EXPECT_EQ(conf.samples, 512u);
    EXPECT_EQ(conf.tuning.rolloff, 0.08);
}
