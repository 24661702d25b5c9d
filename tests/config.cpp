/*
 *  This file is part of fluently.
 *
 *  Copyright (C) 2026 The fluently authors
 *
 *  fluently is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  fluently is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with fluently.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "helpers.hpp"
#include <fluently/config.hpp>
#include <fluently/error.hpp>
#include <gtest/gtest.h>

using fluently::LocaliserConfig;

class TestConfig : public testing::Test {
  protected:
    TempDirectory dir;
};

TEST_F(TestConfig, ReadsJson) {
    fs::path file = dir.write("fluently.json", R"({
        "root": "locale",
        "default-language": "en-US",
        "loader": {
            "extension": "txt",
            "follow-symlinks": false,
            "resources": "main, menus"
        }
    })");

    LocaliserConfig config = LocaliserConfig::fromFile(file);

    EXPECT_EQ(config.root, dir.path() / "locale");
    EXPECT_EQ(config.defaultLanguage, "en-US");
    EXPECT_EQ(config.loader.extension, ".txt");
    EXPECT_FALSE(config.loader.followSymlinks);
    EXPECT_EQ(config.loader.resources, (std::set<std::string>{"main", "menus"}));
}

TEST_F(TestConfig, ReadsIni) {
    fs::path file = dir.write("fluently.ini", "root = /usr/share/app/locale\n"
                                              "default-language = it\n");

    LocaliserConfig config = LocaliserConfig::fromFile(file);

    EXPECT_EQ(config.root, fs::path("/usr/share/app/locale"));
    EXPECT_EQ(config.defaultLanguage, "it");
    EXPECT_EQ(config.loader.extension, ".ftl");
    EXPECT_TRUE(config.loader.followSymlinks);
    EXPECT_TRUE(config.loader.resources.empty());
}

TEST_F(TestConfig, IniLoaderSection) {
    fs::path file = dir.write("fluently.ini", "root = locale\n"
                                              "default-language = fr\n"
                                              "[loader]\n"
                                              "extension = .ftl\n"
                                              "follow-symlinks = 0\n"
                                              "resources = app\n");

    LocaliserConfig config = LocaliserConfig::fromFile(file);

    EXPECT_EQ(config.root, dir.path() / "locale");
    EXPECT_FALSE(config.loader.followSymlinks);
    EXPECT_EQ(config.loader.resources, (std::set<std::string>{"app"}));
}

TEST_F(TestConfig, MissingRequiredKeyThrows) {
    fs::path file = dir.write("fluently.json", R"({"default-language": "en"})");
    EXPECT_THROW(LocaliserConfig::fromFile(file), fluently::ConfigError);
}

TEST_F(TestConfig, MalformedValueThrows) {
    fs::path file = dir.write("fluently.json", R"({
        "root": "locale",
        "default-language": "en",
        "loader": {"follow-symlinks": "sometimes"}
    })");
    EXPECT_THROW(LocaliserConfig::fromFile(file), fluently::ConfigError);
}

TEST_F(TestConfig, MalformedIniValueThrows) {
    fs::path file = dir.write("fluently.ini", "root = locale\n"
                                              "default-language = fr\n"
                                              "[loader]\n"
                                              "follow-symlinks = maybe\n");
    try {
        LocaliserConfig::fromFile(file);
        FAIL() << "expected ConfigError";
    } catch (const fluently::ConfigError &error) {
        EXPECT_NE(std::string(error.what()).find("follow-symlinks"), std::string::npos);
    }
}

TEST_F(TestConfig, EmptyExtensionThrows) {
    fs::path file = dir.write("fluently.json", R"({
        "root": "locale",
        "default-language": "en",
        "loader": {"extension": "  "}
    })");
    EXPECT_THROW(LocaliserConfig::fromFile(file), fluently::ConfigError);
}

TEST_F(TestConfig, UnparsableFileThrows) {
    fs::path file = dir.write("fluently.json", "{ \"root\": ");
    EXPECT_THROW(LocaliserConfig::fromFile(file), fluently::ConfigError);
    EXPECT_THROW(LocaliserConfig::fromFile(dir.path() / "missing.json"),
                 fluently::ConfigError);
}
