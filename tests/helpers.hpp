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

#ifndef FLUENTLY_TESTS_HELPERS_HPP_INCLUDED
#define FLUENTLY_TESTS_HELPERS_HPP_INCLUDED

#include <fluently/bundle.hpp>
#include <fluently/error.hpp>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

/**
 * A directory under the system temporary directory, removed with everything
 * inside it on destruction.
 */
class TempDirectory {
  private:
    fs::path root;

  public:
    TempDirectory() {
        static int counter = 0;
        root = fs::temp_directory_path() / ("fluently-test-" + std::to_string(getpid()) +
                                            "-" + std::to_string(counter++));
        fs::remove_all(root);
        fs::create_directories(root);
    }
    ~TempDirectory() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
    TempDirectory(const TempDirectory &) = delete;
    TempDirectory &operator=(const TempDirectory &) = delete;

    const fs::path &path() const { return root; }

    fs::path write(const std::string &relative, const std::string &contents) const {
        fs::path file = root / relative;
        fs::create_directories(file.parent_path());
        std::ofstream output(file, std::ios::out | std::ios::binary);
        output << contents;
        return file;
    }

    /// Creates a symbolic link at ``relative`` pointing to a file which does not exist
    fs::path danglingLink(const std::string &relative) const {
        fs::path link = root / relative;
        fs::create_directories(link.parent_path());
        fs::create_symlink(root / "does-not-exist", link);
        return link;
    }
};

/**
 * Stand-in for a Fluent implementation. Understands ``id = value`` lines,
 * ``# comments`` and ``{ $name }`` placeables.
 */
class FakeBundle : public fluently::Bundle {
  private:
    std::map<std::string, std::string> messages;

    static std::string trim(const std::string &value) {
        size_t first = value.find_first_not_of(' ');
        if (first == std::string::npos)
            return "";
        return value.substr(first, value.find_last_not_of(' ') - first + 1);
    }

  public:
    void addResource(const fluently::ResourceBundle &resource) override {
        std::istringstream input(resource.text);
        std::string line;
        int lineNumber = 0;
        std::map<std::string, std::string> parsed;
        while (std::getline(input, line)) {
            lineNumber++;
            if (trim(line).empty() || line[0] == '#')
                continue;
            size_t equals = line.find('=');
            if (equals == std::string::npos)
                throw fluently::FluentError("Expected \"=\" on line " +
                                            std::to_string(lineNumber));
            parsed[trim(line.substr(0, equals))] = trim(line.substr(equals + 1));
        }
        for (auto &[id, value] : parsed)
            messages[id] = value;
    }

    std::optional<std::string> formatMessage(const std::string &resId,
                                             const fluently::FluentArgs &args) const override {
        auto message = messages.find(resId);
        if (message == messages.end())
            return std::optional<std::string>();

        std::string result = message->second;
        for (const auto &[name, value] : args) {
            std::ostringstream formatted;
            std::visit([&formatted](const auto &arg) { formatted << arg; }, value);
            std::string placeable = "{ $" + name + " }";
            for (size_t pos = result.find(placeable); pos != std::string::npos;
                 pos = result.find(placeable, pos + formatted.str().size()))
                result.replace(pos, placeable.size(), formatted.str());
        }
        if (result.find("{ $") != std::string::npos)
            throw fluently::FluentError("Unresolved variable in " + resId);
        return result;
    }
};

inline fluently::BundleFactory fakeBundleFactory() {
    return [](const icu::Locale &) { return std::make_unique<FakeBundle>(); };
}

#endif // FLUENTLY_TESTS_HELPERS_HPP_INCLUDED
