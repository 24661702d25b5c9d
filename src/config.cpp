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

#include "fluently/config.hpp"
#include "fluently/error.hpp"
#include <boost/optional.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <sstream>

namespace pt = boost::property_tree;
using std::string;
using std::filesystem::path;

namespace fluently {

static string trim(const string &value) {
    const char *whitespace = " \t\r\n";
    size_t first = value.find_first_not_of(whitespace);
    if (first == string::npos)
        return string();
    size_t last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

static string getRequired(const pt::ptree &tree, const string &key) {
    boost::optional<string> value = tree.get_optional<string>(key);
    if (!value || trim(*value).empty())
        throw ConfigError("Missing required configuration key \"" + key + "\"");
    return trim(*value);
}

LocaliserConfig LocaliserConfig::fromPropertyTree(const pt::ptree &tree,
                                                  const path &baseDir) {
    LocaliserConfig config;
    config.root = getRequired(tree, "root");
    if (config.root.is_relative() && !baseDir.empty())
        config.root = baseDir / config.root;
    config.defaultLanguage = getRequired(tree, "default-language");

    if (boost::optional<const pt::ptree &> node = tree.get_child_optional("loader.extension")) {
        string extension = trim(node->data());
        if (extension.empty())
            throw ConfigError("loader.extension must not be empty");
        if (extension.front() != '.')
            extension.insert(extension.begin(), '.');
        config.loader.extension = extension;
    }

    if (boost::optional<const pt::ptree &> node =
            tree.get_child_optional("loader.follow-symlinks")) {
        boost::optional<bool> follow = node->get_value_optional<bool>();
        if (!follow)
            throw ConfigError("loader.follow-symlinks must be a boolean, got \"" +
                              node->data() + "\"");
        config.loader.followSymlinks = *follow;
    }

    std::istringstream resources(tree.get<string>("loader.resources", ""));
    string resource;
    while (std::getline(resources, resource, ',')) {
        resource = trim(resource);
        if (!resource.empty())
            config.loader.resources.insert(resource);
    }
    return config;
}

LocaliserConfig LocaliserConfig::fromFile(const path &file) {
    pt::ptree tree;
    try {
        if (file.extension() == ".json")
            pt::read_json(file.string(), tree);
        else
            pt::read_ini(file.string(), tree);
    } catch (const pt::file_parser_error &error) {
        throw ConfigError(error.what());
    }
    return fromPropertyTree(tree, file.parent_path());
}

} // namespace fluently
