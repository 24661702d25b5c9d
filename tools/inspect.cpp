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
#include "fluently/loader.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <filesystem>
#include <iostream>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace pt = boost::property_tree;
namespace fs = std::filesystem;

int main(int argc, char **argv) {
    if (argc < 2 || argc > 3) {
        std::cerr << "usage: " << argv[0] << " <root|config-file> [default-language]"
                  << std::endl;
        return 2;
    }

    // stdout is reserved for the JSON output
    spdlog::set_default_logger(spdlog::stderr_color_mt("fluently"));
    spdlog::cfg::load_env_levels();

    try {
        fs::path target(argv[1]);
        fluently::LocaliserConfig config;
        std::error_code ec;
        if (fs::is_regular_file(target, ec)) {
            config = fluently::LocaliserConfig::fromFile(target);
        } else {
            config.root = target;
        }
        if (argc == 3)
            config.defaultLanguage = argv[2];

        fluently::ResourceLoader loader(config.loader);
        fluently::LoadResult result = loader.load(config.root);

        pt::ptree output = result.getPropertyTree();
        output.put("root", config.root.generic_string());
        if (!config.defaultLanguage.empty()) {
            fluently::LocaleId defaultLanguage =
                fluently::LocaleId::parse(config.defaultLanguage);
            output.put("default-language", defaultLanguage.toString());
            output.put("default-available",
                       result.registry.contains(defaultLanguage.toString()));
        }
        pt::write_json(std::cout, output);
    } catch (const fluently::Error &error) {
        spdlog::error("{}", error.what());
        return 1;
    }
    return 0;
}
