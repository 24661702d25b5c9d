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

/**
 *  \file config.hpp
 *  \brief Loading of Localiser settings from a configuration file
 */

#ifndef FLUENTLY_CONFIG_HPP_INCLUDED
#define FLUENTLY_CONFIG_HPP_INCLUDED

#include <boost/property_tree/ptree.hpp>
#include <filesystem>
#include <string>

#include "loader.hpp"

namespace fluently {

/**
 * \struct LocaliserConfig
 * \brief Where resources live and how they are loaded
 */
struct LocaliserConfig {
    std::filesystem::path root;
    std::string defaultLanguage;
    LoaderOptions loader;

    /**
     * \brief Reads settings from a property tree
     *
     * Recognised keys:
     *  - ``root`` (required)
     *  - ``default-language`` (required)
     *  - ``loader.extension``
     *  - ``loader.follow-symlinks``
     *  - ``loader.resources``: comma separated list of resource names
     *
     * A relative ``root`` is resolved against ``baseDir``.
     *
     * \throws ConfigError if a required key is missing or a value is malformed
     */
    static LocaliserConfig fromPropertyTree(const boost::property_tree::ptree &tree,
                                            const std::filesystem::path &baseDir = {});

    /**
     * \brief Reads settings from a JSON (``.json``) or INI (any other extension) file
     *
     * Relative roots are resolved against the directory containing the file.
     *
     * \throws ConfigError if the file cannot be read or parsed
     */
    static LocaliserConfig fromFile(const std::filesystem::path &file);
};

} // namespace fluently

#endif // FLUENTLY_CONFIG_HPP_INCLUDED
