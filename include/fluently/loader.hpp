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
 *  \file loader.hpp
 *  \brief Reading of Fluent resource files from disk
 */

#ifndef FLUENTLY_LOADER_HPP_INCLUDED
#define FLUENTLY_LOADER_HPP_INCLUDED

#include <boost/property_tree/ptree.hpp>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "registry.hpp"

namespace fluently {

/**
 * \struct LoaderOptions
 * \brief Naming convention used when walking a resource directory
 */
struct LoaderOptions {
    /// Extension of resource files, including the leading dot.
    std::string extension = ".ftl";
    /// Whether symbolic links to files and directories are followed.
    bool followSymlinks = true;
    /// If not empty, only resource files with these stems are loaded from
    /// locale directories.
    std::set<std::string> resources;
};

/**
 * \struct SkippedEntry
 * \brief A path that was not added to the registry, and why
 */
struct SkippedEntry {
    enum class Kind {
        /// The name of the entry is not a language identifier
        InvalidLocale,
        /// The file or directory could not be read
        Io,
        /// The file has no content
        Empty,
        /// The Fluent implementation rejected the contents
        Parse,
    };

    std::filesystem::path path;
    Kind kind;
    std::string message;
};

const char *toString(SkippedEntry::Kind kind);

/**
 * \struct LoadResult
 * \brief The registry produced by a load, along with everything that was skipped
 */
struct LoadResult {
    LocaleRegistry registry;
    std::vector<SkippedEntry> skipped;

    /**
     * \brief As LocaleRegistry::getPropertyTree, with an additional ``skipped`` array
     * of ``{"path", "kind", "message"}`` objects
     */
    boost::property_tree::ptree getPropertyTree() const;
};

/**
 * \class ResourceLoader
 * \brief Builds a LocaleRegistry from a directory of resource files
 */
class ResourceLoader {
  private:
    LoaderOptions options;

    bool isResource(const std::filesystem::path &file) const;
    void addFile(LoadResult &result, const LocaleId &locId,
                 const std::filesystem::path &file) const;
    void addDirectory(LoadResult &result, const LocaleId &locId,
                      const std::filesystem::path &dir) const;

  public:
    ResourceLoader() = default;
    explicit ResourceLoader(LoaderOptions options) : options(std::move(options)) {}

    const LoaderOptions &getOptions() const { return options; }

    /**
     * \brief Loads the resource files contained in the given directory.
     *
     * Each direct child of ``root`` whose name is a language identifier is loaded:
     * a resource file is a bundle of the locale named by its stem, and a directory
     * contributes every resource file below it to the locale it is named after.
     *
     * E.g.
     *  - ${root}/en-GB.ftl
     *  - ${root}/en-US/main.ftl
     *  - ${root}/en-US/menus/file.ftl
     *
     * Entries which cannot be used are recorded in LoadResult::skipped and logged
     * as warnings; they never abort the load.
     *
     * \param root: Directory to be processed.
     * \throws IoError if ``root`` does not exist, is not a directory or cannot be read.
     */
    LoadResult load(const std::filesystem::path &root) const;
};

} // namespace fluently

#endif // FLUENTLY_LOADER_HPP_INCLUDED
