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

#include "fluently/loader.hpp"
#include "fluently/error.hpp"
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <optional>
#include <set>
#include <spdlog/spdlog.h>

namespace pt = boost::property_tree;
using directory_iterator = std::filesystem::directory_iterator;
using directory_options = std::filesystem::directory_options;
using recursive_directory_iterator = std::filesystem::recursive_directory_iterator;
using std::optional;
using std::string;
using std::filesystem::path;

namespace fluently {

const char *toString(SkippedEntry::Kind kind) {
    switch (kind) {
    case SkippedEntry::Kind::InvalidLocale:
        return "invalid-locale";
    case SkippedEntry::Kind::Io:
        return "io";
    case SkippedEntry::Kind::Empty:
        return "empty";
    case SkippedEntry::Kind::Parse:
        return "parse";
    }
    return "unknown";
}

pt::ptree LoadResult::getPropertyTree() const {
    pt::ptree root = this->registry.getPropertyTree();
    pt::ptree entries;
    for (const SkippedEntry &entry : this->skipped) {
        pt::ptree node;
        node.put("path", entry.path.generic_string());
        node.put("kind", toString(entry.kind));
        node.put("message", entry.message);
        entries.push_back(std::make_pair("", node));
    }
    root.add_child("skipped", entries);
    return root;
}

static void skip(std::vector<SkippedEntry> &skipped, const path &entry,
                 SkippedEntry::Kind kind, string &&message) {
    spdlog::warn("Skipping {}: {}", entry.string(), message);
    skipped.push_back(SkippedEntry{entry, kind, std::move(message)});
}

static optional<string> readFile(const path &file, std::error_code &ec) {
    errno = 0;
    std::ifstream stream(file, std::ios::in | std::ios::binary);
    if (!stream) {
        ec = std::error_code(errno != 0 ? errno : EIO, std::generic_category());
        return optional<string>();
    }

    string contents;
    char buffer[4096];
    while (stream.read(buffer, sizeof(buffer)) || stream.gcount() > 0)
        contents.append(buffer, static_cast<size_t>(stream.gcount()));

    if (stream.bad()) {
        ec = std::make_error_code(std::errc::io_error);
        return optional<string>();
    }
    return optional(std::move(contents));
}

void ResourceLoader::addFile(LoadResult &result, const LocaleId &locId,
                             const path &file) const {
    std::error_code ec;
    optional<string> contents = readFile(file, ec);
    if (!contents) {
        skip(result.skipped, file, SkippedEntry::Kind::Io,
             "Failed to read file: " + ec.message());
    } else if (contents->empty()) {
        skip(result.skipped, file, SkippedEntry::Kind::Empty, "File is empty");
    } else {
        spdlog::debug("Loaded {} for locale {}", file.string(), locId.toString());
        result.registry.addResource(locId, ResourceBundle(file, std::move(*contents)));
    }
}

bool ResourceLoader::isResource(const path &file) const {
    if (file.extension() != this->options.extension)
        return false;
    return this->options.resources.empty() ||
           this->options.resources.find(file.stem().string()) !=
               this->options.resources.end();
}

void ResourceLoader::addDirectory(LoadResult &result, const LocaleId &locId,
                                  const path &dir) const {
    directory_options walkOptions = this->options.followSymlinks
                                        ? directory_options::follow_directory_symlink
                                        : directory_options::none;
    std::vector<path> files;
    // Canonical paths of the directories entered so far
    std::set<path> visited;
    std::error_code ec;
    path canonicalDir = std::filesystem::canonical(dir, ec);
    if (!ec)
        visited.insert(canonicalDir);

    recursive_directory_iterator iter(dir, walkOptions, ec), end;
    if (ec) {
        skip(result.skipped, dir, SkippedEntry::Kind::Io,
             "Failed to read directory: " + ec.message());
        return;
    }

    while (iter != end) {
        path current = iter->path();
        std::error_code statusError;
        bool followed = this->options.followSymlinks || !iter->is_symlink(statusError);

        if (iter->is_directory(statusError)) {
            // Subdirectories are checked before the iterator enters them, as the
            // iterator cannot be advanced past an error
            if (followed) {
                path target = std::filesystem::canonical(current, statusError);
                if (statusError) {
                    iter.disable_recursion_pending();
                    skip(result.skipped, current, SkippedEntry::Kind::Io,
                         "Failed to resolve directory: " + statusError.message());
                } else if (!visited.insert(target).second) {
                    iter.disable_recursion_pending();
                    skip(result.skipped, current, SkippedEntry::Kind::Io,
                         "Symbolic link loop or repeated directory " + target.string());
                } else {
                    directory_iterator contents(current, statusError);
                    if (statusError) {
                        iter.disable_recursion_pending();
                        skip(result.skipped, current, SkippedEntry::Kind::Io,
                             "Failed to read directory: " + statusError.message());
                    }
                }
            }
        } else if (followed && this->isResource(current)) {
            files.push_back(current);
        }

        iter.increment(ec);
        if (ec) {
            skip(result.skipped, current, SkippedEntry::Kind::Io,
                 "Failed to read directory: " + ec.message());
            break;
        }
    }

    std::sort(files.begin(), files.end());
    for (const path &file : files)
        this->addFile(result, locId, file);
}

LoadResult ResourceLoader::load(const path &root) const {
    std::error_code ec;
    std::vector<path> children;
    for (directory_iterator iter(root, ec), end; !ec && iter != end; iter.increment(ec))
        children.push_back(iter->path());
    if (ec)
        throw IoError(root, ec);

    // Directory iteration order is unspecified
    std::sort(children.begin(), children.end());

    LoadResult result;
    for (const path &child : children) {
        std::error_code statusError;
        if (!this->options.followSymlinks &&
            std::filesystem::is_symlink(std::filesystem::symlink_status(child, statusError)))
            continue;

        bool isDirectory = std::filesystem::is_directory(child, statusError);
        if (!isDirectory && child.extension() != this->options.extension)
            continue;

        string name = isDirectory ? child.filename().string() : child.stem().string();
        optional<LocaleId> locId = LocaleId::tryParse(name);
        if (!locId) {
            skip(result.skipped, child, SkippedEntry::Kind::InvalidLocale,
                 "\"" + name + "\" is not a valid language identifier");
            continue;
        }

        if (isDirectory)
            this->addDirectory(result, *locId, child);
        else
            this->addFile(result, *locId, child);
    }

    spdlog::info("Loaded {} locale(s) from {} ({} entries skipped)", result.registry.size(),
                 root.string(), result.skipped.size());
    return result;
}

} // namespace fluently
