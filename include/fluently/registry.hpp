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
 *  \file registry.hpp
 *  \brief In-memory storage of raw resource text, keyed by locale
 */

#ifndef FLUENTLY_REGISTRY_HPP_INCLUDED
#define FLUENTLY_REGISTRY_HPP_INCLUDED

#include <boost/property_tree/ptree.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "locale.hpp"

namespace fluently {

/**
 * \struct ResourceBundle
 * \brief The raw UTF-8 contents of one resource file
 */
struct ResourceBundle {
    std::filesystem::path source;
    std::string text;

    ResourceBundle(std::filesystem::path source, std::string &&text)
        : source(std::move(source)), text(std::move(text)) {}

    bool operator==(const ResourceBundle &other) const {
        return source == other.source && text == other.text;
    }
    bool operator!=(const ResourceBundle &other) const { return !(*this == other); }
};

/**
 * \struct LocaleEntry
 * \brief All resource bundles read for a single locale, ordered by source path
 */
struct LocaleEntry {
    LocaleId locale;
    std::vector<ResourceBundle> resources;

    explicit LocaleEntry(const LocaleId &locale) : locale(locale) {}

    bool operator==(const LocaleEntry &other) const {
        return locale == other.locale && resources == other.resources;
    }
};

/**
 * \class LocaleRegistry
 * \brief Mapping of locales to the resource bundles available for them
 *
 * A registry is filled by ResourceLoader and is read-only afterwards, so it can be
 * shared between threads. Every locale it contains has at least one bundle with
 * non-empty text.
 */
class LocaleRegistry {
  private:
    /// Mapping of canonical locale tags to their entries.
    std::map<std::string, LocaleEntry> entries;

    void addResource(const LocaleId &locId, ResourceBundle &&resource);
    void removeResource(const std::string &tag, const std::filesystem::path &source);

  public:
    using const_iterator = std::map<std::string, LocaleEntry>::const_iterator;

    /**
     * \brief Looks up the entry of a locale
     *
     * \param tag: Any spelling accepted by LocaleId::parse
     * \returns The entry, or nullptr if the locale is absent or tag is malformed
     */
    const LocaleEntry *find(const std::string &tag) const;
    bool contains(const std::string &tag) const { return find(tag) != nullptr; }

    /**
     * \brief Selects the entry to use for a requested locale
     *
     * Returns the entry for ``requested`` if there is one, otherwise the entry for
     * ``fallback``, otherwise nullptr.
     */
    const LocaleEntry *resolve(const std::string &requested,
                               const std::string &fallback) const;

    /// The locales present, in order of their canonical tags
    std::vector<LocaleId> getLocales() const;

    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }
    const_iterator begin() const { return entries.begin(); }
    const_iterator end() const { return entries.end(); }

    bool operator==(const LocaleRegistry &other) const { return entries == other.entries; }
    bool operator!=(const LocaleRegistry &other) const { return entries != other.entries; }

    /**
     * \brief Describes the registry as a property tree
     *
     * Each locale becomes ``{"locale": tag, "resources": [{"source": path, "bytes": n}]}``
     * inside a ``locales`` array.
     */
    boost::property_tree::ptree getPropertyTree() const;

    friend class ResourceLoader;
    friend class Localiser;
};

} // namespace fluently

#endif // FLUENTLY_REGISTRY_HPP_INCLUDED
