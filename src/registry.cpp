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

#include "fluently/registry.hpp"
#include <algorithm>

namespace pt = boost::property_tree;
using std::optional;
using std::string;
using std::filesystem::path;

namespace fluently {

void LocaleRegistry::addResource(const LocaleId &locId, ResourceBundle &&resource) {
    auto iter = this->entries.find(locId.toString());
    if (iter == this->entries.end())
        iter = this->entries.emplace(locId.toString(), LocaleEntry(locId)).first;

    std::vector<ResourceBundle> &resources = iter->second.resources;
    auto position = std::upper_bound(
        resources.begin(), resources.end(), resource.source,
        [](const path &source, const ResourceBundle &other) { return source < other.source; });
    resources.insert(position, std::move(resource));
}

void LocaleRegistry::removeResource(const string &tag, const path &source) {
    auto iter = this->entries.find(tag);
    if (iter == this->entries.end())
        return;

    std::vector<ResourceBundle> &resources = iter->second.resources;
    resources.erase(std::remove_if(resources.begin(), resources.end(),
                                   [&source](const ResourceBundle &resource) {
                                       return resource.source == source;
                                   }),
                    resources.end());
    if (resources.empty())
        this->entries.erase(iter);
}

const LocaleEntry *LocaleRegistry::find(const string &tag) const {
    optional<LocaleId> locId = LocaleId::tryParse(tag);
    if (!locId)
        return nullptr;
    auto result = this->entries.find(locId->toString());
    if (result != this->entries.end())
        return &result->second;
    return nullptr;
}

const LocaleEntry *LocaleRegistry::resolve(const string &requested,
                                           const string &fallback) const {
    const LocaleEntry *entry = this->find(requested);
    if (entry)
        return entry;
    return this->find(fallback);
}

std::vector<LocaleId> LocaleRegistry::getLocales() const {
    std::vector<LocaleId> result;
    result.reserve(this->entries.size());
    for (const auto &[tag, entry] : this->entries)
        result.push_back(entry.locale);
    return result;
}

pt::ptree LocaleRegistry::getPropertyTree() const {
    pt::ptree root, locales;
    for (const auto &[tag, entry] : this->entries) {
        pt::ptree locale, resources;
        locale.put("locale", tag);
        for (const ResourceBundle &resource : entry.resources) {
            pt::ptree node;
            node.put("source", resource.source.generic_string());
            node.put("bytes", resource.text.size());
            resources.push_back(std::make_pair("", node));
        }
        locale.add_child("resources", resources);
        locales.push_back(std::make_pair("", locale));
    }
    root.add_child("locales", locales);
    return root;
}

} // namespace fluently
