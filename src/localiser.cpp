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

#include "fluently/localiser.hpp"
#include "fluently/error.hpp"
#include <spdlog/spdlog.h>
#include <utility>

using std::optional;
using std::string;
using std::filesystem::path;

namespace fluently {

Localiser::Localiser(path root, LocaleId defaultLanguage, BundleFactory factory,
                     ResourceLoader loader)
    : root(std::move(root)), defaultLanguage(std::move(defaultLanguage)),
      factory(std::move(factory)), loader(std::move(loader)) {}

Localiser Localiser::tryLoad(const path &root, const string &defaultLanguage,
                             BundleFactory factory, LoaderOptions options) {
    if (!factory)
        throw Error("No bundle factory given for " + root.string());

    ResourceLoader loader(std::move(options));
    LoadResult result = loader.load(root);
    LocaleId defaultLocId = LocaleId::parse(defaultLanguage);

    Localiser localiser(root, std::move(defaultLocId), std::move(factory),
                        std::move(loader));
    localiser.addBundles(std::move(result));
    if (!localiser.registry.contains(localiser.defaultLanguage.toString()))
        spdlog::warn("Default language {} has no resources in {}",
                     localiser.defaultLanguage.toString(), root.string());
    return localiser;
}

Localiser Localiser::tryLoad(const LocaliserConfig &config, BundleFactory factory) {
    return tryLoad(config.root, config.defaultLanguage, std::move(factory),
                   config.loader);
}

void Localiser::addBundles(LoadResult &&result) {
    this->registry = std::move(result.registry);
    this->skipped = std::move(result.skipped);

    std::vector<std::pair<string, path>> rejected;
    for (const auto &[tag, entry] : this->registry) {
        std::unique_ptr<Bundle> bundle = this->factory(entry.locale.getLocale());
        if (!bundle)
            throw Error("Bundle factory returned no bundle for " + tag);

        size_t accepted = 0;
        for (const ResourceBundle &resource : entry.resources) {
            try {
                bundle->addResource(resource);
                accepted++;
            } catch (const FluentError &error) {
                spdlog::warn("Skipping {}: {}", resource.source.string(), error.what());
                this->skipped.push_back(
                    SkippedEntry{resource.source, SkippedEntry::Kind::Parse, error.what()});
                rejected.emplace_back(tag, resource.source);
            }
        }
        if (accepted > 0)
            this->bundles.emplace(tag, std::move(bundle));
    }

    // Locales left without any accepted resource disappear from the registry
    for (const auto &[tag, source] : rejected)
        this->registry.removeResource(tag, source);
}

void Localiser::reload() {
    Localiser fresh = tryLoad(this->root, this->defaultLanguage.toString(), this->factory,
                              this->loader.getOptions());
    *this = std::move(fresh);
}

bool Localiser::hasLanguage(const string &language) const {
    return this->registry.contains(language);
}

optional<LocaleId> Localiser::resolveLanguage(const string &language) const {
    const LocaleEntry *entry =
        this->registry.resolve(language, this->defaultLanguage.toString());
    if (entry)
        return optional(entry->locale);
    return optional<LocaleId>();
}

const Bundle *Localiser::getBundle(const string &language) const {
    const LocaleEntry *entry = this->registry.find(language);
    if (!entry)
        return nullptr;
    auto result = this->bundles.find(entry->locale.toString());
    if (result != this->bundles.end())
        return result->second.get();
    return nullptr;
}

string Localiser::getMessage(const string &resId, const string &language,
                             const FluentArgs &args) const {
    const Bundle *bundle = this->getBundle(language);
    if (!bundle)
        bundle = this->getBundle(this->defaultLanguage.toString());
    if (!bundle)
        throw Error("Failed to get default bundle " + this->defaultLanguage.toString() +
                    " for " + this->root.string());

    optional<string> result = bundle->formatMessage(resId, args);
    if (!result)
        throw MissingMessageError(resId, language);
    return *result;
}

optional<string> Localiser::formatMessage(const std::vector<string> &locIdFallback,
                                          const string &resId,
                                          const FluentArgs &args) const {
    std::vector<string> languages(locIdFallback);
    languages.push_back(this->defaultLanguage.toString());
    for (const string &language : languages) {
        const Bundle *bundle = this->getBundle(language);
        if (bundle) {
            optional<string> result = bundle->formatMessage(resId, args);
            if (result)
                return result;
        }
    }
    return optional<string>();
}

} // namespace fluently
