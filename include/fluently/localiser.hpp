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
 *  \file localiser.hpp
 *  \brief High-level storage and formatting of messages
 */

#ifndef FLUENTLY_LOCALISER_HPP_INCLUDED
#define FLUENTLY_LOCALISER_HPP_INCLUDED

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bundle.hpp"
#include "config.hpp"
#include "loader.hpp"

namespace fluently {

/**
 * \class Localiser
 * \brief Loads a resource directory and formats its messages with a default-language
 * fallback
 *
 * The locales of the registry are handed to the Fluent implementation through the
 * BundleFactory, one Bundle per locale.
 */
class Localiser {
  private:
    std::filesystem::path root;
    LocaleId defaultLanguage;
    BundleFactory factory;
    ResourceLoader loader;
    LocaleRegistry registry;
    std::vector<SkippedEntry> skipped;
    /// Mapping of canonical locale tags to the bundle for that locale.
    std::map<std::string, std::unique_ptr<Bundle>> bundles;

    Localiser(std::filesystem::path root, LocaleId defaultLanguage, BundleFactory factory,
              ResourceLoader loader);
    void addBundles(LoadResult &&result);
    const Bundle *getBundle(const std::string &language) const;

  public:
    /**
     * \brief Creates a Localiser from the resources in ``root``
     *
     * See ResourceLoader::load for the expected layout. Resources the Fluent
     * implementation rejects are recorded in skipped() with kind Parse.
     *
     * \param root: Directory to be processed.
     * \param defaultLanguage: Language used when a requested language is not available.
     * \param factory: Creates the bundles which parse and format the resources.
     * \throws IoError if ``root`` cannot be read
     * \throws LanguageIdentifierError if ``defaultLanguage`` is malformed
     */
    static Localiser tryLoad(const std::filesystem::path &root,
                             const std::string &defaultLanguage, BundleFactory factory,
                             LoaderOptions options = LoaderOptions());

    /**
     *  \overload  static Localiser tryLoad(const std::filesystem::path &root, const
     * std::string &defaultLanguage, BundleFactory factory, LoaderOptions options)
     */
    static Localiser tryLoad(const LocaliserConfig &config, BundleFactory factory);

    /**
     * \brief Reads the resource directory again
     *
     * If loading fails the exception is propagated and the current state is kept.
     */
    void reload();

    const std::filesystem::path &getRoot() const { return root; }
    const LocaleId &getDefaultLanguage() const { return defaultLanguage; }
    const LocaleRegistry &getRegistry() const { return registry; }
    const std::vector<SkippedEntry> &getSkipped() const { return skipped; }

    std::vector<LocaleId> availableLanguages() const { return registry.getLocales(); }
    bool hasLanguage(const std::string &language) const;

    /**
     * \brief The language that getMessage will use for ``language``
     *
     * \returns ``language`` in canonical form if available, otherwise the default
     * language if available, otherwise an empty optional.
     */
    std::optional<LocaleId> resolveLanguage(const std::string &language) const;

    /**
     * \brief Formats a message in the given language, or in the default language if
     * the given one is not available
     *
     * \throws Error if neither ``language`` nor the default language is available
     * \throws MissingMessageError if the selected bundle does not contain ``resId``
     * \throws FluentError if the Fluent implementation fails to format the message
     */
    std::string getMessage(const std::string &resId, const std::string &language,
                           const FluentArgs &args = FluentArgs()) const;

    /**
     * \brief Formats a message using the first language which provides it
     *
     * \param locIdFallback: Languages in order of preference. The default language
     * is tried after all of them.
     * \returns The formatted message, or an empty optional if no language has it
     * \throws FluentError if the Fluent implementation fails to format the message.
     * Languages later in the chain are not tried.
     */
    std::optional<std::string> formatMessage(const std::vector<std::string> &locIdFallback,
                                             const std::string &resId,
                                             const FluentArgs &args = FluentArgs()) const;
};

} // namespace fluently

#endif // FLUENTLY_LOCALISER_HPP_INCLUDED
