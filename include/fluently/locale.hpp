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
 *  \file locale.hpp
 *  \brief Validation and canonicalisation of language identifiers
 */

#ifndef FLUENTLY_LOCALE_HPP_INCLUDED
#define FLUENTLY_LOCALE_HPP_INCLUDED

#include <optional>
#include <string>
#include <unicode/locid.h>

namespace fluently {

/**
 * \class LocaleId
 * \brief An immutable, well-formed BCP-47 language identifier
 *
 * Two LocaleIds compare equal when their canonical tags are equal,
 * so ``en_us`` and ``en-US`` denote the same locale.
 */
class LocaleId {
  private:
    icu::Locale locale;
    std::string tag;

    LocaleId(icu::Locale &&locale, std::string &&tag);

  public:
    /**
     * \brief Parses a language identifier
     *
     * Subtags may be separated by ``-`` or ``_`` and are matched case-insensitively.
     *
     * \throws LanguageIdentifierError if the input is not a well-formed tag
     */
    static LocaleId parse(const std::string &input);

    /**
     * \brief As parse, but returns an empty optional instead of throwing
     */
    static std::optional<LocaleId> tryParse(const std::string &input);

    /// The canonical BCP-47 form, e.g. ``en-US``
    const std::string &toString() const { return tag; }
    const icu::Locale &getLocale() const { return locale; }

    bool operator==(const LocaleId &other) const { return tag == other.tag; }
    bool operator!=(const LocaleId &other) const { return tag != other.tag; }
    bool operator<(const LocaleId &other) const { return tag < other.tag; }
};

} // namespace fluently

#endif // FLUENTLY_LOCALE_HPP_INCLUDED
