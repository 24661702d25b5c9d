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

#include "fluently/locale.hpp"
#include "fluently/error.hpp"
#include <algorithm>
#include <unicode/errorcode.h>

using std::optional;
using std::string;

namespace fluently {

LocaleId::LocaleId(icu::Locale &&locale, string &&tag)
    : locale(std::move(locale)), tag(std::move(tag)) {}

optional<LocaleId> LocaleId::tryParse(const string &input) {
    // forLanguageTag would turn an empty string into the root locale
    if (input.empty())
        return optional<LocaleId>();

    string normalised(input);
    std::replace(normalised.begin(), normalised.end(), '_', '-');

    // Fails unless the whole input is consumed by a well-formed tag
    icu::ErrorCode status;
    icu::Locale locale = icu::Locale::forLanguageTag(normalised, status);
    if (status.isFailure() || locale.isBogus())
        return optional<LocaleId>();

    string tag = locale.toLanguageTag<string>(status);
    if (status.isFailure() || tag.empty())
        return optional<LocaleId>();

    return optional(LocaleId(std::move(locale), std::move(tag)));
}

LocaleId LocaleId::parse(const string &input) {
    optional<LocaleId> result = tryParse(input);
    if (!result)
        throw LanguageIdentifierError(input);
    return std::move(*result);
}

} // namespace fluently
