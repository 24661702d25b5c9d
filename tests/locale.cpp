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

#include <fluently/error.hpp>
#include <fluently/locale.hpp>
#include <gtest/gtest.h>
#include <optional>
#include <string>

using fluently::LocaleId;

static std::string canonical(const std::string &input) {
    std::optional<LocaleId> locId = LocaleId::tryParse(input);
    return locId ? locId->toString() : "<invalid>";
}

TEST(TestLocale, CanonicalTagIsUnchanged) {
    EXPECT_EQ(canonical("en-US"), "en-US");
    EXPECT_EQ(canonical("it"), "it");
}

TEST(TestLocale, AcceptsUnderscoresAndAnyCase) {
    EXPECT_EQ(canonical("en_US"), "en-US");
    EXPECT_EQ(canonical("en_us"), "en-US");
    EXPECT_EQ(canonical("EN-gb"), "en-GB");
}

TEST(TestLocale, KeepsScriptSubtag) { EXPECT_EQ(canonical("zh-hant-tw"), "zh-Hant-TW"); }

TEST(TestLocale, RejectsMalformedTags) {
    EXPECT_EQ(canonical(""), "<invalid>");
    EXPECT_EQ(canonical("english!"), "<invalid>");
    EXPECT_EQ(canonical("en--US"), "<invalid>");
    EXPECT_EQ(canonical("123"), "<invalid>");
    EXPECT_EQ(canonical("not a locale"), "<invalid>");
}

TEST(TestLocale, ParseThrowsOnMalformedTag) {
    EXPECT_THROW(LocaleId::parse("not a locale"), fluently::LanguageIdentifierError);
    try {
        LocaleId::parse("en US");
        FAIL() << "expected LanguageIdentifierError";
    } catch (const fluently::LanguageIdentifierError &error) {
        EXPECT_EQ(error.getTag(), "en US");
    }
}

TEST(TestLocale, EqualityUsesCanonicalForm) {
    EXPECT_EQ(LocaleId::parse("pt_br"), LocaleId::parse("pt-BR"));
    EXPECT_NE(LocaleId::parse("pt-BR"), LocaleId::parse("pt-PT"));
}

TEST(TestLocale, ExposesIcuLocale) {
    LocaleId locId = LocaleId::parse("fr-CA");
    EXPECT_STREQ(locId.getLocale().getLanguage(), "fr");
    EXPECT_STREQ(locId.getLocale().getCountry(), "CA");
}
