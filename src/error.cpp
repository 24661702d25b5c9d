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

#include "fluently/error.hpp"

using std::string;

namespace fluently {

static string joinErrors(const std::vector<string> &errors) {
    string result;
    for (const string &error : errors) {
        if (!result.empty())
            result += "; ";
        result += error;
    }
    return result;
}

IoError::IoError(const std::filesystem::path &path, std::error_code code)
    : Error("Failed to access " + path.string() + ": " + code.message()), path(path),
      code(code) {}

LanguageIdentifierError::LanguageIdentifierError(const string &tag)
    : Error("Invalid language identifier: \"" + tag + "\""), tag(tag) {}

FluentError::FluentError(std::vector<string> errors)
    : Error("Fluent error: " + joinErrors(errors)), errors(std::move(errors)) {}

FluentError::FluentError(const string &error)
    : FluentError(std::vector<string>{error}) {}

MissingMessageError::MissingMessageError(const string &key, const string &language)
    : Error("No such message " + key + " for language " + language + "!"), key(key),
      language(language) {}

} // namespace fluently
