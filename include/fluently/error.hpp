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
 *  \file error.hpp
 *  \brief Exceptions thrown by fluently
 */

#ifndef FLUENTLY_ERROR_HPP_INCLUDED
#define FLUENTLY_ERROR_HPP_INCLUDED

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace fluently {

/**
 * \class Error
 * \brief Base class of all errors raised by fluently
 */
class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * \class IoError
 * \brief A path could not be accessed
 */
class IoError : public Error {
  private:
    std::filesystem::path path;
    std::error_code code;

  public:
    IoError(const std::filesystem::path &path, std::error_code code);

    const std::filesystem::path &getPath() const { return path; }
    std::error_code getCode() const { return code; }
};

/**
 * \class LanguageIdentifierError
 * \brief A string is not a well-formed language identifier
 */
class LanguageIdentifierError : public Error {
  private:
    std::string tag;

  public:
    explicit LanguageIdentifierError(const std::string &tag);

    const std::string &getTag() const { return tag; }
};

/**
 * \class FluentError
 * \brief The Fluent implementation rejected a resource or failed to format a message
 *
 * Holds one entry per problem reported by the Fluent implementation.
 */
class FluentError : public Error {
  private:
    std::vector<std::string> errors;

  public:
    explicit FluentError(std::vector<std::string> errors);
    explicit FluentError(const std::string &error);

    const std::vector<std::string> &getErrors() const { return errors; }
};

/**
 * \class MissingMessageError
 * \brief The selected bundle has no message with the requested identifier
 */
class MissingMessageError : public Error {
  private:
    std::string key;
    std::string language;

  public:
    MissingMessageError(const std::string &key, const std::string &language);

    const std::string &getKey() const { return key; }
    const std::string &getLanguage() const { return language; }
};

/**
 * \class ConfigError
 * \brief A configuration file is malformed or incomplete
 */
class ConfigError : public Error {
  public:
    using Error::Error;
};

} // namespace fluently

#endif // FLUENTLY_ERROR_HPP_INCLUDED
