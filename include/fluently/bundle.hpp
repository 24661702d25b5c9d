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
 *  \file bundle.hpp
 *  \brief Interface to the Fluent implementation which parses and formats messages
 */

#ifndef FLUENTLY_BUNDLE_HPP_INCLUDED
#define FLUENTLY_BUNDLE_HPP_INCLUDED

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unicode/locid.h>
#include <variant>

#include "registry.hpp"

namespace fluently {

/**
 *  \typedef FluentValue
 *  \brief data which may be passed as an argument when formatting messages.
 */
typedef std::variant<std::string, long, double> FluentValue;

/**
 *  \typedef FluentArgs
 *  \brief Mapping of argument names to their values
 */
typedef std::map<std::string, FluentValue> FluentArgs;

/**
 *  \class Bundle
 *  \brief The messages of a specific locale, as understood by a Fluent implementation
 *
 *  fluently only reads resources from disk. Parsing and formatting are done by
 *  the implementation behind this interface.
 */
class Bundle {
  public:
    virtual ~Bundle() = default;

    /**
     * \brief Parses a resource and adds its messages and terms to the bundle
     * \throws FluentError if the resource contains errors
     */
    virtual void addResource(const ResourceBundle &resource) = 0;

    /**
     * \brief Formats a message
     *
     * \param resId: The identifier for the message. This can include attributes
     *               in the form "messageId.attributeId"
     * \param args: A map of message argument names to their values.
     * \returns The formatted message, or an empty optional if the bundle has no
     *          such message
     * \throws FluentError if the message exists but cannot be formatted
     */
    virtual std::optional<std::string> formatMessage(const std::string &resId,
                                                     const FluentArgs &args) const = 0;
};

/**
 *  \typedef BundleFactory
 *  \brief Creates an empty Bundle for the given locale
 */
typedef std::function<std::unique_ptr<Bundle>(const icu::Locale &)> BundleFactory;

} // namespace fluently

#endif // FLUENTLY_BUNDLE_HPP_INCLUDED
