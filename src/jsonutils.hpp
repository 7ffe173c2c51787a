// Copyright (C) 2023-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ASH_JSONUTILS_HPP
#define ASH_JSONUTILS_HPP

#include <json/json.h>

#include <string>

namespace ash
{

/**
 * Converts a JSON value to a compact serialised string, e.g. for logging.
 */
std::string StoreJson (const Json::Value& val);

/**
 * Converts a JSON value to an indented string for display to users.
 */
std::string FormatJson (const Json::Value& val);

/**
 * Parses JSON from a string with strict settings (no comments, no
 * trailing data and no duplicate keys).  Returns false and fills in the
 * parser's error message if the string is invalid.
 */
bool LoadJson (const std::string& str, Json::Value& res, std::string& errs);

} // namespace ash

#endif // ASH_JSONUTILS_HPP
