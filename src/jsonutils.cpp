// Copyright (C) 2021-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "jsonutils.hpp"

#include <sstream>

namespace ash
{

namespace
{

std::string
WriteJson (const Json::Value& val, const std::string& indentation)
{
  Json::StreamWriterBuilder wbuilder;
  wbuilder["commentStyle"] = "None";
  wbuilder["indentation"] = indentation;
  wbuilder["enableYAMLCompatibility"] = false;
  wbuilder["dropNullPlaceholders"] = false;
  wbuilder["useSpecialFloats"] = false;

  return Json::writeString (wbuilder, val);
}

} // anonymous namespace

std::string
StoreJson (const Json::Value& val)
{
  return WriteJson (val, "");
}

std::string
FormatJson (const Json::Value& val)
{
  return WriteJson (val, "  ");
}

bool
LoadJson (const std::string& str, Json::Value& res, std::string& errs)
{
  Json::CharReaderBuilder rbuilder;
  rbuilder["allowComments"] = false;
  rbuilder["strictRoot"] = false;
  rbuilder["failIfExtra"] = true;
  rbuilder["rejectDupKeys"] = true;

  std::istringstream in(str);
  return Json::parseFromStream (rbuilder, in, &res, &errs);
}

} // namespace ash
