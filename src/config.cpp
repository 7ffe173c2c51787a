// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include "errors.hpp"
#include "jsonutils.hpp"

#include <glog/logging.h>

#include <fstream>
#include <set>
#include <sstream>

namespace ash
{

namespace
{

[[noreturn]] void
Invalid (const std::string& msg)
{
  throw Error (ErrorKind::ConfigInvalid, "invalid configuration: " + msg);
}

/**
 * Returns the string member of an object, failing if it is missing or
 * not a string.
 */
std::string
GetString (const Json::Value& obj, const std::string& key)
{
  const auto& val = obj[key];
  if (!val.isString ())
    Invalid ("expected string field '" + key + "'");
  return val.asString ();
}

/**
 * Returns the array member of an object.  A missing member is treated
 * as empty array if optional.
 */
const Json::Value&
GetArray (const Json::Value& obj, const std::string& key, const bool optional)
{
  static const Json::Value empty(Json::arrayValue);

  const auto& val = obj[key];
  if (val.isNull () && optional)
    return empty;
  if (!val.isArray ())
    Invalid ("expected array field '" + key + "'");
  return val;
}

Id
ParseId (const std::string& str)
{
  Id res;
  if (!Id::TryFromCb58 (str, res))
    Invalid ("'" + str + "' is not a valid ID");
  return res;
}

Blockchain
ParseBlockchain (const Json::Value& val, const Id& subnetId)
{
  if (!val.isObject ())
    Invalid ("blockchain entry is not an object");

  Blockchain res;
  res.id = ParseId (GetString (val, "id"));
  res.name = GetString (val, "name");
  res.subnetId = subnetId;
  res.vmId = ParseId (GetString (val, "vmID"));
  if (val.isMember ("vmType"))
    res.vmType = GetString (val, "vmType");
  if (val.isMember ("rpcUrl"))
    res.rpcUrl = GetString (val, "rpcUrl");

  return res;
}

Subnet
ParseSubnet (const Json::Value& val)
{
  if (!val.isObject ())
    Invalid ("Subnet entry is not an object");

  Subnet res;
  res.id = ParseId (GetString (val, "id"));

  for (const auto& k : GetArray (val, "controlKeys", true))
    {
      if (!k.isString ())
        Invalid ("control key is not a string");
      res.controlKeys.push_back (k.asString ());
    }

  if (val.isMember ("threshold"))
    {
      const auto& t = val["threshold"];
      if (!t.isUInt ())
        Invalid ("Subnet threshold is not an unsigned integer");
      res.threshold = t.asUInt ();
    }

  if (val.isMember ("subnetType"))
    {
      const std::string type = GetString (val, "subnetType");
      if (!SubnetTypeFromString (type, res.type))
        Invalid ("unknown Subnet type '" + type + "'");
    }
  else
    res.type = ClassifySubnet (res.id, res.threshold);

  /* Refreshes match blockchains by name, so names must be unique
     within the Subnet.  */
  std::set<Id> chainIds;
  std::set<std::string> chainNames;
  for (const auto& c : GetArray (val, "blockchains", true))
    {
      Blockchain chain = ParseBlockchain (c, res.id);
      if (!chainIds.insert (chain.id).second)
        Invalid ("duplicate blockchain " + chain.id.ToCb58 ()
                    + " in Subnet " + res.id.ToCb58 ());
      if (!chainNames.insert (chain.name).second)
        Invalid ("duplicate blockchain name '" + chain.name
                    + "' in Subnet " + res.id.ToCb58 ());
      res.blockchains.push_back (std::move (chain));
    }

  return res;
}

} // anonymous namespace

Config
Config::FromJson (const Json::Value& val)
{
  if (!val.isObject ())
    Invalid ("top-level value is not an object");

  Config res;
  std::set<std::string> names;
  for (const auto& n : GetArray (val, "avalancheNetworks", false))
    {
      if (!n.isObject ())
        Invalid ("network entry is not an object");

      Network network(GetString (n, "name"));
      if (!names.insert (network.GetName ()).second)
        Invalid ("duplicate network " + network.GetName ());

      std::set<Id> subnetIds;
      for (const auto& s : GetArray (n, "subnets", false))
        {
          const Subnet subnet = ParseSubnet (s);
          if (!subnetIds.insert (subnet.id).second)
            Invalid ("duplicate Subnet " + subnet.id.ToCb58 ()
                        + " in network " + network.GetName ());
          network.AddSubnet (subnet);
        }

      res.networks.push_back (std::move (network));
    }

  return res;
}

Config
Config::Load (const std::string& json)
{
  Json::Value val;
  std::string errs;
  if (!LoadJson (json, val, errs))
    Invalid ("failed to parse JSON: " + errs);

  return FromJson (val);
}

Config
Config::LoadFile (const std::string& path)
{
  std::ifstream in(path);
  if (!in)
    throw Error::Lookup (ErrorKind::ConfigNotFound, "file", path,
                         "filesystem");

  std::ostringstream data;
  data << in.rdbuf ();

  LOG (INFO) << "Loading configuration from " << path;
  return Load (data.str ());
}

Config
Config::Default ()
{
  return Load (DEFAULT_CONFIG);
}

bool
Config::GetNetwork (const std::string& name, Network& res) const
{
  for (const auto& n : networks)
    if (n.GetName () == name)
      {
        res = n;
        return true;
      }

  return false;
}

std::vector<std::string>
Config::GetNetworkNames () const
{
  std::vector<std::string> res;
  for (const auto& n : networks)
    res.push_back (n.GetName ());

  return res;
}

} // namespace ash
