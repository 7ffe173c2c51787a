// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "network.hpp"

#include "config.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include "registry.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <map>
#include <set>

namespace ash
{

namespace
{

/** Names of the well-known Primary Network chains.  */
constexpr const char* P_CHAIN_NAME = "P-Chain";
constexpr const char* C_CHAIN_NAME = "C-Chain";
constexpr const char* X_CHAIN_NAME = "X-Chain";

Json::Value
OwnersToJson (const OutputOwners& owners)
{
  Json::Value res(Json::objectValue);
  res["locktime"] = static_cast<Json::Int64> (owners.locktime);
  res["threshold"] = static_cast<Json::Int64> (owners.threshold);

  Json::Value addr(Json::arrayValue);
  for (const auto& a : owners.addresses)
    addr.append (a);
  res["addresses"] = addr;

  return res;
}

} // anonymous namespace

std::string
SubnetTypeToString (const SubnetType t)
{
  switch (t)
    {
    case SubnetType::PrimaryNetwork:
      return "PrimaryNetwork";
    case SubnetType::Permissioned:
      return "Permissioned";
    case SubnetType::Elastic:
      return "Elastic";
    }

  LOG (FATAL) << "Unexpected Subnet type: " << static_cast<int> (t);
}

std::ostream&
operator<< (std::ostream& out, const SubnetType t)
{
  out << SubnetTypeToString (t);
  return out;
}

bool
SubnetTypeFromString (const std::string& str, SubnetType& res)
{
  for (const auto t : {SubnetType::PrimaryNetwork, SubnetType::Permissioned,
                       SubnetType::Elastic})
    if (SubnetTypeToString (t) == str)
      {
        res = t;
        return true;
      }

  return false;
}

SubnetType
ClassifySubnet (const Id& id, const uint32_t threshold)
{
  if (threshold > 0)
    return SubnetType::Permissioned;
  if (id == PRIMARY_NETWORK_ID)
    return SubnetType::PrimaryNetwork;
  return SubnetType::Elastic;
}

/* ************************************************************************** */

Json::Value
Blockchain::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["id"] = id.ToCb58 ();
  res["name"] = name;
  res["subnetID"] = subnetId.ToCb58 ();
  res["vmID"] = vmId.ToCb58 ();
  res["vmType"] = vmType;
  res["rpcUrl"] = rpcUrl;

  return res;
}

Json::Value
Validator::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["nodeID"] = nodeId.ToString ();
  res["txID"] = txId.ToCb58 ();
  res["startTime"] = static_cast<Json::Int64> (startTime);
  res["endTime"] = static_cast<Json::Int64> (endTime);
  res["weight"] = static_cast<Json::Int64> (weight);
  res["stakeAmount"] = static_cast<Json::Int64> (stakeAmount);
  res["potentialReward"] = static_cast<Json::Int64> (potentialReward);
  res["delegationFee"] = delegationFee;
  res["connected"] = connected;
  res["uptime"] = uptime;

  if (hasValidationRewardOwner)
    res["validationRewardOwner"] = OwnersToJson (validationRewardOwner);
  if (hasDelegationRewardOwner)
    res["delegationRewardOwner"] = OwnersToJson (delegationRewardOwner);

  res["delegatorCount"] = static_cast<Json::Int64> (delegatorCount);
  res["delegatorWeight"] = static_cast<Json::Int64> (delegatorWeight);

  Json::Value dels(Json::arrayValue);
  for (const auto& d : delegators)
    {
      Json::Value cur(Json::objectValue);
      cur["txID"] = d.txId.ToCb58 ();
      cur["nodeID"] = d.nodeId.ToString ();
      cur["startTime"] = static_cast<Json::Int64> (d.startTime);
      cur["endTime"] = static_cast<Json::Int64> (d.endTime);
      cur["stakeAmount"] = static_cast<Json::Int64> (d.stakeAmount);
      cur["potentialReward"] = static_cast<Json::Int64> (d.potentialReward);
      if (d.hasRewardOwner)
        cur["rewardOwner"] = OwnersToJson (d.rewardOwner);
      dels.append (cur);
    }
  res["delegators"] = dels;

  if (hasSigner)
    {
      Json::Value s(Json::objectValue);
      s["publicKey"] = EncodeHex (signer.publicKey);
      s["proofOfPossession"] = EncodeHex (signer.proofOfPossession);
      res["signer"] = s;
    }

  return res;
}

/* ************************************************************************** */

const Blockchain&
Subnet::GetBlockchain (const Id& chainId) const
{
  for (const auto& c : blockchains)
    if (c.id == chainId)
      return c;

  throw Error::Lookup (ErrorKind::NotFound, "blockchain", chainId.ToCb58 (),
                       "Subnet " + id.ToCb58 ());
}

const Blockchain&
Subnet::GetBlockchainByName (const std::string& name) const
{
  for (const auto& c : blockchains)
    if (c.name == name)
      return c;

  throw Error::Lookup (ErrorKind::NotFound, "blockchain", name,
                       "Subnet " + id.ToCb58 ());
}

const Validator&
Subnet::GetValidator (const NodeId& nodeId) const
{
  for (const auto& v : validators)
    if (v.nodeId == nodeId)
      return v;

  throw Error::Lookup (ErrorKind::NotFound, "validator", nodeId.ToString (),
                       "Subnet " + id.ToCb58 ());
}

void
Subnet::CheckValidatorKind (const bool elastic) const
{
  bool ok;
  switch (type)
    {
    case SubnetType::PrimaryNetwork:
    case SubnetType::Elastic:
      ok = elastic;
      break;
    case SubnetType::Permissioned:
      ok = !elastic;
      break;
    default:
      LOG (FATAL) << "Unexpected Subnet type: " << static_cast<int> (type);
    }

  if (!ok)
    throw Error (ErrorKind::OperationNotAllowed,
                 std::string ("cannot add ")
                    + (elastic ? "a staked" : "a permissioned")
                    + " validator to " + SubnetTypeToString (type)
                    + " Subnet " + id.ToCb58 ());
}

Json::Value
Subnet::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["id"] = id.ToCb58 ();
  res["subnetType"] = SubnetTypeToString (type);

  Json::Value keys(Json::arrayValue);
  for (const auto& k : controlKeys)
    keys.append (k);
  res["controlKeys"] = keys;
  res["threshold"] = static_cast<Json::Int64> (threshold);

  Json::Value chains(Json::arrayValue);
  for (const auto& c : blockchains)
    chains.append (c.ToJson ());
  res["blockchains"] = chains;

  Json::Value vals(Json::arrayValue);
  for (const auto& v : validators)
    vals.append (v.ToJson ());
  res["validators"] = vals;

  Json::Value pending(Json::arrayValue);
  for (const auto& v : pendingValidators)
    pending.append (v.ToJson ());
  res["pendingValidators"] = pending;

  return res;
}

/* ************************************************************************** */

void
MergeSubnets (std::vector<Subnet>& local, const std::vector<Subnet>& remote)
{
  for (const auto& r : remote)
    {
      auto mit = std::find_if (local.begin (), local.end (),
                               [&r] (const Subnet& s) { return s.id == r.id; });
      if (mit == local.end ())
        {
          VLOG (1) << "Adding new Subnet " << r.id;
          local.push_back (r);
          continue;
        }

      mit->controlKeys = r.controlKeys;
      mit->threshold = r.threshold;
      mit->type = ClassifySubnet (r.id, r.threshold);
    }
}

void
MergeBlockchains (std::vector<Subnet>& local,
                  const std::vector<Blockchain>& remote)
{
  std::map<Id, std::vector<const Blockchain*>> bySubnet;
  for (const auto& c : remote)
    bySubnet[c.subnetId].push_back (&c);

  for (auto& subnet : local)
    {
      const auto mit = bySubnet.find (subnet.id);
      if (mit == bySubnet.end ())
        continue;

      /* Remote records are matched against the chains known before this
         merge only.  New chains are appended at the end.  */
      const auto localEnd = subnet.blockchains.end ();
      std::vector<Blockchain> added;
      for (const Blockchain* r : mit->second)
        {
          /* Among local chains of the same name, one with the same ID
             is preferred.  */
          auto cit = std::find_if (subnet.blockchains.begin (), localEnd,
                                   [r] (const Blockchain& c)
                                     {
                                       return c.name == r->name
                                                && c.id == r->id;
                                     });
          if (cit == localEnd)
            cit = std::find_if (subnet.blockchains.begin (), localEnd,
                                [r] (const Blockchain& c)
                                  {
                                    return c.name == r->name;
                                  });

          if (cit != localEnd)
            {
              cit->id = r->id;
              cit->vmId = r->vmId;
              cit->subnetId = r->subnetId;
              continue;
            }

          const auto sameId = [r] (const Blockchain& c)
            {
              return c.id == r->id;
            };
          if (std::any_of (subnet.blockchains.begin (), localEnd, sameId))
            {
              LOG (WARNING)
                  << "Remote blockchain " << r->id << " (" << r->name << ")"
                  << " is known locally under another name, keeping"
                  << " the local record";
              continue;
            }
          if (std::any_of (added.begin (), added.end (), sameId))
            {
              LOG (WARNING)
                  << "Ignoring repeated remote blockchain " << r->id;
              continue;
            }

          VLOG (1) << "Adding new blockchain " << r->id << " to " << subnet.id;
          added.push_back (*r);
        }

      subnet.blockchains.insert (subnet.blockchains.end (),
                                 added.begin (), added.end ());
    }
}

void
ReplaceValidators (std::vector<Validator>& local,
                   std::vector<Validator> remote)
{
  std::set<NodeId> seen;
  std::vector<Validator> unique;
  unique.reserve (remote.size ());
  for (auto& v : remote)
    {
      if (!seen.insert (v.nodeId).second)
        {
          LOG (WARNING) << "Dropping duplicate validator entry " << v.nodeId;
          continue;
        }
      unique.push_back (std::move (v));
    }

  local.swap (unique);
}

/* ************************************************************************** */

Network
Network::Load (const Config& cfg, const std::string& name)
{
  Network res;
  if (!cfg.GetNetwork (name, res))
    throw Error::Lookup (ErrorKind::ConfigNotFound, "network", name,
                         "configuration");

  /* These throw NotFound if the entries are missing.  */
  res.GetPrimarySubnet ();
  res.GetPChain ();

  LOG (INFO)
      << "Loaded network " << name << " with "
      << res.subnets.size () << " Subnets";

  return res;
}

Subnet*
Network::FindSubnet (const Id& subnetId)
{
  for (auto& s : subnets)
    if (s.id == subnetId)
      return &s;

  return nullptr;
}

void
Network::AddSubnet (const Subnet& subnet)
{
  CHECK (FindSubnet (subnet.id) == nullptr)
      << "Subnet " << subnet.id << " is already known";
  subnets.push_back (subnet);
}

const Subnet&
Network::GetSubnet (const Id& subnetId) const
{
  for (const auto& s : subnets)
    if (s.id == subnetId)
      return s;

  throw Error::Lookup (ErrorKind::NotFound, "Subnet", subnetId.ToCb58 (),
                       "network " + name);
}

const Subnet&
Network::GetPrimarySubnet () const
{
  return GetSubnet (PRIMARY_NETWORK_ID);
}

const Blockchain&
Network::GetPChain () const
{
  return GetPrimarySubnet ().GetBlockchainByName (P_CHAIN_NAME);
}

const Blockchain&
Network::GetCChain () const
{
  return GetPrimarySubnet ().GetBlockchainByName (C_CHAIN_NAME);
}

const Blockchain&
Network::GetXChain () const
{
  return GetPrimarySubnet ().GetBlockchainByName (X_CHAIN_NAME);
}

const Blockchain&
Network::GetBlockchain (const Id& chainId) const
{
  for (const auto& s : subnets)
    for (const auto& c : s.blockchains)
      if (c.id == chainId)
        return c;

  throw Error::Lookup (ErrorKind::NotFound, "blockchain", chainId.ToCb58 (),
                       "network " + name);
}

const Blockchain&
Network::GetBlockchainByName (const std::string& chainName) const
{
  for (const auto& s : subnets)
    for (const auto& c : s.blockchains)
      if (c.name == chainName)
        return c;

  throw Error::Lookup (ErrorKind::NotFound, "blockchain", chainName,
                       "network " + name);
}

void
Network::RefreshSubnets (RegistryClient& registry)
{
  const auto remote = registry.ListSubnets (*this);

  auto updated = subnets;
  MergeSubnets (updated, remote);
  subnets.swap (updated);

  LOG (INFO)
      << "Refreshed Subnets of " << name << " from " << remote.size ()
      << " remote records, now " << subnets.size () << " known";
}

void
Network::RefreshBlockchains (RegistryClient& registry)
{
  const auto remote = registry.ListBlockchains (*this);

  auto updated = subnets;
  MergeBlockchains (updated, remote);
  subnets.swap (updated);

  LOG (INFO)
      << "Refreshed blockchains of " << name << " from " << remote.size ()
      << " remote records";
}

void
Network::RefreshValidators (RegistryClient& registry, const Id& subnetId)
{
  Subnet* subnet = FindSubnet (subnetId);
  if (subnet == nullptr)
    throw Error::Lookup (ErrorKind::SubnetNotFound, "Subnet",
                         subnetId.ToCb58 (), "network " + name);

  ReplaceValidators (subnet->validators,
                     registry.ListValidators (*this, subnetId));

  LOG (INFO)
      << "Subnet " << subnetId << " has now "
      << subnet->validators.size () << " validators";
}

void
Network::RefreshPendingValidators (RegistryClient& registry,
                                   const Id& subnetId)
{
  Subnet* subnet = FindSubnet (subnetId);
  if (subnet == nullptr)
    throw Error::Lookup (ErrorKind::SubnetNotFound, "Subnet",
                         subnetId.ToCb58 (), "network " + name);

  ReplaceValidators (subnet->pendingValidators,
                     registry.ListPendingValidators (*this, subnetId));

  LOG (INFO)
      << "Subnet " << subnetId << " has now "
      << subnet->pendingValidators.size () << " pending validators";
}

void
Network::CheckOperationAllowed (const std::string& operation,
                                const std::vector<std::string>& blacklist) const
{
  if (std::find (blacklist.begin (), blacklist.end (), name)
        != blacklist.end ())
    throw Error (ErrorKind::OperationNotAllowed,
                 "operation '" + operation + "' is not allowed on network "
                    + name);
}

Json::Value
Network::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["name"] = name;

  Json::Value arr(Json::arrayValue);
  for (const auto& s : subnets)
    arr.append (s.ToJson ());
  res["subnets"] = arr;

  return res;
}

} // namespace ash
