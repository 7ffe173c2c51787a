// Copyright (C) 2021-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "testutils.hpp"

#include "encoding.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <set>
#include <sstream>
#include <thread>

namespace ash
{

Json::Value
ParseJson (const std::string& str)
{
  std::istringstream in(str);
  Json::Value res;
  in >> res;
  return res;
}

std::string
HexToBin (const std::string& hex)
{
  std::string res;
  CHECK (DecodeHex (hex, res)) << "Invalid hex: " << hex;
  return res;
}

Id
TestId (const unsigned n)
{
  std::ostringstream seed;
  seed << "test id " << n;
  return Id::FromBinary (Sha256 (seed.str ()));
}

NodeId
TestNodeId (const unsigned n)
{
  std::ostringstream seed;
  seed << "test node " << n;
  return NodeId (ShortId::FromBinary (Sha256 (seed.str ()).substr (0, 20)));
}

std::string
TestSignature (const NodeId& nodeId)
{
  const std::string hash = Sha256 (nodeId.GetShortId ().GetBinary ());
  return hash + hash + hash;
}

/* ************************************************************************** */

void
TestRegistry::RecordCall (const std::string& method)
{
  ++calls[method];

  const auto mit = failures.find (method);
  if (mit != failures.end ())
    throw Error (mit->second, "scripted failure of " + method);
}

void
TestRegistry::SetSubnets (const std::vector<Subnet>& s)
{
  std::lock_guard<std::mutex> lock(mut);
  subnets = s;
}

void
TestRegistry::SetBlockchains (const std::vector<Blockchain>& c)
{
  std::lock_guard<std::mutex> lock(mut);
  blockchains = c;
}

void
TestRegistry::SetValidators (const Id& subnetId,
                             const std::vector<Validator>& v)
{
  std::lock_guard<std::mutex> lock(mut);
  validators[subnetId] = v;
}

void
TestRegistry::SetPendingValidators (const Id& subnetId,
                                    const std::vector<Validator>& v)
{
  std::lock_guard<std::mutex> lock(mut);
  pendingValidators[subnetId] = v;
}

void
TestRegistry::SetNodeInfo (const std::string& infoEndpoint,
                           const NodeInfo& info)
{
  std::lock_guard<std::mutex> lock(mut);
  nodeInfos[infoEndpoint] = info;
}

void
TestRegistry::SetPeers (const std::string& infoEndpoint,
                        const std::vector<Peer>& p)
{
  std::lock_guard<std::mutex> lock(mut);
  peers[infoEndpoint] = p;
}

void
TestRegistry::SetWarpLogs (const std::string& rpcEndpoint,
                           const std::vector<WarpLog>& logs)
{
  std::lock_guard<std::mutex> lock(mut);
  warpLogs[rpcEndpoint] = logs;
}

void
TestRegistry::SetSignature (const std::string& rpcEndpoint,
                            const std::string& sig)
{
  std::lock_guard<std::mutex> lock(mut);
  signatures[rpcEndpoint] = sig;
}

void
TestRegistry::SetFailure (const std::string& method, const ErrorKind kind)
{
  std::lock_guard<std::mutex> lock(mut);
  failures[method] = kind;
}

void
TestRegistry::SetSignatureDelay (const std::chrono::milliseconds d)
{
  std::lock_guard<std::mutex> lock(mut);
  signatureDelay = d;
}

unsigned
TestRegistry::GetCalls (const std::string& method) const
{
  std::lock_guard<std::mutex> lock(mut);
  const auto mit = calls.find (method);
  if (mit == calls.end ())
    return 0;
  return mit->second;
}

std::vector<std::string>
TestRegistry::GetSignatureRequests () const
{
  std::lock_guard<std::mutex> lock(mut);
  return signatureRequests;
}

unsigned
TestRegistry::GetMaxParallelSignatureRequests () const
{
  std::lock_guard<std::mutex> lock(mut);
  return maxParallelSignatureRequests;
}

std::vector<Subnet>
TestRegistry::ListSubnets (const Network& network)
{
  std::lock_guard<std::mutex> lock(mut);
  RecordCall ("ListSubnets");
  return subnets;
}

std::vector<Blockchain>
TestRegistry::ListBlockchains (const Network& network)
{
  std::lock_guard<std::mutex> lock(mut);
  RecordCall ("ListBlockchains");
  return blockchains;
}

std::vector<Validator>
TestRegistry::ListValidators (const Network& network, const Id& subnetId)
{
  std::lock_guard<std::mutex> lock(mut);
  RecordCall ("ListValidators");
  return validators[subnetId];
}

std::vector<Validator>
TestRegistry::ListPendingValidators (const Network& network,
                                     const Id& subnetId)
{
  std::lock_guard<std::mutex> lock(mut);
  RecordCall ("ListPendingValidators");
  return pendingValidators[subnetId];
}

NodeInfo
TestRegistry::GetNodeInfo (const std::string& infoEndpoint)
{
  std::lock_guard<std::mutex> lock(mut);
  RecordCall ("GetNodeInfo");

  const auto mit = nodeInfos.find (infoEndpoint);
  if (mit == nodeInfos.end ())
    throw Error (ErrorKind::RemoteUnavailable,
                 "no node at " + infoEndpoint);

  return mit->second;
}

std::vector<Peer>
TestRegistry::ListPeers (const std::string& infoEndpoint,
                         const std::vector<NodeId>& filter)
{
  std::lock_guard<std::mutex> lock(mut);
  RecordCall ("ListPeers");

  const std::set<NodeId> wanted(filter.begin (), filter.end ());
  std::vector<Peer> res;
  for (const auto& p : peers[infoEndpoint])
    if (wanted.empty () || wanted.count (p.nodeId) > 0)
      res.push_back (p);

  return res;
}

std::string
TestRegistry::GetValidatorSignature (const std::string& rpcEndpoint,
                                     const Id& messageId)
{
  std::chrono::milliseconds delay;
  {
    std::lock_guard<std::mutex> lock(mut);
    signatureRequests.push_back (rpcEndpoint);
    ++runningSignatureRequests;
    maxParallelSignatureRequests
        = std::max (maxParallelSignatureRequests, runningSignatureRequests);
    delay = signatureDelay;
  }

  std::this_thread::sleep_for (delay);

  std::lock_guard<std::mutex> lock(mut);
  --runningSignatureRequests;
  RecordCall ("GetValidatorSignature");

  const auto mit = signatures.find (rpcEndpoint);
  if (mit == signatures.end ())
    throw Error (ErrorKind::RemoteUnavailable,
                 "no signature at " + rpcEndpoint);

  return mit->second;
}

std::vector<WarpLog>
TestRegistry::GetWarpLogs (const std::string& rpcEndpoint,
                           const uint64_t fromBlock, const uint64_t toBlock)
{
  std::lock_guard<std::mutex> lock(mut);
  RecordCall ("GetWarpLogs");

  std::vector<WarpLog> res;
  for (const auto& l : warpLogs[rpcEndpoint])
    if (l.blockNumber >= fromBlock && l.blockNumber <= toBlock)
      res.push_back (l);

  return res;
}

} // namespace ash
