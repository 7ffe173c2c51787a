// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpcregistry.hpp"

#include "encoding.hpp"
#include "errors.hpp"
#include "jsonutils.hpp"
#include "warp.hpp"

#include "rpc-stubs/evmrpcclient.h"
#include "rpc-stubs/inforpcclient.h"
#include "rpc-stubs/platformrpcclient.h"

#include <eth-utils/hexutils.hpp>
#include <eth-utils/keccak.hpp>

#include <jsonrpccpp/client.h>
#include <jsonrpccpp/common/errors.h>
#include <jsonrpccpp/common/exception.h>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <chrono>
#include <cstdlib>
#include <sstream>

namespace ash
{

DEFINE_int32 (avalanche_rpc_timeout_ms, 10'000,
              "timeout for RPC calls to Avalanche nodes");
DEFINE_string (avalanche_rpc_headers, "",
               "extra headers to send with Avalanche JSON-RPC requests");
DEFINE_int32 (warp_signature_timeout_ms, 5'000,
              "timeout for requesting a Warp signature from one validator");

/* ************************************************************************** */

template <typename T>
  class RpcRegistry::Rpc : public RpcClient<T, jsonrpc::JSONRPC_CLIENT_V2>
{

public:

  explicit Rpc (const RpcRegistry& parent, const std::string& endpoint,
                const std::chrono::milliseconds timeout)
    : RpcClient<T, jsonrpc::JSONRPC_CLIENT_V2>(endpoint)
  {
    this->SetTimeout (timeout);
    this->AddHeaders (parent.headers);
  }

  explicit Rpc (const RpcRegistry& parent, const std::string& endpoint)
    : Rpc(parent, endpoint,
          std::chrono::milliseconds (FLAGS_avalanche_rpc_timeout_ms))
  {}

};

namespace
{

/** Signature of the SendWarpMessage event.  */
constexpr const char* SEND_WARP_MESSAGE_EVENT
    = "SendWarpMessage(bytes32,address,address,bytes)";

/**
 * Runs an RPC call, translating libjson-rpc-cpp exceptions into our
 * error kinds.
 */
template <typename Fcn>
  auto
  CallRpc (const std::string& method, const std::string& endpoint,
           const Fcn& fcn) -> decltype (fcn ())
{
  VLOG (1) << "Calling " << method << " at " << endpoint;

  try
    {
      return fcn ();
    }
  catch (const jsonrpc::JsonRpcException& exc)
    {
      const int code = exc.GetCode ();
      std::ostringstream msg;
      msg << method << " at " << endpoint << " failed: " << exc.what ();

      if (code == jsonrpc::Errors::ERROR_CLIENT_CONNECTOR)
        throw Error (ErrorKind::RemoteUnavailable, msg.str ());
      if (code == jsonrpc::Errors::ERROR_CLIENT_INVALID_RESPONSE
            || code == jsonrpc::Errors::ERROR_RPC_JSON_PARSE_ERROR)
        throw Error (ErrorKind::MalformedResponse, msg.str ());

      throw Error::Rpc (code, msg.str ());
    }
}

[[noreturn]] void
Malformed (const std::string& msg)
{
  throw Error (ErrorKind::MalformedResponse, msg);
}

void
RequireObject (const Json::Value& val, const std::string& what)
{
  if (!val.isObject ())
    Malformed (what + " is not an object: " + StoreJson (val));
}

/**
 * Returns the array member of a response object.  A missing or null
 * member is treated as empty array.
 */
const Json::Value&
GetList (const Json::Value& resp, const std::string& key,
         const std::string& method)
{
  static const Json::Value empty(Json::arrayValue);

  RequireObject (resp, method + " result");
  const auto& val = resp[key];
  if (val.isNull ())
    return empty;
  if (!val.isArray ())
    Malformed (method + " result has no array '" + key + "'");

  return val;
}

std::string
GetString (const Json::Value& obj, const std::string& key)
{
  const auto& val = obj[key];
  if (!val.isString ())
    Malformed ("missing string field '" + key + "' in " + StoreJson (obj));
  return val.asString ();
}

/**
 * Parses an unsigned integer field.  AvalancheGo encodes them as decimal
 * strings, but we also accept JSON numbers and 0x hex.  Missing fields
 * are zero.
 */
uint64_t
GetUint64 (const Json::Value& obj, const std::string& key)
{
  const auto& val = obj[key];
  if (val.isNull ())
    return 0;
  if (val.isUInt64 ())
    return val.asUInt64 ();

  if (!val.isString ())
    Malformed ("invalid integer field '" + key + "' in " + StoreJson (obj));

  const std::string str = val.asString ();
  uint64_t res;
  if (!ParseUint64 (str, res))
    Malformed ("invalid integer '" + str + "' for '" + key + "'");

  return res;
}

/**
 * Parses a decimal field like "99.9900" as double.  Missing fields
 * are zero.
 */
double
GetDouble (const Json::Value& obj, const std::string& key)
{
  const auto& val = obj[key];
  if (val.isNull ())
    return 0.0;
  if (val.isNumeric ())
    return val.asDouble ();

  if (!val.isString ())
    Malformed ("invalid number field '" + key + "' in " + StoreJson (obj));

  const std::string str = val.asString ();
  char* end = nullptr;
  const double res = std::strtod (str.c_str (), &end);
  if (str.empty () || end != str.c_str () + str.size ())
    Malformed ("invalid number '" + str + "' for '" + key + "'");

  return res;
}

Id
GetId (const Json::Value& obj, const std::string& key)
{
  const std::string str = GetString (obj, key);
  Id res;
  if (!Id::TryFromCb58 (str, res))
    Malformed ("invalid ID '" + str + "' for '" + key + "'");
  return res;
}

NodeId
GetNodeId (const Json::Value& obj, const std::string& key)
{
  const std::string str = GetString (obj, key);
  NodeId res;
  if (!NodeId::TryFromString (str, res))
    Malformed ("invalid node ID '" + str + "'");
  return res;
}

std::string
GetHex (const Json::Value& obj, const std::string& key)
{
  const std::string str = GetString (obj, key);
  std::string res;
  if (!DecodeHex (str, res))
    Malformed ("invalid hex data '" + str + "' for '" + key + "'");
  return res;
}

/**
 * Parses a hex quantity ("0x1a") as used by the EVM RPC interface.
 */
uint64_t
GetHexQuantity (const Json::Value& obj, const std::string& key)
{
  const std::string str = GetString (obj, key);
  uint64_t res;
  if (str.substr (0, 2) != "0x" || !ParseUint64 (str, res))
    Malformed ("invalid hex quantity '" + str + "' for '" + key + "'");

  return res;
}

/**
 * Encodes an integer as hex quantity.
 */
std::string
EncodeHexQuantity (const uint64_t val)
{
  std::ostringstream out;
  out << "0x" << std::hex << val;
  return out.str ();
}

bool
ParseOwners (const Json::Value& obj, const std::string& key,
             OutputOwners& res)
{
  const auto& val = obj[key];
  if (val.isNull ())
    return false;
  RequireObject (val, key);

  res.locktime = GetUint64 (val, "locktime");
  const uint64_t threshold = GetUint64 (val, "threshold");
  if (threshold > UINT32_MAX)
    Malformed ("owner threshold is too large");
  res.threshold = threshold;

  res.addresses.clear ();
  for (const auto& a : GetList (val, "addresses", key))
    {
      if (!a.isString ())
        Malformed ("owner address is not a string");
      res.addresses.push_back (a.asString ());
    }

  return true;
}

bool
ParseSigner (const Json::Value& obj, const std::string& key, BlsSigner& res)
{
  const auto& val = obj[key];
  if (val.isNull ())
    return false;
  RequireObject (val, key);

  res.publicKey = GetHex (val, "publicKey");
  res.proofOfPossession = GetHex (val, "proofOfPossession");

  return true;
}

Delegator
DelegatorFromJson (const Json::Value& val)
{
  RequireObject (val, "delegator");

  Delegator res;
  res.txId = GetId (val, "txID");
  res.nodeId = GetNodeId (val, "nodeID");
  res.startTime = GetUint64 (val, "startTime");
  res.endTime = GetUint64 (val, "endTime");
  res.stakeAmount = GetUint64 (val, "stakeAmount");
  if (res.stakeAmount == 0)
    res.stakeAmount = GetUint64 (val, "weight");
  res.potentialReward = GetUint64 (val, "potentialReward");
  res.hasRewardOwner = ParseOwners (val, "rewardOwner", res.rewardOwner);

  return res;
}

} // anonymous namespace

/* ************************************************************************** */

Subnet
SubnetFromJson (const Json::Value& val)
{
  RequireObject (val, "Subnet");

  Subnet res;
  res.id = GetId (val, "id");

  const uint64_t threshold = GetUint64 (val, "threshold");
  if (threshold > UINT32_MAX)
    Malformed ("Subnet threshold is too large");
  res.threshold = threshold;

  const auto& keys = val["controlKeys"];
  if (!keys.isNull ())
    {
      if (!keys.isArray ())
        Malformed ("Subnet control keys are not an array");
      for (const auto& k : keys)
        {
          if (!k.isString ())
            Malformed ("Subnet control key is not a string");
          res.controlKeys.push_back (k.asString ());
        }
    }

  res.type = ClassifySubnet (res.id, res.threshold);

  return res;
}

Blockchain
BlockchainFromJson (const Json::Value& val)
{
  RequireObject (val, "blockchain");

  Blockchain res;
  res.id = GetId (val, "id");
  res.name = GetString (val, "name");
  res.subnetId = GetId (val, "subnetID");
  res.vmId = GetId (val, "vmID");

  return res;
}

Validator
ValidatorFromJson (const Json::Value& val)
{
  RequireObject (val, "validator");

  Validator res;
  res.nodeId = GetNodeId (val, "nodeID");
  if (val.isMember ("txID"))
    res.txId = GetId (val, "txID");

  res.startTime = GetUint64 (val, "startTime");
  res.endTime = GetUint64 (val, "endTime");
  res.weight = GetUint64 (val, "weight");
  res.stakeAmount = GetUint64 (val, "stakeAmount");
  res.potentialReward = GetUint64 (val, "potentialReward");
  res.delegationFee = GetDouble (val, "delegationFee");
  res.uptime = GetDouble (val, "uptime");

  const auto& connected = val["connected"];
  if (!connected.isNull ())
    {
      if (!connected.isBool ())
        Malformed ("validator 'connected' is not a bool");
      res.connected = connected.asBool ();
    }

  res.hasValidationRewardOwner
      = ParseOwners (val, "validationRewardOwner", res.validationRewardOwner);
  res.hasDelegationRewardOwner
      = ParseOwners (val, "delegationRewardOwner", res.delegationRewardOwner);

  res.delegatorCount = GetUint64 (val, "delegatorCount");
  res.delegatorWeight = GetUint64 (val, "delegatorWeight");
  for (const auto& d : GetList (val, "delegators", "validator"))
    res.delegators.push_back (DelegatorFromJson (d));

  res.hasSigner = ParseSigner (val, "signer", res.signer);

  return res;
}

Peer
PeerFromJson (const Json::Value& val)
{
  RequireObject (val, "peer");

  Peer res;
  res.nodeId = GetNodeId (val, "nodeID");

  /* Newer nodes report the advertised address as "publicIP", while "ip"
     is the address of the connection (which may use an ephemeral port).  */
  std::string addr;
  if (val["publicIP"].isString () && !val["publicIP"].asString ().empty ())
    addr = val["publicIP"].asString ();
  else
    addr = GetString (val, "ip");

  if (!SplitHostPort (addr, res.ip, res.stakingPort))
    Malformed ("invalid peer address '" + addr + "'");

  return res;
}

NodeInfo
NodeInfoFromJson (const Json::Value& id, const Json::Value& ip)
{
  RequireObject (id, "info.getNodeID result");
  RequireObject (ip, "info.getNodeIP result");

  NodeInfo res;
  res.nodeId = GetNodeId (id, "nodeID");
  res.hasSigner = ParseSigner (id, "nodePOP", res.signer);

  const std::string addr = GetString (ip, "ip");
  if (!SplitHostPort (addr, res.publicIp, res.stakingPort))
    Malformed ("invalid node address '" + addr + "'");

  return res;
}

WarpLog
WarpLogFromJson (const Json::Value& val)
{
  RequireObject (val, "log");

  WarpLog res;
  res.blockNumber = GetHexQuantity (val, "blockNumber");
  res.txHash = GetHex (val, "transactionHash");
  res.data = GetHex (val, "data");

  const auto& topics = val["topics"];
  if (!topics.isArray ())
    Malformed ("log has no topics array");
  for (const auto& t : topics)
    {
      std::string bin;
      if (!t.isString () || !DecodeHex (t.asString (), bin))
        Malformed ("invalid log topic " + StoreJson (t));
      res.topics.push_back (bin);
    }

  return res;
}

std::string
DecodeSignature (const std::string& hex)
{
  std::string res;
  if (!DecodeHex (hex, res))
    Malformed ("invalid signature hex '" + hex + "'");

  if (res.size () != ValidatorSignature::SIZE)
    {
      std::ostringstream msg;
      msg << "signature has " << res.size () << " bytes, expected "
          << ValidatorSignature::SIZE;
      throw Error (ErrorKind::InvalidSignature, msg.str ());
    }

  return res;
}

std::string
GetSendWarpMessageTopic ()
{
  return "0x" + ethutils::Hexlify (ethutils::Keccak256 (SEND_WARP_MESSAGE_EVENT));
}

/* ************************************************************************** */

RpcRegistry::RpcRegistry ()
  : headers(ParseRpcHeaders (FLAGS_avalanche_rpc_headers))
{}

void
RpcRegistry::AddHeader (const std::string& key, const std::string& value)
{
  headers[key] = value;
}

std::string
RpcRegistry::GetPChainEndpoint (const Network& network)
{
  const auto& pchain = network.GetPChain ();
  if (pchain.rpcUrl.empty ())
    throw Error (ErrorKind::InvalidUrl,
                 "no P-Chain RPC URL configured for network "
                    + network.GetName ());

  return pchain.rpcUrl;
}

std::vector<Subnet>
RpcRegistry::ListSubnets (const Network& network)
{
  const std::string endpoint = GetPChainEndpoint (network);
  Rpc<PlatformRpcClient> rpc(*this, endpoint);

  const Json::Value resp = CallRpc ("platform.getSubnets", endpoint, [&] ()
    {
      return rpc->platform_getSubnets (Json::Value (Json::arrayValue));
    });
  VLOG (2) << "Subnets: " << StoreJson (resp);

  std::vector<Subnet> res;
  for (const auto& s : GetList (resp, "subnets", "platform.getSubnets"))
    try
      {
        res.push_back (SubnetFromJson (s));
      }
    catch (const Error& exc)
      {
        LOG (WARNING) << "Skipping Subnet record: " << exc.what ();
      }

  return res;
}

std::vector<Blockchain>
RpcRegistry::ListBlockchains (const Network& network)
{
  const std::string endpoint = GetPChainEndpoint (network);
  Rpc<PlatformRpcClient> rpc(*this, endpoint);

  const Json::Value resp = CallRpc ("platform.getBlockchains", endpoint, [&] ()
    {
      return rpc->platform_getBlockchains ();
    });
  VLOG (2) << "Blockchains: " << StoreJson (resp);

  std::vector<Blockchain> res;
  for (const auto& c : GetList (resp, "blockchains", "platform.getBlockchains"))
    try
      {
        res.push_back (BlockchainFromJson (c));
      }
    catch (const Error& exc)
      {
        LOG (WARNING) << "Skipping blockchain record: " << exc.what ();
      }

  return res;
}

std::vector<Validator>
RpcRegistry::ValidatorsFromResponse (const Json::Value& resp,
                                     const std::string& method)
{
  std::vector<Validator> res;
  for (const auto& v : GetList (resp, "validators", method))
    try
      {
        res.push_back (ValidatorFromJson (v));
      }
    catch (const Error& exc)
      {
        LOG (WARNING) << "Skipping validator record: " << exc.what ();
      }

  return res;
}

std::vector<Validator>
RpcRegistry::ListValidators (const Network& network, const Id& subnetId)
{
  const std::string endpoint = GetPChainEndpoint (network);
  Rpc<PlatformRpcClient> rpc(*this, endpoint);

  const Json::Value resp
      = CallRpc ("platform.getCurrentValidators", endpoint, [&] ()
    {
      return rpc->platform_getCurrentValidators (subnetId.ToCb58 ());
    });

  return ValidatorsFromResponse (resp, "platform.getCurrentValidators");
}

std::vector<Validator>
RpcRegistry::ListPendingValidators (const Network& network,
                                    const Id& subnetId)
{
  const std::string endpoint = GetPChainEndpoint (network);
  Rpc<PlatformRpcClient> rpc(*this, endpoint);

  const Json::Value resp
      = CallRpc ("platform.getPendingValidators", endpoint, [&] ()
    {
      return rpc->platform_getPendingValidators (subnetId.ToCb58 ());
    });

  return ValidatorsFromResponse (resp, "platform.getPendingValidators");
}

NodeInfo
RpcRegistry::GetNodeInfo (const std::string& infoEndpoint)
{
  Rpc<InfoRpcClient> rpc(*this, infoEndpoint);

  const Json::Value id = CallRpc ("info.getNodeID", infoEndpoint, [&] ()
    {
      return rpc->info_getNodeID ();
    });
  const Json::Value ip = CallRpc ("info.getNodeIP", infoEndpoint, [&] ()
    {
      return rpc->info_getNodeIP ();
    });

  return NodeInfoFromJson (id, ip);
}

std::vector<Peer>
RpcRegistry::ListPeers (const std::string& infoEndpoint,
                        const std::vector<NodeId>& filter)
{
  Json::Value ids(Json::arrayValue);
  for (const auto& n : filter)
    ids.append (n.ToString ());

  Rpc<InfoRpcClient> rpc(*this, infoEndpoint);
  const Json::Value resp = CallRpc ("info.peers", infoEndpoint, [&] ()
    {
      return rpc->info_peers (ids);
    });

  std::vector<Peer> res;
  for (const auto& p : GetList (resp, "peers", "info.peers"))
    try
      {
        res.push_back (PeerFromJson (p));
      }
    catch (const Error& exc)
      {
        LOG (WARNING) << "Skipping peer record: " << exc.what ();
      }

  VLOG (1) << "Found " << res.size () << " peers at " << infoEndpoint;
  return res;
}

std::string
RpcRegistry::GetValidatorSignature (const std::string& rpcEndpoint,
                                    const Id& messageId)
{
  Rpc<EvmRpcClient> rpc(*this, rpcEndpoint,
                        std::chrono::milliseconds (
                            FLAGS_warp_signature_timeout_ms));

  const std::string hex = CallRpc ("warp_getSignature", rpcEndpoint, [&] ()
    {
      return rpc->warp_getSignature (messageId.ToCb58 ());
    });

  return DecodeSignature (hex);
}

std::vector<WarpLog>
RpcRegistry::GetWarpLogs (const std::string& rpcEndpoint,
                          const uint64_t fromBlock, const uint64_t toBlock)
{
  Json::Value topics(Json::arrayValue);
  topics.append (GetSendWarpMessageTopic ());

  Json::Value filter(Json::objectValue);
  filter["fromBlock"] = EncodeHexQuantity (fromBlock);
  filter["toBlock"] = EncodeHexQuantity (toBlock);
  filter["address"] = WARP_PRECOMPILE_ADDRESS;
  filter["topics"] = topics;

  Rpc<EvmRpcClient> rpc(*this, rpcEndpoint);
  const Json::Value resp = CallRpc ("eth_getLogs", rpcEndpoint, [&] ()
    {
      return rpc->eth_getLogs (filter);
    });
  if (!resp.isArray ())
    Malformed ("eth_getLogs result is not an array");

  std::vector<WarpLog> res;
  for (const auto& l : resp)
    {
      if (l.isObject () && l["removed"].isBool () && l["removed"].asBool ())
        continue;

      try
        {
          res.push_back (WarpLogFromJson (l));
        }
      catch (const Error& exc)
        {
          LOG (WARNING) << "Skipping log record: " << exc.what ();
        }
    }

  return res;
}

} // namespace ash
