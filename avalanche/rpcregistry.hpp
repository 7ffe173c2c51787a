// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ASH_AVALANCHE_RPCREGISTRY_HPP
#define ASH_AVALANCHE_RPCREGISTRY_HPP

#include "network.hpp"
#include "registry.hpp"
#include "rpcutils.hpp"

#include <json/json.h>

#include <cstdint>
#include <string>
#include <vector>

namespace ash
{

/**
 * RegistryClient implementation that talks JSON-RPC to the P-Chain, info
 * and Subnet-EVM APIs of AvalancheGo nodes.
 *
 * The P-Chain is reached through the RPC URL configured for the network's
 * P-Chain.  Calls are never retried.  Transport failures are reported as
 * RemoteUnavailable, unparsable responses as MalformedResponse and error
 * objects returned by the node as RpcApplicationError.  Single malformed
 * records inside an otherwise valid list response are logged and skipped.
 */
class RpcRegistry : public RegistryClient
{

private:

  template <typename T>
    class Rpc;

  /** Extra headers sent with every request.  */
  RpcHeaders headers;

  /**
   * Returns the endpoint to use for P-Chain calls on the given network.
   */
  static std::string GetPChainEndpoint (const Network& network);

  /**
   * Returns the validator list of a getCurrentValidators or
   * getPendingValidators response.
   */
  static std::vector<Validator> ValidatorsFromResponse (
      const Json::Value& resp, const std::string& method);

public:

  /**
   * Constructs the registry with the headers from --avalanche_rpc_headers.
   */
  RpcRegistry ();

  RpcRegistry (const RpcRegistry&) = delete;
  void operator= (const RpcRegistry&) = delete;

  /**
   * Adds an extra header that is sent with all requests.
   */
  void AddHeader (const std::string& key, const std::string& value);

  std::vector<Subnet> ListSubnets (const Network& network) override;
  std::vector<Blockchain> ListBlockchains (const Network& network) override;
  std::vector<Validator> ListValidators (const Network& network,
                                         const Id& subnetId) override;
  std::vector<Validator> ListPendingValidators (const Network& network,
                                                const Id& subnetId) override;
  NodeInfo GetNodeInfo (const std::string& infoEndpoint) override;
  std::vector<Peer> ListPeers (const std::string& infoEndpoint,
                               const std::vector<NodeId>& filter) override;
  std::string GetValidatorSignature (const std::string& rpcEndpoint,
                                     const Id& messageId) override;
  std::vector<WarpLog> GetWarpLogs (const std::string& rpcEndpoint,
                                    uint64_t fromBlock,
                                    uint64_t toBlock) override;

};

/* The functions below convert records of the AvalancheGo APIs into our
   types.  They throw MalformedResponse if the record is invalid.  */

Subnet SubnetFromJson (const Json::Value& val);
Blockchain BlockchainFromJson (const Json::Value& val);
Validator ValidatorFromJson (const Json::Value& val);
Peer PeerFromJson (const Json::Value& val);
WarpLog WarpLogFromJson (const Json::Value& val);

/**
 * Parses the results of info.getNodeID and info.getNodeIP into
 * a NodeInfo.
 */
NodeInfo NodeInfoFromJson (const Json::Value& id, const Json::Value& ip);

/**
 * Decodes a hex signature as returned by warp_getSignature.  Throws
 * MalformedResponse if it is not valid hex and InvalidSignature if it
 * does not have exactly 96 bytes.
 */
std::string DecodeSignature (const std::string& hex);

/**
 * Returns the topic (as 0x hex) of the SendWarpMessage event of the
 * WarpMessenger precompile.
 */
std::string GetSendWarpMessageTopic ();

} // namespace ash

#endif // ASH_AVALANCHE_RPCREGISTRY_HPP
