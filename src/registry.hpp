// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ASH_REGISTRY_HPP
#define ASH_REGISTRY_HPP

#include "ids.hpp"
#include "network.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ash
{

/**
 * A peer of a node, as returned by its info API.
 */
struct Peer
{

  NodeId nodeId;

  /** The peer's public IP (without port or brackets).  */
  std::string ip;

  /** The peer's staking (P2P) port.  */
  uint16_t stakingPort = 0;

};

/**
 * Information about a node as reported by itself.
 */
struct NodeInfo
{

  NodeId nodeId;

  /** Whether the node has a BLS key.  */
  bool hasSigner = false;
  BlsSigner signer;

  /** The node's public IP (without port or brackets).  */
  std::string publicIp;
  uint16_t stakingPort = 0;

};

/**
 * An event log emitted by a contract on an EVM chain.
 */
struct WarpLog
{

  /** The block number the log was emitted in.  */
  uint64_t blockNumber = 0;

  /** The transaction hash as binary.  */
  std::string txHash;

  /** The log topics as 32-byte binary strings.  */
  std::vector<std::string> topics;

  /** The log data as binary.  */
  std::string data;

};

/**
 * HTTP access point of an Avalanche node.
 */
struct AvalancheNode
{

  std::string scheme = "http";
  std::string host;
  uint16_t httpPort = 9'650;

  /** Encoded credentials and query string for API access, if any.  */
  std::string userinfo;
  std::string query;

  /**
   * Returns the URL of the node's info API.
   */
  std::string GetInfoEndpoint () const;

};

/**
 * Interface for the remote registry of network state, i.e. the RPC
 * endpoints of Avalanche nodes.  Implementations do not retry failed
 * calls and report all failures as ash::Error with kind RemoteUnavailable,
 * MalformedResponse or RpcApplicationError.  All methods may be called in
 * parallel and must be thread-safe.
 */
class RegistryClient
{

public:

  RegistryClient () = default;
  virtual ~RegistryClient () = default;

  /**
   * Returns all Subnets on the network (without blockchains or validators).
   */
  virtual std::vector<Subnet> ListSubnets (const Network& network) = 0;

  /**
   * Returns all blockchains on the network.  The VM type and RPC URL are
   * not known remotely and thus empty.
   */
  virtual std::vector<Blockchain> ListBlockchains (const Network& network) = 0;

  /**
   * Returns the current validators of the given Subnet, in the order
   * they are reported.
   */
  virtual std::vector<Validator> ListValidators (const Network& network,
                                                 const Id& subnetId) = 0;

  /**
   * Returns the pending validators of the given Subnet.
   */
  virtual std::vector<Validator> ListPendingValidators (
      const Network& network, const Id& subnetId) = 0;

  /**
   * Queries a node's own ID, BLS signer and public IP through its info API.
   */
  virtual NodeInfo GetNodeInfo (const std::string& infoEndpoint) = 0;

  /**
   * Returns the peers of the node at the given info API endpoint.
   * If filter is not empty, only those node IDs are requested.
   */
  virtual std::vector<Peer> ListPeers (const std::string& infoEndpoint,
                                       const std::vector<NodeId>& filter) = 0;

  /**
   * Requests the signature of a node over a Warp message from the
   * RPC endpoint of the source chain on that node.  The returned signature
   * is guaranteed to have exactly 96 bytes.
   */
  virtual std::string GetValidatorSignature (const std::string& rpcEndpoint,
                                             const Id& messageId) = 0;

  /**
   * Returns the SendWarpMessage logs of the WarpMessenger precompile
   * emitted in the given (inclusive) range of blocks.
   */
  virtual std::vector<WarpLog> GetWarpLogs (const std::string& rpcEndpoint,
                                            uint64_t fromBlock,
                                            uint64_t toBlock) = 0;

};

} // namespace ash

#endif // ASH_REGISTRY_HPP
