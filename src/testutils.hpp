// Copyright (C) 2021-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ASH_TESTUTILS_HPP
#define ASH_TESTUTILS_HPP

#include "errors.hpp"
#include "ids.hpp"
#include "network.hpp"
#include "registry.hpp"

#include <json/json.h>

#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ash
{

/**
 * Parses a string as JSON, for use in testing when JSON values are needed.
 */
Json::Value ParseJson (const std::string& str);

/**
 * Decodes a hex string (with or without 0x), CHECK-failing if it is invalid.
 */
std::string HexToBin (const std::string& hex);

/**
 * Returns a deterministic test ID derived from a number.
 */
Id TestId (unsigned n);

/**
 * Returns a deterministic test node ID derived from a number.
 */
NodeId TestNodeId (unsigned n);

/**
 * Returns a 96-byte signature value derived from a node ID, as
 * returned by TestRegistry for it.
 */
std::string TestSignature (const NodeId& nodeId);

/**
 * Expects that calling the given function throws an ash::Error of
 * the given kind.
 */
template <typename Fcn>
  void
  ExpectErrorKind (const ErrorKind kind, const Fcn& fcn)
{
  try
    {
      fcn ();
      ADD_FAILURE () << "Expected error " << kind;
    }
  catch (const Error& exc)
    {
      EXPECT_EQ (exc.GetKind (), kind) << exc.what ();
    }
}

/**
 * Fake implementation of RegistryClient with scripted responses.  All
 * methods are thread-safe, and every signature request is recorded.
 */
class TestRegistry : public RegistryClient
{

private:

  /** Lock for all member fields.  */
  mutable std::mutex mut;

  std::vector<Subnet> subnets;
  std::vector<Blockchain> blockchains;
  std::map<Id, std::vector<Validator>> validators;
  std::map<Id, std::vector<Validator>> pendingValidators;

  /** Node info by info endpoint.  */
  std::map<std::string, NodeInfo> nodeInfos;

  /** Peers by info endpoint.  */
  std::map<std::string, std::vector<Peer>> peers;

  /** Signatures returned by RPC endpoint.  */
  std::map<std::string, std::string> signatures;

  /** Warp logs by RPC endpoint.  */
  std::map<std::string, std::vector<WarpLog>> warpLogs;

  /** Methods that should fail, with the error kind.  */
  std::map<std::string, ErrorKind> failures;

  /** Number of calls per method.  */
  std::map<std::string, unsigned> calls;

  /** All RPC endpoints signatures were requested from, in order.  */
  std::vector<std::string> signatureRequests;

  /** Delay applied to each signature request.  */
  std::chrono::milliseconds signatureDelay{0};

  /** Currently running signature requests.  */
  unsigned runningSignatureRequests = 0;

  /** Maximum of runningSignatureRequests seen.  */
  unsigned maxParallelSignatureRequests = 0;

  /**
   * Records a call to the given method and throws if it has been set
   * to fail.  Must be called with the lock held.
   */
  void RecordCall (const std::string& method);

public:

  TestRegistry () = default;

  void SetSubnets (const std::vector<Subnet>& s);
  void SetBlockchains (const std::vector<Blockchain>& c);
  void SetValidators (const Id& subnetId, const std::vector<Validator>& v);
  void SetPendingValidators (const Id& subnetId,
                             const std::vector<Validator>& v);
  void SetNodeInfo (const std::string& infoEndpoint, const NodeInfo& info);
  void SetPeers (const std::string& infoEndpoint, const std::vector<Peer>& p);
  void SetWarpLogs (const std::string& rpcEndpoint,
                    const std::vector<WarpLog>& logs);

  /**
   * Sets the signature returned from the given RPC endpoint.  Endpoints
   * without a signature fail with RemoteUnavailable.
   */
  void SetSignature (const std::string& rpcEndpoint, const std::string& sig);

  /**
   * Makes all calls to the given method (e.g. "ListPeers") fail with
   * the given error kind.
   */
  void SetFailure (const std::string& method, ErrorKind kind);

  void SetSignatureDelay (std::chrono::milliseconds d);

  unsigned GetCalls (const std::string& method) const;
  std::vector<std::string> GetSignatureRequests () const;
  unsigned GetMaxParallelSignatureRequests () const;

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

} // namespace ash

#endif // ASH_TESTUTILS_HPP
