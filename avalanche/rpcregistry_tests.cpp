// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpcregistry.hpp"

#include "encoding.hpp"
#include "errors.hpp"
#include "testutils.hpp"
#include "warp.hpp"

#include "rpc-stubs/evmrpcserverstub.h"
#include "rpc-stubs/inforpcserverstub.h"
#include "rpc-stubs/platformrpcserverstub.h"

#include <jsonrpccpp/common/exception.h>
#include <jsonrpccpp/server.h>
#include <jsonrpccpp/server/connectors/httpserver.h>

#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>
#include <vector>

namespace ash
{
namespace
{

using testing::ElementsAre;

/* Ports for the fake node APIs.  Nothing listens on CLOSED_PORT.  */
constexpr int PCHAIN_PORT = 49'911;
constexpr int INFO_PORT = 49'912;
constexpr int EVM_PORT = 49'913;
constexpr int CLOSED_PORT = 49'919;

/** Error code returned by the fake servers when told to fail.  */
constexpr int FAKE_ERROR_CODE = -32'000;

std::string
GetEndpoint (const int port, const std::string& path)
{
  std::ostringstream out;
  out << "http://localhost:" << port << path;
  return out.str ();
}

/**
 * Base for the fake APIs, which can be told to fail all requests
 * with an RPC error.
 */
class FailingServer
{

public:

  bool fail = false;

protected:

  void
  MaybeFail () const
  {
    if (fail)
      throw jsonrpc::JsonRpcException (FAKE_ERROR_CODE, "failure requested");
  }

};

class FakePlatform : public PlatformRpcServerStub, public FailingServer
{

public:

  Json::Value subnets;
  Json::Value blockchains;
  Json::Value validators;
  Json::Value pendingValidators;

  /** Subnet ID of the last validator request.  */
  std::string lastSubnetId;

  explicit FakePlatform (jsonrpc::AbstractServerConnector& conn)
    : PlatformRpcServerStub(conn)
  {}

  Json::Value
  platform_getSubnets (const Json::Value& ids) override
  {
    MaybeFail ();
    return subnets;
  }

  Json::Value
  platform_getBlockchains () override
  {
    MaybeFail ();
    return blockchains;
  }

  Json::Value
  platform_getCurrentValidators (const std::string& subnetID) override
  {
    MaybeFail ();
    lastSubnetId = subnetID;
    return validators;
  }

  Json::Value
  platform_getPendingValidators (const std::string& subnetID) override
  {
    MaybeFail ();
    lastSubnetId = subnetID;
    return pendingValidators;
  }

};

class FakeInfo : public InfoRpcServerStub, public FailingServer
{

public:

  Json::Value nodeId;
  Json::Value nodeIp;
  Json::Value peers;

  /** The node IDs of the last info.peers request.  */
  Json::Value lastPeerFilter;

  explicit FakeInfo (jsonrpc::AbstractServerConnector& conn)
    : InfoRpcServerStub(conn)
  {}

  Json::Value
  info_getNodeID () override
  {
    MaybeFail ();
    return nodeId;
  }

  Json::Value
  info_getNodeIP () override
  {
    MaybeFail ();
    return nodeIp;
  }

  Json::Value
  info_peers (const Json::Value& nodeIDs) override
  {
    MaybeFail ();
    lastPeerFilter = nodeIDs;
    return peers;
  }

};

class FakeEvm : public EvmRpcServerStub, public FailingServer
{

public:

  std::string signature;
  Json::Value logs;

  /** Message ID of the last signature request.  */
  std::string lastMessageId;
  /** Filter of the last eth_getLogs request.  */
  Json::Value lastFilter;

  explicit FakeEvm (jsonrpc::AbstractServerConnector& conn)
    : EvmRpcServerStub(conn)
  {}

  std::string
  warp_getSignature (const std::string& id) override
  {
    MaybeFail ();
    lastMessageId = id;
    return signature;
  }

  Json::Value
  eth_getLogs (const Json::Value& filter) override
  {
    MaybeFail ();
    lastFilter = filter;
    return logs;
  }

};

/* ************************************************************************** */

TEST (RpcRecordsTests, SubnetFromJson)
{
  const auto subnet = SubnetFromJson (ParseJson (R"({
    "id": ")" + TestId (1).ToCb58 () + R"(",
    "controlKeys": ["P-fuji1abc"],
    "threshold": "1"
  })"));
  EXPECT_EQ (subnet.id, TestId (1));
  EXPECT_THAT (subnet.controlKeys, ElementsAre ("P-fuji1abc"));
  EXPECT_EQ (subnet.threshold, 1);
  EXPECT_EQ (subnet.type, SubnetType::Permissioned);

  const auto primary = SubnetFromJson (ParseJson (R"({
    "id": "11111111111111111111111111111111LpoYY",
    "controlKeys": [],
    "threshold": "0"
  })"));
  EXPECT_EQ (primary.type, SubnetType::PrimaryNetwork);

  for (const std::string str : {"42", "{}", R"({"id": "invalid"})",
                                R"({"id": "11111111111111111111111111111111LpoYY",
                                    "threshold": "x"})"})
    ExpectErrorKind (ErrorKind::MalformedResponse, [&str] ()
      {
        SubnetFromJson (ParseJson (str));
      });
}

TEST (RpcRecordsTests, BlockchainFromJson)
{
  const auto chain = BlockchainFromJson (ParseJson (R"({
    "id": ")" + TestId (1).ToCb58 () + R"(",
    "name": "mychain",
    "subnetID": ")" + TestId (2).ToCb58 () + R"(",
    "vmID": ")" + TestId (3).ToCb58 () + R"("
  })"));
  EXPECT_EQ (chain.id, TestId (1));
  EXPECT_EQ (chain.name, "mychain");
  EXPECT_EQ (chain.subnetId, TestId (2));
  EXPECT_EQ (chain.vmId, TestId (3));
  EXPECT_EQ (chain.vmType, "");
  EXPECT_EQ (chain.rpcUrl, "");

  ExpectErrorKind (ErrorKind::MalformedResponse, [] ()
    {
      BlockchainFromJson (ParseJson (R"({"name": "foo"})"));
    });
}

TEST (RpcRecordsTests, PrimaryValidatorFromJson)
{
  const auto v = ValidatorFromJson (ParseJson (R"({
    "txID": ")" + TestId (1).ToCb58 () + R"(",
    "startTime": "1600000000",
    "endTime": "1700000000",
    "stakeAmount": "2000000000000",
    "nodeID": ")" + TestNodeId (1).ToString () + R"(",
    "validationRewardOwner": {
      "locktime": "0",
      "threshold": "1",
      "addresses": ["P-avax1abc"]
    },
    "potentialReward": "12345",
    "delegationFee": "2.0000",
    "uptime": "99.5000",
    "connected": true,
    "signer": {
      "publicKey": "0x0102",
      "proofOfPossession": "0x0304"
    },
    "delegatorCount": "1",
    "delegatorWeight": "25000000000",
    "delegators": [
      {
        "txID": ")" + TestId (2).ToCb58 () + R"(",
        "startTime": "1650000000",
        "endTime": "1660000000",
        "stakeAmount": "25000000000",
        "nodeID": ")" + TestNodeId (1).ToString () + R"(",
        "potentialReward": "100"
      }
    ]
  })"));

  EXPECT_EQ (v.nodeId, TestNodeId (1));
  EXPECT_EQ (v.txId, TestId (1));
  EXPECT_EQ (v.startTime, 1'600'000'000);
  EXPECT_EQ (v.endTime, 1'700'000'000);
  EXPECT_EQ (v.stakeAmount, 2'000'000'000'000);
  EXPECT_EQ (v.weight, 0);
  EXPECT_EQ (v.potentialReward, 12'345);
  EXPECT_DOUBLE_EQ (v.delegationFee, 2.0);
  EXPECT_DOUBLE_EQ (v.uptime, 99.5);
  EXPECT_TRUE (v.connected);

  ASSERT_TRUE (v.hasValidationRewardOwner);
  EXPECT_EQ (v.validationRewardOwner.threshold, 1);
  EXPECT_THAT (v.validationRewardOwner.addresses, ElementsAre ("P-avax1abc"));
  EXPECT_FALSE (v.hasDelegationRewardOwner);

  ASSERT_TRUE (v.hasSigner);
  EXPECT_EQ (v.signer.publicKey, "\x01\x02");
  EXPECT_EQ (v.signer.proofOfPossession, "\x03\x04");

  EXPECT_EQ (v.delegatorCount, 1);
  EXPECT_EQ (v.delegatorWeight, 25'000'000'000);
  ASSERT_EQ (v.delegators.size (), 1);
  EXPECT_EQ (v.delegators[0].txId, TestId (2));
  EXPECT_EQ (v.delegators[0].stakeAmount, 25'000'000'000);
  EXPECT_EQ (v.delegators[0].potentialReward, 100);
  EXPECT_FALSE (v.delegators[0].hasRewardOwner);
}

TEST (RpcRecordsTests, PermissionedValidatorFromJson)
{
  const auto v = ValidatorFromJson (ParseJson (R"({
    "txID": ")" + TestId (1).ToCb58 () + R"(",
    "startTime": "1600000000",
    "endTime": "1700000000",
    "weight": "20",
    "nodeID": ")" + TestNodeId (2).ToString () + R"(",
    "connected": false,
    "uptime": "0.0000"
  })"));

  EXPECT_EQ (v.nodeId, TestNodeId (2));
  EXPECT_EQ (v.weight, 20);
  EXPECT_EQ (v.stakeAmount, 0);
  EXPECT_FALSE (v.hasSigner);
  EXPECT_FALSE (v.hasValidationRewardOwner);
  EXPECT_TRUE (v.delegators.empty ());
}

TEST (RpcRecordsTests, InvalidValidator)
{
  const std::string node = TestNodeId (1).ToString ();
  const std::vector<std::string> cases =
    {
      R"({"weight": "1"})",
      R"({"nodeID": "NodeID-invalid"})",
      R"({"nodeID": ")" + node + R"(", "weight": "-1"})",
      R"({"nodeID": ")" + node + R"(", "weight": "99999999999999999999"})",
      R"({"nodeID": ")" + node + R"(", "uptime": "abc"})",
      R"({"nodeID": ")" + node + R"(", "connected": "yes"})",
      R"({"nodeID": ")" + node + R"(", "signer": {"publicKey": "xy"}})",
    };

  for (const auto& str : cases)
    ExpectErrorKind (ErrorKind::MalformedResponse, [&str] ()
      {
        ValidatorFromJson (ParseJson (str));
      });
}

TEST (RpcRecordsTests, PeerFromJson)
{
  const std::string node = TestNodeId (1).ToString ();

  auto p = PeerFromJson (ParseJson (R"({
    "ip": "1.2.3.4:56789",
    "publicIP": "1.2.3.4:9651",
    "nodeID": ")" + node + R"("
  })"));
  EXPECT_EQ (p.nodeId, TestNodeId (1));
  EXPECT_EQ (p.ip, "1.2.3.4");
  EXPECT_EQ (p.stakingPort, 9'651);

  p = PeerFromJson (ParseJson (R"({
    "ip": "[2001:db8::1]:9651",
    "nodeID": ")" + node + R"("
  })"));
  EXPECT_EQ (p.ip, "2001:db8::1");
  EXPECT_EQ (p.stakingPort, 9'651);

  ExpectErrorKind (ErrorKind::MalformedResponse, [&node] ()
    {
      PeerFromJson (ParseJson (R"({"ip": "1.2.3.4", "nodeID": ")"
                                  + node + R"("})"));
    });
}

TEST (RpcRecordsTests, NodeInfoFromJson)
{
  auto info = NodeInfoFromJson (
      ParseJson (R"({"nodeID": ")" + TestNodeId (1).ToString () + R"("})"),
      ParseJson (R"({"ip": "5.6.7.8:9651"})"));
  EXPECT_EQ (info.nodeId, TestNodeId (1));
  EXPECT_FALSE (info.hasSigner);
  EXPECT_EQ (info.publicIp, "5.6.7.8");
  EXPECT_EQ (info.stakingPort, 9'651);

  info = NodeInfoFromJson (
      ParseJson (R"({
        "nodeID": ")" + TestNodeId (1).ToString () + R"(",
        "nodePOP": {"publicKey": "0xaa", "proofOfPossession": "0xbb"}
      })"),
      ParseJson (R"({"ip": "5.6.7.8:9651"})"));
  ASSERT_TRUE (info.hasSigner);
  EXPECT_EQ (info.signer.publicKey, "\xaa");
  EXPECT_EQ (info.signer.proofOfPossession, "\xbb");
}

TEST (RpcRecordsTests, WarpLogFromJson)
{
  const std::string topic = EncodeHex (TestId (1).GetBinary ());
  const auto log = WarpLogFromJson (ParseJson (R"({
    "blockNumber": "0x1a",
    "transactionHash": ")" + EncodeHex (TestId (2).GetBinary ()) + R"(",
    "topics": [")" + topic + R"("],
    "data": "0x0102"
  })"));

  EXPECT_EQ (log.blockNumber, 26);
  EXPECT_EQ (log.txHash, TestId (2).GetBinary ());
  EXPECT_THAT (log.topics, ElementsAre (TestId (1).GetBinary ()));
  EXPECT_EQ (log.data, "\x01\x02");

  ExpectErrorKind (ErrorKind::MalformedResponse, [] ()
    {
      WarpLogFromJson (ParseJson (R"({
        "blockNumber": "26",
        "transactionHash": "0x",
        "topics": [],
        "data": "0x"
      })"));
    });

  for (const std::string block : {"26", "0x", "0x1g", "0x10000000000000000"})
    ExpectErrorKind (ErrorKind::MalformedResponse, [&] ()
      {
        WarpLogFromJson (ParseJson (R"({
          "blockNumber": ")" + block + R"(",
          "transactionHash": ")" + EncodeHex (TestId (2).GetBinary ()) + R"(",
          "topics": [")" + topic + R"("],
          "data": "0x0102"
        })"));
      });
}

TEST (RpcRecordsTests, DecodeSignature)
{
  const std::string sig = TestSignature (TestNodeId (1));
  EXPECT_EQ (DecodeSignature (EncodeHex (sig)), sig);

  ExpectErrorKind (ErrorKind::MalformedResponse, [] ()
    {
      DecodeSignature ("0xzz");
    });
  ExpectErrorKind (ErrorKind::InvalidSignature, [&sig] ()
    {
      DecodeSignature (EncodeHex (sig.substr (1)));
    });
}

TEST (RpcRecordsTests, SendWarpMessageTopic)
{
  EXPECT_EQ (GetSendWarpMessageTopic (),
             "0x3e6ad4991eb8370644656486297eb0bf"
             "6a7792ef369dfd9eda2c51ec82b67b59");
}

/* ************************************************************************** */

class RpcRegistryTests : public testing::Test
{

private:

  jsonrpc::HttpServer pchainHttp;
  jsonrpc::HttpServer infoHttp;
  jsonrpc::HttpServer evmHttp;

protected:

  FakePlatform pchain;
  FakeInfo info;
  FakeEvm evm;

  Network network;
  RpcRegistry registry;

  const std::string infoEndpoint;
  const std::string evmEndpoint;

  RpcRegistryTests ()
    : pchainHttp(PCHAIN_PORT), infoHttp(INFO_PORT), evmHttp(EVM_PORT),
      pchain(pchainHttp), info(infoHttp), evm(evmHttp),
      network("test"),
      infoEndpoint(GetEndpoint (INFO_PORT, "/ext/info")),
      evmEndpoint(GetEndpoint (EVM_PORT, "/ext/bc/test/rpc"))
  {
    Subnet primary;
    primary.id = PRIMARY_NETWORK_ID;
    primary.type = SubnetType::PrimaryNetwork;

    Blockchain p;
    p.id = PRIMARY_NETWORK_ID;
    p.name = "P-Chain";
    p.subnetId = PRIMARY_NETWORK_ID;
    p.vmType = "PlatformVM";
    p.rpcUrl = GetEndpoint (PCHAIN_PORT, "/ext/bc/P");
    primary.blockchains.push_back (p);

    network.AddSubnet (primary);

    pchain.StartListening ();
    info.StartListening ();
    evm.StartListening ();
  }

  ~RpcRegistryTests ()
  {
    evm.StopListening ();
    info.StopListening ();
    pchain.StopListening ();
  }

};

TEST_F (RpcRegistryTests, ListSubnets)
{
  pchain.subnets = ParseJson (R"({
    "subnets": [
      {
        "id": "11111111111111111111111111111111LpoYY",
        "controlKeys": [],
        "threshold": "0"
      },
      {
        "id": "invalid",
        "controlKeys": [],
        "threshold": "1"
      },
      {
        "id": ")" + TestId (1).ToCb58 () + R"(",
        "controlKeys": ["P-fuji1abc", "P-fuji1def"],
        "threshold": "2"
      }
    ]
  })");

  const auto subnets = registry.ListSubnets (network);
  ASSERT_EQ (subnets.size (), 2);
  EXPECT_EQ (subnets[0].id, PRIMARY_NETWORK_ID);
  EXPECT_EQ (subnets[0].type, SubnetType::PrimaryNetwork);
  EXPECT_EQ (subnets[1].id, TestId (1));
  EXPECT_EQ (subnets[1].threshold, 2);
  EXPECT_EQ (subnets[1].type, SubnetType::Permissioned);
}

TEST_F (RpcRegistryTests, ListBlockchains)
{
  pchain.blockchains = ParseJson (R"({
    "blockchains": [
      {
        "id": ")" + TestId (10).ToCb58 () + R"(",
        "name": "chain",
        "subnetID": ")" + TestId (1).ToCb58 () + R"(",
        "vmID": ")" + TestId (20).ToCb58 () + R"("
      }
    ]
  })");

  const auto chains = registry.ListBlockchains (network);
  ASSERT_EQ (chains.size (), 1);
  EXPECT_EQ (chains[0].id, TestId (10));
  EXPECT_EQ (chains[0].subnetId, TestId (1));
}

TEST_F (RpcRegistryTests, ListValidators)
{
  pchain.validators = ParseJson (R"({
    "validators": [
      {"nodeID": ")" + TestNodeId (1).ToString () + R"(", "weight": "10"},
      {"nodeID": "bad"},
      {"nodeID": ")" + TestNodeId (2).ToString () + R"(", "weight": "20"}
    ]
  })");
  pchain.pendingValidators = ParseJson (R"({
    "validators": [
      {"nodeID": ")" + TestNodeId (3).ToString () + R"(", "weight": "30"}
    ],
    "delegators": []
  })");

  const auto current = registry.ListValidators (network, TestId (1));
  EXPECT_EQ (pchain.lastSubnetId, TestId (1).ToCb58 ());
  ASSERT_EQ (current.size (), 2);
  EXPECT_EQ (current[0].nodeId, TestNodeId (1));
  EXPECT_EQ (current[1].nodeId, TestNodeId (2));
  EXPECT_EQ (current[1].weight, 20);

  const auto pending = registry.ListPendingValidators (network, TestId (2));
  EXPECT_EQ (pchain.lastSubnetId, TestId (2).ToCb58 ());
  ASSERT_EQ (pending.size (), 1);
  EXPECT_EQ (pending[0].nodeId, TestNodeId (3));
}

TEST_F (RpcRegistryTests, MalformedList)
{
  pchain.subnets = ParseJson (R"({"subnets": 42})");
  ExpectErrorKind (ErrorKind::MalformedResponse, [this] ()
    {
      registry.ListSubnets (network);
    });

  pchain.validators = ParseJson ("[]");
  ExpectErrorKind (ErrorKind::MalformedResponse, [this] ()
    {
      registry.ListValidators (network, TestId (1));
    });
}

TEST_F (RpcRegistryTests, RemoteError)
{
  pchain.fail = true;
  try
    {
      registry.ListSubnets (network);
      FAIL () << "Expected RPC error";
    }
  catch (const Error& exc)
    {
      EXPECT_EQ (exc.GetKind (), ErrorKind::RpcApplicationError);
      EXPECT_EQ (exc.GetRpcCode (), FAKE_ERROR_CODE);
    }
}

TEST_F (RpcRegistryTests, RemoteUnavailable)
{
  ExpectErrorKind (ErrorKind::RemoteUnavailable, [this] ()
    {
      registry.GetNodeInfo (GetEndpoint (CLOSED_PORT, "/ext/info"));
    });
  ExpectErrorKind (ErrorKind::RemoteUnavailable, [this] ()
    {
      registry.GetValidatorSignature (
          GetEndpoint (CLOSED_PORT, "/ext/bc/test/rpc"), TestId (1));
    });
}

TEST_F (RpcRegistryTests, MissingPChainUrl)
{
  Network other("other");
  Subnet primary;
  primary.id = PRIMARY_NETWORK_ID;
  Blockchain p;
  p.id = PRIMARY_NETWORK_ID;
  p.name = "P-Chain";
  primary.blockchains.push_back (p);
  other.AddSubnet (primary);

  ExpectErrorKind (ErrorKind::InvalidUrl, [this, &other] ()
    {
      registry.ListSubnets (other);
    });
}

TEST_F (RpcRegistryTests, GetNodeInfo)
{
  info.nodeId = ParseJson (R"({
    "nodeID": ")" + TestNodeId (1).ToString () + R"(",
    "nodePOP": {"publicKey": "0x01", "proofOfPossession": "0x02"}
  })");
  info.nodeIp = ParseJson (R"({"ip": "10.0.0.1:9651"})");

  const auto res = registry.GetNodeInfo (infoEndpoint);
  EXPECT_EQ (res.nodeId, TestNodeId (1));
  EXPECT_TRUE (res.hasSigner);
  EXPECT_EQ (res.publicIp, "10.0.0.1");
  EXPECT_EQ (res.stakingPort, 9'651);
}

TEST_F (RpcRegistryTests, ListPeers)
{
  info.peers = ParseJson (R"({
    "numPeers": "2",
    "peers": [
      {"ip": "10.0.0.2:9651", "nodeID": ")" + TestNodeId (2).ToString () + R"("},
      {"ip": "garbage", "nodeID": ")" + TestNodeId (3).ToString () + R"("}
    ]
  })");

  const auto peers
      = registry.ListPeers (infoEndpoint, {TestNodeId (2), TestNodeId (3)});
  EXPECT_EQ (info.lastPeerFilter,
             ParseJson ("[\"" + TestNodeId (2).ToString () + "\", \""
                          + TestNodeId (3).ToString () + "\"]"));
  ASSERT_EQ (peers.size (), 1);
  EXPECT_EQ (peers[0].nodeId, TestNodeId (2));
  EXPECT_EQ (peers[0].ip, "10.0.0.2");

  info.peers = ParseJson (R"({"numPeers": "0", "peers": null})");
  EXPECT_TRUE (registry.ListPeers (infoEndpoint, {}).empty ());
}

TEST_F (RpcRegistryTests, GetValidatorSignature)
{
  const std::string sig = TestSignature (TestNodeId (1));
  evm.signature = EncodeHex (sig);

  EXPECT_EQ (registry.GetValidatorSignature (evmEndpoint, TestId (5)), sig);
  EXPECT_EQ (evm.lastMessageId, TestId (5).ToCb58 ());

  evm.signature = "0x1234";
  ExpectErrorKind (ErrorKind::InvalidSignature, [this] ()
    {
      registry.GetValidatorSignature (evmEndpoint, TestId (5));
    });
}

TEST_F (RpcRegistryTests, GetWarpLogs)
{
  const std::string topic = EncodeHex (TestId (1).GetBinary ());
  evm.logs = ParseJson (R"([
    {
      "blockNumber": "0xa",
      "transactionHash": ")" + topic + R"(",
      "topics": [")" + topic + R"("],
      "data": "0x01",
      "removed": false
    },
    {
      "blockNumber": "0xb",
      "transactionHash": ")" + topic + R"(",
      "topics": [],
      "data": "0x02",
      "removed": true
    },
    {
      "blockNumber": "invalid"
    },
    {
      "blockNumber": "0xc",
      "transactionHash": ")" + topic + R"(",
      "topics": [],
      "data": "0x03"
    }
  ])");

  const auto logs = registry.GetWarpLogs (evmEndpoint, 10, 255);
  ASSERT_EQ (logs.size (), 2);
  EXPECT_EQ (logs[0].blockNumber, 10);
  EXPECT_EQ (logs[0].data, "\x01");
  EXPECT_EQ (logs[1].blockNumber, 12);

  EXPECT_EQ (evm.lastFilter["fromBlock"], "0xa");
  EXPECT_EQ (evm.lastFilter["toBlock"], "0xff");
  EXPECT_EQ (evm.lastFilter["address"], WARP_PRECOMPILE_ADDRESS);
  EXPECT_EQ (evm.lastFilter["topics"][0], GetSendWarpMessageTopic ());

  evm.logs = ParseJson ("{}");
  ExpectErrorKind (ErrorKind::MalformedResponse, [this] ()
    {
      registry.GetWarpLogs (evmEndpoint, 0, 1);
    });
}

TEST_F (RpcRegistryTests, ExtraHeaders)
{
  /* Headers are not visible to the stub server, but requests with them
     must still go through.  */
  registry.AddHeader ("X-Api-Key", "secret");
  info.nodeId = ParseJson (R"({"nodeID": ")" + TestNodeId (1).ToString ()
                              + R"("})");
  info.nodeIp = ParseJson (R"({"ip": "10.0.0.1:9651"})");
  EXPECT_EQ (registry.GetNodeInfo (infoEndpoint).nodeId, TestNodeId (1));
}

} // anonymous namespace
} // namespace ash
