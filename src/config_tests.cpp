// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include "errors.hpp"
#include "testutils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

namespace ash
{
namespace
{

using testing::ElementsAre;

/** A valid Subnet ID for use in test configurations.  */
const std::string SUBNET_ID
    = "2PsShLjrFFwR51DMcAh8pyuwzLn1Ym3zRhuXLTmLCR1STk2mL6";

/** A valid chain ID for use in test configurations.  */
const std::string CHAIN_ID
    = "yH8D7ThNJkxmtkuv2jgBa4P1Rn3Qpr4pPr7QYNfcdoS6k6HWp";

/** The ID of the Primary Network in CB58.  */
const std::string PRIMARY_ID = "11111111111111111111111111111111LpoYY";

/**
 * Builds a configuration JSON string with a single network "test"
 * containing the given Subnets (as JSON array string).
 */
std::string
SingleNetwork (const std::string& subnets)
{
  return R"({"avalancheNetworks": [{"name": "test", "subnets": )"
            + subnets + "}]}";
}

/**
 * Expects that loading the given configuration fails with ConfigInvalid.
 */
void
ExpectInvalid (const std::string& json)
{
  ExpectErrorKind (ErrorKind::ConfigInvalid, [&json] ()
    {
      Config::Load (json);
    });
}

TEST (ConfigTests, DefaultNetworks)
{
  const Config cfg = Config::Default ();
  EXPECT_THAT (cfg.GetNetworkNames (),
               ElementsAre ("mainnet", "fuji", "mainnet-ankr", "fuji-ankr",
                            "mainnet-blast", "fuji-blast"));

  for (const auto& name : cfg.GetNetworkNames ())
    {
      Network network;
      ASSERT_TRUE (cfg.GetNetwork (name, network)) << name;
      EXPECT_EQ (network.GetName (), name);

      const auto& primary = network.GetPrimarySubnet ();
      EXPECT_EQ (primary.type, SubnetType::PrimaryNetwork);
      EXPECT_EQ (network.GetPChain ().vmType, "PlatformVM");
      EXPECT_EQ (network.GetCChain ().vmType, "Coreth");
      EXPECT_EQ (network.GetXChain ().vmType, "AvalancheVM");
      for (const auto& c : primary.blockchains)
        {
          EXPECT_EQ (c.subnetId, PRIMARY_NETWORK_ID);
          EXPECT_FALSE (c.rpcUrl.empty ()) << c.name;
        }
    }
}

TEST (ConfigTests, DefaultChainIds)
{
  const Config cfg = Config::Default ();
  Network mainnet, fuji;
  ASSERT_TRUE (cfg.GetNetwork ("mainnet", mainnet));
  ASSERT_TRUE (cfg.GetNetwork ("fuji", fuji));

  EXPECT_EQ (mainnet.GetCChain ().id.ToCb58 (),
             "2q9e4r6Mu3U68nU1fYjgbR6JvwrRx36CohpAX5UQxse55x1Q5");
  EXPECT_EQ (fuji.GetCChain ().id.ToCb58 (), CHAIN_ID);
  EXPECT_EQ (mainnet.GetCChain ().rpcUrl,
             "https://api.avax.network/ext/bc/C/rpc");
}

TEST (ConfigTests, UnknownNetwork)
{
  Network network;
  EXPECT_FALSE (Config::Default ().GetNetwork ("devnet", network));
}

TEST (ConfigTests, MinimalSubnet)
{
  const Config cfg = Config::Load (SingleNetwork (
      "[{\"id\": \"" + SUBNET_ID + "\"}]"));

  Network network;
  ASSERT_TRUE (cfg.GetNetwork ("test", network));
  ASSERT_EQ (network.GetSubnets ().size (), 1);

  const auto& subnet = network.GetSubnets ()[0];
  EXPECT_EQ (subnet.id.ToCb58 (), SUBNET_ID);
  EXPECT_EQ (subnet.threshold, 0);
  EXPECT_TRUE (subnet.controlKeys.empty ());
  EXPECT_TRUE (subnet.blockchains.empty ());
  EXPECT_EQ (subnet.type, SubnetType::Elastic);
}

TEST (ConfigTests, SubnetFields)
{
  const Config cfg = Config::Load (SingleNetwork (R"([
    {
      "id": ")" + SUBNET_ID + R"(",
      "controlKeys": ["P-fuji1abc", "P-fuji1def"],
      "threshold": 2,
      "blockchains": [
        {
          "id": ")" + CHAIN_ID + R"(",
          "name": "mychain",
          "vmID": ")" + PRIMARY_ID + R"(",
          "vmType": "SubnetEVM",
          "rpcUrl": "http://localhost:9650/ext/bc/mychain/rpc"
        }
      ]
    }
  ])"));

  Network network;
  ASSERT_TRUE (cfg.GetNetwork ("test", network));
  const auto& subnet = network.GetSubnet (Id::FromCb58 (SUBNET_ID));
  EXPECT_EQ (subnet.type, SubnetType::Permissioned);
  EXPECT_THAT (subnet.controlKeys, ElementsAre ("P-fuji1abc", "P-fuji1def"));
  EXPECT_EQ (subnet.threshold, 2);

  const auto& chain = subnet.GetBlockchainByName ("mychain");
  EXPECT_EQ (chain.id.ToCb58 (), CHAIN_ID);
  EXPECT_EQ (chain.subnetId, subnet.id);
  EXPECT_EQ (chain.vmId, PRIMARY_NETWORK_ID);
  EXPECT_EQ (chain.vmType, "SubnetEVM");
  EXPECT_EQ (chain.rpcUrl, "http://localhost:9650/ext/bc/mychain/rpc");
}

TEST (ConfigTests, ExplicitSubnetType)
{
  const Config cfg = Config::Load (SingleNetwork (
      "[{\"id\": \"" + SUBNET_ID + "\", \"subnetType\": \"Permissioned\"}]"));

  Network network;
  ASSERT_TRUE (cfg.GetNetwork ("test", network));
  EXPECT_EQ (network.GetSubnets ()[0].type, SubnetType::Permissioned);

  ExpectInvalid (SingleNetwork (
      "[{\"id\": \"" + SUBNET_ID + "\", \"subnetType\": \"Foo\"}]"));
}

TEST (ConfigTests, InvalidJson)
{
  ExpectInvalid ("");
  ExpectInvalid ("{");
  ExpectInvalid ("[]");
  ExpectInvalid ("{}");
  ExpectInvalid (R"({"avalancheNetworks": {}})");
  ExpectInvalid (R"({"avalancheNetworks": [42]})");
}

TEST (ConfigTests, InvalidNetwork)
{
  ExpectInvalid (R"({"avalancheNetworks": [{"subnets": []}]})");
  ExpectInvalid (R"({"avalancheNetworks": [{"name": "test"}]})");
  ExpectInvalid (R"({"avalancheNetworks": [
    {"name": "test", "subnets": []},
    {"name": "test", "subnets": []}
  ]})");
}

TEST (ConfigTests, InvalidSubnet)
{
  ExpectInvalid (SingleNetwork ("[42]"));
  ExpectInvalid (SingleNetwork ("[{}]"));
  ExpectInvalid (SingleNetwork ("[{\"id\": \"invalid\"}]"));
  ExpectInvalid (SingleNetwork (
      "[{\"id\": \"" + SUBNET_ID + "\", \"threshold\": -1}]"));
  ExpectInvalid (SingleNetwork (
      "[{\"id\": \"" + SUBNET_ID + "\", \"controlKeys\": [1]}]"));
  ExpectInvalid (SingleNetwork (
      "[{\"id\": \"" + SUBNET_ID + "\"}, {\"id\": \"" + SUBNET_ID + "\"}]"));
}

TEST (ConfigTests, InvalidBlockchain)
{
  const std::string noVm = "{\"id\": \"" + CHAIN_ID + "\", \"name\": \"x\"}";
  ExpectInvalid (SingleNetwork (
      "[{\"id\": \"" + SUBNET_ID + "\", \"blockchains\": [" + noVm + "]}]"));

  const std::string chain = "{\"id\": \"" + CHAIN_ID + "\", \"name\": \"x\","
                            " \"vmID\": \"" + PRIMARY_ID + "\"}";
  Config::Load (SingleNetwork (
      "[{\"id\": \"" + SUBNET_ID + "\", \"blockchains\": [" + chain + "]}]"));
  ExpectInvalid (SingleNetwork (
      "[{\"id\": \"" + SUBNET_ID + "\", \"blockchains\": ["
          + chain + ", " + chain + "]}]"));
}

TEST (ConfigTests, DuplicateBlockchainName)
{
  const std::string first = "{\"id\": \"" + CHAIN_ID + "\", \"name\": \"x\","
                            " \"vmID\": \"" + PRIMARY_ID + "\"}";
  const std::string sameName = "{\"id\": \"" + PRIMARY_ID + "\","
                               " \"name\": \"x\","
                               " \"vmID\": \"" + PRIMARY_ID + "\"}";
  const std::string otherName = "{\"id\": \"" + PRIMARY_ID + "\","
                                " \"name\": \"y\","
                                " \"vmID\": \"" + PRIMARY_ID + "\"}";

  const Config cfg = Config::Load (SingleNetwork (
      "[{\"id\": \"" + SUBNET_ID + "\", \"blockchains\": ["
          + first + ", " + otherName + "]}]"));
  Network network;
  ASSERT_TRUE (cfg.GetNetwork ("test", network));
  ASSERT_EQ (network.GetSubnets ().size (), 1);
  EXPECT_EQ (network.GetSubnets ()[0].blockchains.size (), 2);

  ExpectInvalid (SingleNetwork (
      "[{\"id\": \"" + SUBNET_ID + "\", \"blockchains\": ["
          + first + ", " + sameName + "]}]"));
}

TEST (ConfigTests, LoadFile)
{
  const std::string path = testing::TempDir () + "ash_config_test.json";
  {
    std::ofstream out(path);
    out << SingleNetwork ("[{\"id\": \"" + SUBNET_ID + "\"}]");
  }

  const Config cfg = Config::LoadFile (path);
  EXPECT_THAT (cfg.GetNetworkNames (), ElementsAre ("test"));

  std::remove (path.c_str ());
}

TEST (ConfigTests, LoadFileMissing)
{
  try
    {
      Config::LoadFile ("/nonexistent/ash/config.json");
      FAIL () << "Expected ConfigNotFound";
    }
  catch (const Error& exc)
    {
      EXPECT_EQ (exc.GetKind (), ErrorKind::ConfigNotFound);
      EXPECT_EQ (exc.GetScope (), "file");
      EXPECT_EQ (exc.GetTarget (), "/nonexistent/ash/config.json");
    }
}

} // anonymous namespace
} // namespace ash
