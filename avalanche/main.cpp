// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "aggregator.hpp"
#include "config.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include "jsonutils.hpp"
#include "network.hpp"
#include "rpcregistry.hpp"
#include "warp.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace
{

DEFINE_string (config, "",
               "path to a JSON file with the network configuration"
               " (the built-in configuration is used if empty)");
DEFINE_string (network, "mainnet",
               "name of the Avalanche network to use");

DEFINE_string (source_chain, "",
               "ID or name of the blockchain the Warp messages come from");
DEFINE_string (rpc_url, "",
               "overrides the RPC URL of the source chain");

DEFINE_string (message, "",
               "hex-encoded unsigned Warp message to sign");
DEFINE_int64 (from_block, -1,
              "first block to scan for SendWarpMessage logs if --message"
              " is not given");
DEFINE_int64 (to_block, -1,
              "last block to scan for SendWarpMessage logs");

DEFINE_int32 (quorum, -1,
              "number of signatures to collect per message"
              " (all validators if negative)");

/**
 * Looks up the source chain by ID or name.
 */
ash::Blockchain
FindSourceChain (const ash::Network& network, const std::string& str)
{
  ash::Id id;
  if (ash::Id::TryFromCb58 (str, id))
    return network.GetBlockchain (id);

  return network.GetBlockchainByName (str);
}

/**
 * Builds the Warp messages to sign from the command-line flags.
 */
std::vector<ash::WarpMessage>
GetMessages (ash::RegistryClient& registry, const ash::Blockchain& chain)
{
  std::vector<ash::WarpMessage> res;

  if (!FLAGS_message.empty ())
    {
      std::string bytes;
      if (!ash::DecodeHex (FLAGS_message, bytes))
        throw std::runtime_error ("--message is not valid hex");
      res.emplace_back (ash::UnsignedMessage::DecodeBestEffort (bytes));
      return res;
    }

  if (FLAGS_from_block < 0 || FLAGS_to_block < FLAGS_from_block)
    throw std::runtime_error ("either --message or a valid block range"
                              " with --from_block and --to_block is needed");

  const auto logs = registry.GetWarpLogs (chain.rpcUrl, FLAGS_from_block,
                                          FLAGS_to_block);
  LOG (INFO)
      << "Found " << logs.size () << " Warp messages in blocks "
      << FLAGS_from_block << " to " << FLAGS_to_block;

  for (const auto& l : logs)
    try
      {
        res.push_back (ash::WarpMessage::FromSubnetEvmLog (l.topics, l.data));
      }
    catch (const ash::Error& exc)
      {
        LOG (WARNING)
            << "Ignoring log in block " << l.blockNumber
            << ": " << exc.what ();
      }

  return res;
}

} // anonymous namespace

int
main (int argc, char* argv[])
{
  google::InitGoogleLogging (argv[0]);

  gflags::SetUsageMessage ("Collect validator signatures for Warp messages");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  try
    {
      if (FLAGS_source_chain.empty ())
        throw std::runtime_error ("--source_chain must be set");

      const ash::Config cfg = FLAGS_config.empty ()
          ? ash::Config::Default ()
          : ash::Config::LoadFile (FLAGS_config);
      ash::Network network = ash::Network::Load (cfg, FLAGS_network);

      ash::RpcRegistry registry;

      ash::Blockchain chain;
      try
        {
          chain = FindSourceChain (network, FLAGS_source_chain);
        }
      catch (const ash::Error& exc)
        {
          if (exc.GetKind () != ash::ErrorKind::NotFound)
            throw;

          LOG (INFO)
              << "Source chain not configured, refreshing from the P-Chain";
          network.RefreshSubnets (registry);
          network.RefreshBlockchains (registry);
          chain = FindSourceChain (network, FLAGS_source_chain);
        }
      if (!FLAGS_rpc_url.empty ())
        chain.rpcUrl = FLAGS_rpc_url;

      network.RefreshValidators (registry, chain.subnetId);
      ash::Subnet subnet = network.GetSubnet (chain.subnetId);
      for (auto& c : subnet.blockchains)
        if (c.id == chain.id)
          c.rpcUrl = chain.rpcUrl;

      const size_t quorum = FLAGS_quorum < 0
          ? subnet.validators.size ()
          : static_cast<size_t> (FLAGS_quorum);

      ash::SignatureAggregator aggregator(registry);
      for (auto& msg : GetMessages (registry, chain))
        {
          aggregator.SignMessage (subnet, msg, quorum);
          LOG (INFO)
              << "Warp message " << msg.GetUnsignedMessage ().GetId ()
              << ": " << msg.GetStatus ();
          std::cout << ash::FormatJson (msg.ToJson ()) << std::endl;
        }
    }
  catch (const ash::Error& exc)
    {
      std::cerr << "Error (" << exc.GetKind () << "): " << exc.what ()
                << std::endl;
      return EXIT_FAILURE;
    }
  catch (const std::exception& exc)
    {
      std::cerr << "Error: " << exc.what () << std::endl;
      return EXIT_FAILURE;
    }

  return EXIT_SUCCESS;
}
