// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ASH_NETWORK_HPP
#define ASH_NETWORK_HPP

#include "ids.hpp"

#include <json/json.h>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace ash
{

class Config;
class RegistryClient;

/**
 * Classification of a Subnet.
 */
enum class SubnetType
{
  PrimaryNetwork,
  Permissioned,
  Elastic,
};

std::string SubnetTypeToString (SubnetType t);
std::ostream& operator<< (std::ostream& out, SubnetType t);

/**
 * Parses a Subnet type from its string form.  Returns false if the
 * string is not a known type.
 */
bool SubnetTypeFromString (const std::string& str, SubnetType& res);

/**
 * Classifies a Subnet based on its ID and signing threshold as returned
 * by the P-Chain.
 */
SubnetType ClassifySubnet (const Id& id, uint32_t threshold);

/**
 * A blockchain hosted on some Subnet.
 */
struct Blockchain
{

  Id id;

  /** The human-readable name, e.g. "C-Chain".  */
  std::string name;

  /** ID of the Subnet this chain belongs to.  */
  Id subnetId;

  /**
   * The type of VM (e.g. "SubnetEVM" or "PlatformVM").  This is not
   * known to the P-Chain and only set from configuration.
   */
  std::string vmType;

  Id vmId;

  /** RPC endpoint URL.  Empty if not known.  */
  std::string rpcUrl;

  Json::Value ToJson () const;

  friend bool
  operator== (const Blockchain& a, const Blockchain& b)
  {
    return a.id == b.id && a.name == b.name && a.subnetId == b.subnetId
            && a.vmType == b.vmType && a.vmId == b.vmId
            && a.rpcUrl == b.rpcUrl;
  }

  friend bool
  operator!= (const Blockchain& a, const Blockchain& b)
  {
    return !(a == b);
  }

};

/**
 * Owner specification for rewards (secp256k1 output owners).
 */
struct OutputOwners
{

  uint64_t locktime = 0;
  uint32_t threshold = 0;
  std::vector<std::string> addresses;

  friend bool
  operator== (const OutputOwners& a, const OutputOwners& b)
  {
    return a.locktime == b.locktime && a.threshold == b.threshold
            && a.addresses == b.addresses;
  }

};

/**
 * BLS signer of a validator, i.e. its public key and proof of possession
 * (both as raw bytes).
 */
struct BlsSigner
{

  std::string publicKey;
  std::string proofOfPossession;

  friend bool
  operator== (const BlsSigner& a, const BlsSigner& b)
  {
    return a.publicKey == b.publicKey
            && a.proofOfPossession == b.proofOfPossession;
  }

};

/**
 * A delegator of stake to a Primary Network validator.
 */
struct Delegator
{

  Id txId;
  NodeId nodeId;
  uint64_t startTime = 0;
  uint64_t endTime = 0;
  uint64_t stakeAmount = 0;
  uint64_t potentialReward = 0;

  bool hasRewardOwner = false;
  OutputOwners rewardOwner;

  friend bool
  operator== (const Delegator& a, const Delegator& b)
  {
    return a.txId == b.txId && a.nodeId == b.nodeId
            && a.startTime == b.startTime && a.endTime == b.endTime
            && a.stakeAmount == b.stakeAmount
            && a.potentialReward == b.potentialReward
            && a.hasRewardOwner == b.hasRewardOwner
            && (!a.hasRewardOwner || a.rewardOwner == b.rewardOwner);
  }

};

/**
 * A validator of a Subnet.  Which of the fields are set depends on the
 * Subnet type (e.g. stake and rewards only for the Primary Network
 * and Elastic Subnets).
 */
struct Validator
{

  NodeId nodeId;
  Id txId;

  uint64_t startTime = 0;
  uint64_t endTime = 0;

  /** Weight on permissioned Subnets.  */
  uint64_t weight = 0;
  /** Staked amount on the Primary Network and Elastic Subnets.  */
  uint64_t stakeAmount = 0;

  uint64_t potentialReward = 0;
  double delegationFee = 0.0;

  /** Whether the node is currently connected to the queried node.  */
  bool connected = false;
  double uptime = 0.0;

  bool hasValidationRewardOwner = false;
  OutputOwners validationRewardOwner;
  bool hasDelegationRewardOwner = false;
  OutputOwners delegationRewardOwner;

  uint64_t delegatorCount = 0;
  uint64_t delegatorWeight = 0;
  std::vector<Delegator> delegators;

  bool hasSigner = false;
  BlsSigner signer;

  Json::Value ToJson () const;

  friend bool
  operator== (const Validator& a, const Validator& b)
  {
    return a.nodeId == b.nodeId && a.txId == b.txId
            && a.startTime == b.startTime && a.endTime == b.endTime
            && a.weight == b.weight && a.stakeAmount == b.stakeAmount
            && a.potentialReward == b.potentialReward
            && a.delegationFee == b.delegationFee
            && a.connected == b.connected && a.uptime == b.uptime
            && a.delegatorCount == b.delegatorCount
            && a.delegatorWeight == b.delegatorWeight
            && a.delegators == b.delegators
            && a.hasSigner == b.hasSigner
            && (!a.hasSigner || a.signer == b.signer);
  }

};

/**
 * A Subnet with its blockchains and validators.
 */
struct Subnet
{

  Id id;
  SubnetType type = SubnetType::Permissioned;

  std::vector<std::string> controlKeys;
  uint32_t threshold = 0;

  std::vector<Blockchain> blockchains;

  /** Current validators.  Replaced as a whole on refresh.  */
  std::vector<Validator> validators;
  /** Pending validators.  Replaced as a whole on refresh.  */
  std::vector<Validator> pendingValidators;

  /**
   * Looks up a blockchain by ID.  Throws NotFound if there is none.
   */
  const Blockchain& GetBlockchain (const Id& chainId) const;

  /**
   * Looks up a blockchain by name.  Throws NotFound if there is none.
   */
  const Blockchain& GetBlockchainByName (const std::string& name) const;

  /**
   * Looks up a current validator by node ID.  Throws NotFound if there
   * is none.
   */
  const Validator& GetValidator (const NodeId& nodeId) const;

  /**
   * Checks whether a validator of the given kind (elastic meaning staked
   * like on the Primary Network) can be added to this Subnet.  Throws
   * OperationNotAllowed if not.
   */
  void CheckValidatorKind (bool elastic) const;

  Json::Value ToJson () const;

};

/**
 * Merges a remote Subnet listing into the local Subnets.  Existing Subnets
 * get their control keys, threshold and type updated, new ones are
 * appended.  Local Subnets missing from the remote list are kept.
 */
void MergeSubnets (std::vector<Subnet>& local,
                   const std::vector<Subnet>& remote);

/**
 * Merges a remote blockchain listing into the given local Subnets.
 * Blockchains are matched by name within their Subnet.  Matched chains
 * have their ID, VM ID and Subnet ID updated while their RPC URL and VM
 * type are kept.  Unmatched remote chains are appended, and local chains
 * are never removed.  Remote chains of Subnets that are not known locally
 * are ignored.
 */
void MergeBlockchains (std::vector<Subnet>& local,
                       const std::vector<Blockchain>& remote);

/**
 * Replaces a validator collection wholesale with a fresh snapshot.
 */
void ReplaceValidators (std::vector<Validator>& local,
                        std::vector<Validator> remote);

/**
 * An Avalanche network (e.g. mainnet or fuji) with all its known Subnets.
 * Lookups throw errors for missing entries.  Refreshes either complete
 * or leave the state as it was.  Instances are not thread-safe.
 */
class Network
{

private:

  /** The network's name.  */
  std::string name;

  /** All Subnets, including the Primary Network.  */
  std::vector<Subnet> subnets;

  /**
   * Returns a mutable Subnet by ID, or null if there is none.
   */
  Subnet* FindSubnet (const Id& subnetId);

public:

  Network () = default;

  explicit Network (const std::string& n)
    : name(n)
  {}

  Network (const Network&) = default;
  Network (Network&&) = default;

  Network& operator= (const Network&) = default;
  Network& operator= (Network&&) = default;

  /**
   * Loads the named network from the configuration.  Throws ConfigNotFound
   * if the network is not configured, and NotFound if it has no Primary
   * Network or no P-Chain.
   */
  static Network Load (const Config& cfg, const std::string& name);

  const std::string&
  GetName () const
  {
    return name;
  }

  const std::vector<Subnet>&
  GetSubnets () const
  {
    return subnets;
  }

  /**
   * Adds a Subnet.  Its ID must not be known yet.
   */
  void AddSubnet (const Subnet& subnet);

  const Subnet& GetSubnet (const Id& subnetId) const;
  const Subnet& GetPrimarySubnet () const;

  const Blockchain& GetPChain () const;
  const Blockchain& GetCChain () const;
  const Blockchain& GetXChain () const;

  /**
   * Looks up a blockchain on any Subnet by ID.  Throws NotFound.
   */
  const Blockchain& GetBlockchain (const Id& chainId) const;

  /**
   * Looks up a blockchain on any Subnet by name.  Throws NotFound.
   */
  const Blockchain& GetBlockchainByName (const std::string& name) const;

  /**
   * Updates the Subnets from the registry with MergeSubnets.
   */
  void RefreshSubnets (RegistryClient& registry);

  /**
   * Updates the blockchains of all Subnets from the registry with
   * MergeBlockchains.
   */
  void RefreshBlockchains (RegistryClient& registry);

  /**
   * Replaces the current validators of the given Subnet with a fresh
   * list from the registry.  Throws SubnetNotFound if the Subnet is
   * not known.
   */
  void RefreshValidators (RegistryClient& registry, const Id& subnetId);

  /**
   * Replaces the pending validators of the given Subnet.
   */
  void RefreshPendingValidators (RegistryClient& registry,
                                 const Id& subnetId);

  /**
   * Throws OperationNotAllowed if this network's name is part of the
   * blacklist for the given operation.
   */
  void CheckOperationAllowed (const std::string& operation,
                              const std::vector<std::string>& blacklist) const;

  Json::Value ToJson () const;

};

} // namespace ash

#endif // ASH_NETWORK_HPP
