// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ASH_AGGREGATOR_HPP
#define ASH_AGGREGATOR_HPP

#include "network.hpp"
#include "registry.hpp"
#include "warp.hpp"

#include <cstddef>
#include <vector>

namespace ash
{

/**
 * Helper class that collects signatures over a Warp message from the
 * validators of a Subnet.  The validators are contacted through the node
 * serving the source chain's RPC endpoint (if it is a validator itself)
 * or through their public IPs as reported by that node's peer list.
 *
 * Requests to individual validators run in parallel on a bounded number
 * of worker threads.  No more requests are started than are needed to
 * reach the quorum, assuming all in-flight requests succeed.
 */
class SignatureAggregator
{

private:

  /** The registry used for all remote calls.  */
  RegistryClient& registry;

  /** Maximum number of requests running at the same time.  */
  size_t parallelism;

public:

  /**
   * Constructs the aggregator, with the parallelism set from
   * --warp_signature_parallelism.
   */
  explicit SignatureAggregator (RegistryClient& r);

  SignatureAggregator () = delete;
  SignatureAggregator (const SignatureAggregator&) = delete;
  void operator= (const SignatureAggregator&) = delete;

  /**
   * Overrides the number of parallel requests.  Must be at least one.
   */
  void SetParallelism (size_t n);

  /**
   * Collects signatures over the given message until quorum of them have
   * been obtained or all validators have been tried.  The result is
   * ordered like the Subnet's validators and has at most one entry
   * per node.
   *
   * Throws UnknownSourceChain if the message's source chain is not part
   * of the Subnet, InvalidUrl if the chain's RPC URL cannot be parsed,
   * and any registry error from querying the endpoint node itself.
   * Failures for individual validators are logged and skipped.
   */
  std::vector<ValidatorSignature> CollectSignatures (
      const Subnet& subnet, const UnsignedMessage& msg, size_t quorum);

  /**
   * Collects signatures with a quorum of all validators.
   */
  std::vector<ValidatorSignature> CollectSignatures (
      const Subnet& subnet, const UnsignedMessage& msg);

  /**
   * Collects signatures for the message and adds them.  Returns the
   * number of new signatures.
   */
  size_t SignMessage (const Subnet& subnet, WarpMessage& msg, size_t quorum);

};

} // namespace ash

#endif // ASH_AGGREGATOR_HPP
