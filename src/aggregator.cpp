// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "aggregator.hpp"

#include "errors.hpp"
#include "rpcutils.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <algorithm>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace ash
{

DEFINE_int32 (warp_signature_parallelism, 8,
              "maximum number of validators queried in parallel for"
              " Warp message signatures");

namespace
{

/**
 * Shared state of the workers during one round of signature collection.
 */
struct CollectionState
{

  /** Validators to query, in order.  */
  const std::vector<Validator>& validators;

  /**
   * For each validator, the RPC URL to query or empty if the validator
   * cannot be reached.
   */
  const std::vector<std::string>& endpoints;

  /** The message to request signatures for.  */
  const Id& messageId;

  /** Number of signatures we want.  */
  const size_t quorum;

  /** Lock for the mutable state.  */
  std::mutex mut;

  /** Notified whenever a request finishes.  */
  std::condition_variable cv;

  /** Next validator index to dispatch.  */
  size_t next = 0;

  /** Number of requests currently running.  */
  size_t inFlight = 0;

  /** Number of signatures obtained so far.  */
  size_t successes = 0;

  /** For each validator, whether we got a signature.  */
  std::vector<bool> haveSignature;

  /** For each validator, the signature if we got one.  */
  std::vector<std::string> signatures;

  CollectionState (const std::vector<Validator>& v,
                   const std::vector<std::string>& ep,
                   const Id& id, const size_t q)
    : validators(v), endpoints(ep), messageId(id), quorum(q),
      haveSignature(v.size (), false), signatures(v.size ())
  {}

};

/**
 * Requests the signature of one validator.  Returns false if that failed
 * for whatever reason.
 */
bool
RequestSignature (RegistryClient& registry, const Validator& val,
                  const std::string& endpoint, const Id& messageId,
                  std::string& sig)
{
  try
    {
      VLOG (1) << "Requesting signature from " << val.nodeId
               << " at " << endpoint;
      sig = registry.GetValidatorSignature (endpoint, messageId);
    }
  catch (const Error& exc)
    {
      LOG (WARNING)
          << "Failed to get signature from " << val.nodeId
          << ": " << exc.what ();
      return false;
    }

  if (sig.size () != ValidatorSignature::SIZE)
    {
      LOG (WARNING)
          << "Validator " << val.nodeId << " returned a signature of "
          << sig.size () << " bytes";
      return false;
    }

  return true;
}

/**
 * Runs the work loop of one worker thread.
 */
void
RunWorker (RegistryClient& registry, CollectionState& state)
{
  std::unique_lock<std::mutex> lock(state.mut);
  while (true)
    {
      if (state.successes >= state.quorum)
        break;

      /* Skip over validators we cannot reach at all.  */
      while (state.next < state.validators.size ()
                && state.endpoints[state.next].empty ())
        ++state.next;
      if (state.next >= state.validators.size ())
        break;

      /* Wait for running requests if they are enough to reach the quorum
         when successful.  */
      if (state.inFlight + state.successes >= state.quorum)
        {
          state.cv.wait (lock);
          continue;
        }

      const size_t idx = state.next++;
      ++state.inFlight;
      lock.unlock ();

      std::string sig;
      const bool ok
          = RequestSignature (registry, state.validators[idx],
                              state.endpoints[idx], state.messageId, sig);

      lock.lock ();
      --state.inFlight;
      if (ok)
        {
          state.haveSignature[idx] = true;
          state.signatures[idx] = std::move (sig);
          ++state.successes;
        }
      state.cv.notify_all ();
    }
}

} // anonymous namespace

SignatureAggregator::SignatureAggregator (RegistryClient& r)
  : registry(r)
{
  SetParallelism (FLAGS_warp_signature_parallelism);
}

void
SignatureAggregator::SetParallelism (const size_t n)
{
  CHECK_GT (n, 0) << "Signature parallelism must be positive";
  parallelism = n;
}

std::vector<ValidatorSignature>
SignatureAggregator::CollectSignatures (const Subnet& subnet,
                                        const UnsignedMessage& msg)
{
  return CollectSignatures (subnet, msg, subnet.validators.size ());
}

std::vector<ValidatorSignature>
SignatureAggregator::CollectSignatures (const Subnet& subnet,
                                        const UnsignedMessage& msg,
                                        const size_t quorum)
{
  const Id& chainId = msg.GetSourceChainId ();

  const Blockchain* chain = nullptr;
  try
    {
      chain = &subnet.GetBlockchain (chainId);
    }
  catch (const Error& exc)
    {
      if (exc.GetKind () != ErrorKind::NotFound)
        throw;
      throw Error (ErrorKind::UnknownSourceChain,
                   "source chain " + chainId.ToCb58 ()
                      + " of Warp message " + msg.GetId ().ToCb58 ()
                      + " is not part of Subnet " + subnet.id.ToCb58 ());
    }

  std::vector<ValidatorSignature> res;
  if (quorum == 0)
    return res;

  EndpointUrl url;
  if (!ParseEndpointUrl (chain->rpcUrl, "/ext/bc/" + chainId.ToCb58 () + "/rpc",
                         url))
    throw Error (ErrorKind::InvalidUrl,
                 "invalid RPC URL '" + chain->rpcUrl + "' for blockchain "
                    + chain->name);

  AvalancheNode endpointNode;
  endpointNode.scheme = url.scheme;
  endpointNode.host = url.host;
  endpointNode.httpPort = url.port;
  endpointNode.userinfo = url.userinfo;
  endpointNode.query = url.query;
  const std::string infoEndpoint = endpointNode.GetInfoEndpoint ();

  const NodeInfo self = registry.GetNodeInfo (infoEndpoint);
  VLOG (1) << "RPC endpoint " << url.ToString () << " is node " << self.nodeId;

  std::vector<NodeId> validatorIds;
  for (const auto& v : subnet.validators)
    validatorIds.push_back (v.nodeId);

  std::map<NodeId, Peer> peers;
  try
    {
      for (const auto& p : registry.ListPeers (infoEndpoint, validatorIds))
        peers.emplace (p.nodeId, p);
    }
  catch (const Error& exc)
    {
      LOG (WARNING)
          << "Peer discovery through " << infoEndpoint
          << " failed, only the endpoint node can sign: " << exc.what ();
    }

  std::vector<std::string> endpoints;
  std::set<NodeId> queued;
  for (const auto& v : subnet.validators)
    {
      /* Each node is asked at most once, so that repeated entries do not
         count twice towards the quorum.  */
      if (!queued.insert (v.nodeId).second)
        {
          VLOG (1) << "Skipping repeated validator entry " << v.nodeId;
          endpoints.emplace_back ();
          continue;
        }

      if (v.nodeId == self.nodeId)
        {
          endpoints.push_back (url.ToString ());
          continue;
        }

      const auto mit = peers.find (v.nodeId);
      if (mit == peers.end () || mit->second.stakingPort < 2)
        {
          const Error err = Error::Lookup (ErrorKind::PeerNotFound, "peer",
                                           v.nodeId.ToString (),
                                           "peers of " + infoEndpoint);
          LOG (WARNING) << err.what ();
          endpoints.emplace_back ();
          continue;
        }

      EndpointUrl peerUrl = url;
      peerUrl.host = mit->second.ip;
      peerUrl.port = mit->second.stakingPort - 1;
      /* Credentials of the endpoint are not sent to other nodes.  */
      peerUrl.userinfo.clear ();
      peerUrl.query.clear ();
      endpoints.push_back (peerUrl.ToString ());
    }

  CollectionState state(subnet.validators, endpoints, msg.GetId (), quorum);

  const size_t numWorkers
      = std::min (parallelism, std::min (quorum, subnet.validators.size ()));
  std::vector<std::thread> workers;
  for (size_t i = 0; i < numWorkers; ++i)
    workers.emplace_back ([this, &state] ()
      {
        RunWorker (registry, state);
      });
  for (auto& w : workers)
    w.join ();

  std::set<NodeId> seen;
  for (size_t i = 0; i < subnet.validators.size (); ++i)
    {
      if (!state.haveSignature[i])
        continue;

      const NodeId& nodeId = subnet.validators[i].nodeId;
      if (!seen.insert (nodeId).second)
        continue;

      ValidatorSignature entry;
      entry.nodeId = nodeId;
      entry.signature = state.signatures[i];
      res.push_back (std::move (entry));
    }

  LOG (INFO)
      << "Collected " << res.size () << " signatures (quorum " << quorum
      << ") for Warp message " << msg.GetId ()
      << " from " << subnet.validators.size () << " validators";

  return res;
}

size_t
SignatureAggregator::SignMessage (const Subnet& subnet, WarpMessage& msg,
                                  const size_t quorum)
{
  const auto sigs = CollectSignatures (subnet, msg.GetUnsignedMessage (),
                                       quorum);

  size_t added = 0;
  for (const auto& s : sigs)
    if (msg.AddSignature (s.nodeId, s.signature))
      ++added;

  return added;
}

} // namespace ash
