// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ASH_WARP_HPP
#define ASH_WARP_HPP

#include "ids.hpp"

#include <json/json.h>

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace ash
{

/** Size of an EVM address in bytes.  */
constexpr size_t EVM_ADDRESS_SIZE = 20;

/**
 * Subnet-EVM addressed payload, which is the payload of Warp messages
 * sent through the WarpMessenger precompile.
 *
 * The wire layout is:
 *  [0..4]    length of the remaining data (big endian)
 *  [4..10]   reserved
 *  [10..30]  source address
 *  [30..62]  destination chain ID
 *  [62..82]  destination address
 *  [82..]    payload
 */
struct AddressedPayload
{

  /** Minimum size in bytes of an encoded payload.  */
  static constexpr size_t MIN_SIZE = 88;

  /** The source address as 20 bytes binary.  */
  std::string sourceAddress;

  /** The destination chain's ID.  */
  Id destinationChainId;

  /** The destination address as 20 bytes binary.  */
  std::string destinationAddress;

  /** The raw (usually ABI encoded) payload bytes.  */
  std::string payload;

  AddressedPayload () = default;
  AddressedPayload (const AddressedPayload&) = default;
  AddressedPayload (AddressedPayload&&) = default;

  AddressedPayload& operator= (const AddressedPayload&) = default;
  AddressedPayload& operator= (AddressedPayload&&) = default;

  /**
   * Decodes an addressed payload from its binary representation.  Throws
   * PayloadTooShort if the data is shorter than the minimum size, and
   * PayloadIntegrity if the length prefix does not match.
   */
  static AddressedPayload Decode (const std::string& bytes);

  /**
   * Encodes the payload into its wire format (with zero reserved bytes).
   */
  std::string Encode () const;

  Json::Value ToJson () const;

  friend bool
  operator== (const AddressedPayload& a, const AddressedPayload& b)
  {
    return a.sourceAddress == b.sourceAddress
            && a.destinationChainId == b.destinationChainId
            && a.destinationAddress == b.destinationAddress
            && a.payload == b.payload;
  }

  friend bool
  operator!= (const AddressedPayload& a, const AddressedPayload& b)
  {
    return !(a == b);
  }

};

/**
 * The payload of an unsigned Warp message.  The wire format has no tag
 * that tells which format the payload is in, so decoding it is best effort.
 * If it cannot be interpreted, the payload is of kind Unknown and only
 * the raw bytes are available.
 */
struct WarpPayload
{

  enum class Kind
  {
    Unknown,
    Addressed,
  };

  Kind kind = Kind::Unknown;

  /** The raw payload bytes.  Always set.  */
  std::string raw;

  /** The decoded addressed payload, if kind is Addressed.  */
  AddressedPayload addressed;

  Json::Value ToJson () const;

};

/**
 * An unsigned Warp message, as emitted by a source chain.  The message ID
 * is the SHA-256 hash of the full encoded bytes.
 *
 * The wire layout is:
 *  [0..2]    reserved
 *  [2..6]    network ID (big endian)
 *  [6..38]   source chain ID
 *  [38..]    payload
 */
class UnsignedMessage
{

private:

  /** The message ID, derived from the bytes.  */
  Id id;

  /** The network ID.  */
  uint32_t networkId = 0;

  /** The source blockchain's ID.  */
  Id sourceChainId;

  /** The payload.  */
  WarpPayload payload;

  /** The full encoded message.  */
  std::string bytes;

public:

  /** Size of the fixed header in bytes.  */
  static constexpr size_t HEADER_SIZE = 38;

  UnsignedMessage () = default;
  UnsignedMessage (const UnsignedMessage&) = default;
  UnsignedMessage (UnsignedMessage&&) = default;

  UnsignedMessage& operator= (const UnsignedMessage&) = default;
  UnsignedMessage& operator= (UnsignedMessage&&) = default;

  /**
   * Decodes the message with its payload treated as opaque bytes.
   * Throws PayloadTooShort if the data does not even contain the header.
   */
  static UnsignedMessage Decode (const std::string& bytes);

  /**
   * Decodes the message and tries to interpret the payload as addressed
   * payload.  If that fails, the payload is left as Unknown.
   */
  static UnsignedMessage DecodeBestEffort (const std::string& bytes);

  const Id&
  GetId () const
  {
    return id;
  }

  uint32_t
  GetNetworkId () const
  {
    return networkId;
  }

  const Id&
  GetSourceChainId () const
  {
    return sourceChainId;
  }

  const WarpPayload&
  GetPayload () const
  {
    return payload;
  }

  const std::string&
  GetBytes () const
  {
    return bytes;
  }

  Json::Value ToJson () const;

};

/**
 * The Subnet-EVM specific interpretation of a Warp message, reconstructed
 * from the SendWarpMessage event log of the WarpMessenger precompile.
 */
struct SubnetEvmWarpMessage
{

  Id originChainId;
  std::string originSenderAddress;
  Id destinationChainId;
  std::string destinationAddress;

  /** True if the message payload was decoded as addressed payload.  */
  bool hasPayload = false;
  /** The addressed payload's inner bytes, if hasPayload.  */
  std::string payload;

  Json::Value ToJson () const;

};

/** Address of the WarpMessenger precompile on Subnet-EVM chains.  */
extern const char* const WARP_PRECOMPILE_ADDRESS;

/**
 * Derived state of a Warp message.
 */
struct WarpStatus
{

  enum class Kind
  {
    Sent,
    Signed,
  };

  Kind kind = Kind::Sent;

  /** Number of signatures, if Signed.  */
  size_t signatures = 0;

  friend bool
  operator== (const WarpStatus& a, const WarpStatus& b)
  {
    return a.kind == b.kind && a.signatures == b.signatures;
  }

  friend bool
  operator!= (const WarpStatus& a, const WarpStatus& b)
  {
    return !(a == b);
  }

  friend std::ostream& operator<< (std::ostream& out, const WarpStatus& s);

};

/**
 * The signature of one validator over a Warp message.
 */
struct ValidatorSignature
{

  /** Size of a BLS signature in bytes.  */
  static constexpr size_t SIZE = 96;

  NodeId nodeId;

  /** The raw signature bytes.  */
  std::string signature;

  friend bool
  operator== (const ValidatorSignature& a, const ValidatorSignature& b)
  {
    return a.nodeId == b.nodeId && a.signature == b.signature;
  }

};

/**
 * A Warp message being tracked by the client:  The unsigned message,
 * optionally its VM-specific interpretation, and the signatures collected
 * so far from validators.
 */
class WarpMessage
{

private:

  UnsignedMessage unsignedMessage;

  /** Whether we have a verified VM-specific message.  */
  bool hasVerified = false;

  /** The Subnet-EVM message, if hasVerified.  */
  SubnetEvmWarpMessage verified;

  /** Collected signatures, in insertion order and unique by node ID.  */
  std::vector<ValidatorSignature> signatures;

public:

  WarpMessage () = default;

  explicit WarpMessage (const UnsignedMessage& msg)
    : unsignedMessage(msg)
  {}

  WarpMessage (const WarpMessage&) = default;
  WarpMessage (WarpMessage&&) = default;

  WarpMessage& operator= (const WarpMessage&) = default;
  WarpMessage& operator= (WarpMessage&&) = default;

  /**
   * Constructs a message from a SendWarpMessage log of the WarpMessenger
   * precompile.  The topics are the binary 32-byte log topics, and the
   * data is the log's data, which is the unsigned message.
   */
  static WarpMessage FromSubnetEvmLog (const std::vector<std::string>& topics,
                                       const std::string& data);

  const UnsignedMessage&
  GetUnsignedMessage () const
  {
    return unsignedMessage;
  }

  bool
  HasVerifiedMessage () const
  {
    return hasVerified;
  }

  const SubnetEvmWarpMessage&
  GetVerifiedMessage () const
  {
    return verified;
  }

  const std::vector<ValidatorSignature>&
  GetSignatures () const
  {
    return signatures;
  }

  /**
   * Adds a signature from the given validator.  Returns false (and does
   * nothing) if there is already a signature from that validator.  Throws
   * InvalidSignature if the signature does not have the right size.
   */
  bool AddSignature (const NodeId& nodeId, const std::string& sig);

  /**
   * Returns true if there is a signature from the given validator.
   */
  bool HasSignature (const NodeId& nodeId) const;

  WarpStatus GetStatus () const;

  Json::Value ToJson () const;

};

} // namespace ash

#endif // ASH_WARP_HPP
