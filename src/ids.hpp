// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ASH_IDS_HPP
#define ASH_IDS_HPP

#include <cstddef>
#include <ostream>
#include <string>

namespace ash
{

/**
 * A binary identifier of fixed size, as used for Avalanche IDs (32 bytes)
 * and short IDs (20 bytes).  The textual representation is CB58.
 * A default-constructed instance is all zeros.
 */
template <size_t N>
  class FixedId
{

private:

  /** The raw bytes.  Always exactly N long.  */
  std::string bytes;

public:

  /** Size of the identifier in bytes.  */
  static constexpr size_t SIZE = N;

  FixedId ()
    : bytes(N, '\0')
  {}

  FixedId (const FixedId<N>&) = default;
  FixedId (FixedId<N>&&) = default;

  FixedId& operator= (const FixedId<N>&) = default;
  FixedId& operator= (FixedId<N>&&) = default;

  /**
   * Constructs the ID from binary data, which must have exactly the
   * right size.
   */
  static FixedId<N> FromBinary (const std::string& bin);

  /**
   * Parses the ID from its CB58 string.  Throws an InvalidId error
   * if the string is invalid.
   */
  static FixedId<N> FromCb58 (const std::string& str);

  /**
   * Tries to parse the ID from CB58.  Returns false if the string is
   * not a valid ID of the right size.
   */
  static bool TryFromCb58 (const std::string& str, FixedId<N>& res);

  const std::string&
  GetBinary () const
  {
    return bytes;
  }

  std::string ToCb58 () const;
  std::string ToHex () const;

  /**
   * Returns true if all bytes are zero.
   */
  bool IsNull () const;

  friend bool
  operator== (const FixedId<N>& a, const FixedId<N>& b)
  {
    return a.bytes == b.bytes;
  }

  friend bool
  operator!= (const FixedId<N>& a, const FixedId<N>& b)
  {
    return !(a == b);
  }

  friend bool
  operator< (const FixedId<N>& a, const FixedId<N>& b)
  {
    return a.bytes < b.bytes;
  }

  friend std::ostream&
  operator<< (std::ostream& out, const FixedId<N>& id)
  {
    out << id.ToCb58 ();
    return out;
  }

};

/** Avalanche 32-byte ID (Subnets, blockchains, transactions, messages).  */
using Id = FixedId<32>;

/** Avalanche 20-byte short ID.  */
using ShortId = FixedId<20>;

/**
 * ID of an Avalanche node.  This is a short ID that is represented
 * textually with a "NodeID-" prefix.
 */
class NodeId
{

private:

  /** The underlying short ID.  */
  ShortId id;

public:

  /** Prefix used in the textual representation.  */
  static constexpr const char* PREFIX = "NodeID-";

  NodeId () = default;

  explicit NodeId (const ShortId& i)
    : id(i)
  {}

  NodeId (const NodeId&) = default;
  NodeId (NodeId&&) = default;

  NodeId& operator= (const NodeId&) = default;
  NodeId& operator= (NodeId&&) = default;

  /**
   * Parses a node ID from its string form ("NodeID-" followed by CB58).
   * Throws InvalidId if the string is invalid.  Surrounding whitespace is
   * ignored.
   */
  static NodeId FromString (const std::string& str);

  /**
   * Tries to parse a node ID, returning false on failure.
   */
  static bool TryFromString (const std::string& str, NodeId& res);

  const ShortId&
  GetShortId () const
  {
    return id;
  }

  std::string ToString () const;

  friend bool
  operator== (const NodeId& a, const NodeId& b)
  {
    return a.id == b.id;
  }

  friend bool
  operator!= (const NodeId& a, const NodeId& b)
  {
    return !(a == b);
  }

  friend bool
  operator< (const NodeId& a, const NodeId& b)
  {
    return a.id < b.id;
  }

  friend std::ostream&
  operator<< (std::ostream& out, const NodeId& n)
  {
    out << n.ToString ();
    return out;
  }

};

/**
 * ID of the Primary Network.  It is also the ID of the P-Chain.
 * This is the all-zero ID, 11111111111111111111111111111111LpoYY.
 */
extern const Id PRIMARY_NETWORK_ID;

/** The anycast destination chain ID for Warp messages.  */
extern const char* const WARP_ANYCAST_ID;

} // namespace ash

#endif // ASH_IDS_HPP
