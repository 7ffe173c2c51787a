// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ids.hpp"

#include "encoding.hpp"
#include "errors.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace ash
{

const Id PRIMARY_NETWORK_ID;

const char* const WARP_ANYCAST_ID
    = "2wkBET2rRgE8pahuaczxKbmv7ciehqsne57F9gtzf1PVcUJEQG";

template <size_t N>
  FixedId<N>
  FixedId<N>::FromBinary (const std::string& bin)
{
  CHECK_EQ (bin.size (), N) << "Invalid binary ID size";

  FixedId<N> res;
  res.bytes = bin;

  return res;
}

template <size_t N>
  bool
  FixedId<N>::TryFromCb58 (const std::string& str, FixedId<N>& res)
{
  std::string bin;
  if (!DecodeCb58 (str, bin) || bin.size () != N)
    return false;

  res.bytes = bin;
  return true;
}

template <size_t N>
  FixedId<N>
  FixedId<N>::FromCb58 (const std::string& str)
{
  FixedId<N> res;
  if (!TryFromCb58 (str, res))
    throw Error (ErrorKind::InvalidId, "'" + str + "' is not a valid ID");

  return res;
}

template <size_t N>
  std::string
  FixedId<N>::ToCb58 () const
{
  return EncodeCb58 (bytes);
}

template <size_t N>
  std::string
  FixedId<N>::ToHex () const
{
  return EncodeHex (bytes);
}

template <size_t N>
  bool
  FixedId<N>::IsNull () const
{
  return std::all_of (bytes.begin (), bytes.end (),
                      [] (const char c) { return c == '\0'; });
}

template class FixedId<32>;
template class FixedId<20>;

/* ************************************************************************** */

namespace
{

/**
 * Strips whitespace from both ends of a string.
 */
std::string
Trim (const std::string& str)
{
  const auto begin = str.find_first_not_of (" \t\n\r");
  if (begin == std::string::npos)
    return "";
  const auto end = str.find_last_not_of (" \t\n\r");
  return str.substr (begin, end - begin + 1);
}

} // anonymous namespace

bool
NodeId::TryFromString (const std::string& str, NodeId& res)
{
  const std::string trimmed = Trim (str);
  const std::string prefix(PREFIX);
  if (trimmed.substr (0, prefix.size ()) != prefix)
    return false;

  return ShortId::TryFromCb58 (trimmed.substr (prefix.size ()), res.id);
}

NodeId
NodeId::FromString (const std::string& str)
{
  NodeId res;
  if (!TryFromString (str, res))
    throw Error (ErrorKind::InvalidId,
                 "'" + str + "' is not a valid node ID");

  return res;
}

std::string
NodeId::ToString () const
{
  return PREFIX + id.ToCb58 ();
}

} // namespace ash
