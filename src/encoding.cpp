// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "encoding.hpp"

#include <eth-utils/hexutils.hpp>

#include <libbase58.h>

#include <openssl/evp.h>

#include <glog/logging.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace ash
{

namespace
{

/** Length of the checksum appended in CB58.  */
constexpr size_t CB58_CHECKSUM_LEN = 4;

/**
 * Computes the CB58 checksum of some data, which is the last four bytes
 * of its SHA-256 hash.
 */
std::string
Cb58Checksum (const std::string& bin)
{
  const std::string hash = Sha256 (bin);
  return hash.substr (hash.size () - CB58_CHECKSUM_LEN);
}

} // anonymous namespace

std::string
Sha256 (const std::string& data)
{
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned mdLen;
  CHECK_EQ (EVP_Digest (data.data (), data.size (), md, &mdLen,
                        EVP_sha256 (), nullptr), 1)
      << "EVP_Digest failed for SHA-256";
  CHECK_EQ (mdLen, 32);

  return std::string (reinterpret_cast<const char*> (md), mdLen);
}

std::string
EncodeBase58 (const std::string& bin)
{
  /* Each byte needs less than 1.38 Base58 digits.  */
  std::vector<char> buf(2 * bin.size () + 2);
  size_t len = buf.size ();
  CHECK (b58enc (buf.data (), &len, bin.data (), bin.size ()))
      << "b58enc failed for " << bin.size () << " bytes";
  CHECK_GT (len, 0);

  /* len includes the terminating null character.  */
  return std::string (buf.data (), len - 1);
}

bool
DecodeBase58 (const std::string& str, std::string& bin)
{
  std::vector<unsigned char> buf(str.size () + 1);
  size_t len = buf.size ();
  if (!b58tobin (buf.data (), &len, str.data (), str.size ()))
    return false;

  /* The decoded data is placed at the end of the buffer.  */
  CHECK_LE (len, buf.size ());
  bin.assign (reinterpret_cast<const char*> (buf.data ()) + buf.size () - len,
              len);
  return true;
}

std::string
EncodeCb58 (const std::string& bin)
{
  return EncodeBase58 (bin + Cb58Checksum (bin));
}

bool
DecodeCb58 (const std::string& str, std::string& bin)
{
  std::string raw;
  if (!DecodeBase58 (str, raw))
    return false;
  if (raw.size () < CB58_CHECKSUM_LEN)
    return false;

  const size_t dataLen = raw.size () - CB58_CHECKSUM_LEN;
  const std::string data = raw.substr (0, dataLen);
  if (raw.substr (dataLen) != Cb58Checksum (data))
    return false;

  bin = data;
  return true;
}

std::string
EncodeHex (const std::string& bin)
{
  return "0x" + ethutils::Hexlify (bin);
}

bool
DecodeHex (const std::string& hex, std::string& bin)
{
  if (hex.substr (0, 2) == "0x" || hex.substr (0, 2) == "0X")
    return ethutils::Unhexlify (hex.substr (2), bin);
  return ethutils::Unhexlify (hex, bin);
}

bool
ParseUint64 (const std::string& str, uint64_t& res)
{
  const bool isHex = (str.substr (0, 2) == "0x" || str.substr (0, 2) == "0X");
  std::string digits = str.substr (isHex ? 2 : 0);
  if (digits.empty ()
        || digits.find_first_not_of (isHex ? "0123456789abcdefABCDEF"
                                           : "0123456789")
              != std::string::npos)
    return false;

  std::istringstream in(digits);
  if (isHex)
    in >> std::hex;
  uint64_t val;
  in >> val;
  if (in.fail ())
    return false;

  /* Verify that we did not overflow by encoding back to a string and
     checking it against the input without leading zeros.  */
  std::ostringstream out;
  if (isHex)
    out << std::hex;
  out << val;

  std::transform (digits.begin (), digits.end (), digits.begin (),
                  [] (const unsigned char c) { return std::tolower (c); });
  const size_t firstNonZero = digits.find_first_not_of ('0');
  digits.erase (0, std::min (firstNonZero, digits.size () - 1));
  if (out.str () != digits)
    return false;

  res = val;
  return true;
}

uint32_t
ReadUint32BE (const std::string& data, const size_t pos)
{
  CHECK_LE (pos + 4, data.size ());

  uint32_t res = 0;
  for (size_t i = 0; i < 4; ++i)
    res = (res << 8) | static_cast<uint8_t> (data[pos + i]);

  return res;
}

void
WriteUint32BE (const uint32_t val, std::string& out)
{
  for (int shift = 24; shift >= 0; shift -= 8)
    out.push_back (static_cast<char> ((val >> shift) & 0xFF));
}

} // namespace ash
