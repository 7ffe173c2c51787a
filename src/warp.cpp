// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "warp.hpp"

#include "encoding.hpp"
#include "errors.hpp"

#include <glog/logging.h>

#include <sstream>

namespace ash
{

const char* const WARP_PRECOMPILE_ADDRESS
    = "0x0200000000000000000000000000000000000005";

namespace
{

/** Size of the length prefix in the addressed payload.  */
constexpr size_t LENGTH_PREFIX_SIZE = 4;

/** Number of reserved bytes after the length prefix.  */
constexpr size_t ADDRESSED_RESERVED_SIZE = 6;

/** Number of reserved bytes at the start of the unsigned message.  */
constexpr size_t MESSAGE_RESERVED_SIZE = 2;

/** Size of an event log topic.  */
constexpr size_t TOPIC_SIZE = 32;

/**
 * Extracts an EVM address from a 32-byte log topic, where it is stored
 * in the last 20 bytes.
 */
std::string
AddressFromTopic (const std::string& topic)
{
  CHECK_EQ (topic.size (), TOPIC_SIZE);
  return topic.substr (TOPIC_SIZE - EVM_ADDRESS_SIZE);
}

} // anonymous namespace

/* ************************************************************************** */

AddressedPayload
AddressedPayload::Decode (const std::string& bytes)
{
  if (bytes.size () < MIN_SIZE)
    {
      std::ostringstream msg;
      msg << "addressed payload has " << bytes.size ()
          << " bytes, expected at least " << MIN_SIZE;
      throw Error (ErrorKind::PayloadTooShort, msg.str ());
    }

  const uint32_t len = ReadUint32BE (bytes, 0);
  if (static_cast<uint64_t> (len) + LENGTH_PREFIX_SIZE != bytes.size ())
    {
      std::ostringstream msg;
      msg << "addressed payload length prefix " << len
          << " does not match total size " << bytes.size ();
      throw Error (ErrorKind::PayloadIntegrity, msg.str ());
    }

  size_t pos = LENGTH_PREFIX_SIZE + ADDRESSED_RESERVED_SIZE;

  AddressedPayload res;
  res.sourceAddress = bytes.substr (pos, EVM_ADDRESS_SIZE);
  pos += EVM_ADDRESS_SIZE;
  res.destinationChainId = Id::FromBinary (bytes.substr (pos, Id::SIZE));
  pos += Id::SIZE;
  res.destinationAddress = bytes.substr (pos, EVM_ADDRESS_SIZE);
  pos += EVM_ADDRESS_SIZE;
  res.payload = bytes.substr (pos);

  return res;
}

std::string
AddressedPayload::Encode () const
{
  CHECK_EQ (sourceAddress.size (), EVM_ADDRESS_SIZE);
  CHECK_EQ (destinationAddress.size (), EVM_ADDRESS_SIZE);

  std::string body(ADDRESSED_RESERVED_SIZE, '\0');
  body += sourceAddress;
  body += destinationChainId.GetBinary ();
  body += destinationAddress;
  body += payload;

  std::string res;
  WriteUint32BE (body.size (), res);
  res += body;

  return res;
}

Json::Value
AddressedPayload::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["sourceAddress"] = EncodeHex (sourceAddress);
  res["destinationChainID"] = destinationChainId.ToCb58 ();
  res["destinationAddress"] = EncodeHex (destinationAddress);
  res["payload"] = EncodeHex (payload);

  return res;
}

Json::Value
WarpPayload::ToJson () const
{
  Json::Value res(Json::objectValue);
  switch (kind)
    {
    case Kind::Unknown:
      res["type"] = "Unknown";
      res["bytes"] = EncodeHex (raw);
      break;
    case Kind::Addressed:
      res["type"] = "AddressedPayload";
      res["addressedPayload"] = addressed.ToJson ();
      break;
    }

  return res;
}

/* ************************************************************************** */

UnsignedMessage
UnsignedMessage::Decode (const std::string& bytes)
{
  if (bytes.size () < HEADER_SIZE)
    {
      std::ostringstream msg;
      msg << "unsigned message has " << bytes.size ()
          << " bytes, expected at least " << HEADER_SIZE;
      throw Error (ErrorKind::PayloadTooShort, msg.str ());
    }

  UnsignedMessage res;
  res.bytes = bytes;
  res.id = Id::FromBinary (Sha256 (bytes));

  size_t pos = MESSAGE_RESERVED_SIZE;
  res.networkId = ReadUint32BE (bytes, pos);
  pos += 4;
  res.sourceChainId = Id::FromBinary (bytes.substr (pos, Id::SIZE));
  pos += Id::SIZE;
  CHECK_EQ (pos, HEADER_SIZE);

  res.payload.kind = WarpPayload::Kind::Unknown;
  res.payload.raw = bytes.substr (pos);

  return res;
}

UnsignedMessage
UnsignedMessage::DecodeBestEffort (const std::string& bytes)
{
  UnsignedMessage res = Decode (bytes);

  try
    {
      res.payload.addressed = AddressedPayload::Decode (res.payload.raw);
      res.payload.kind = WarpPayload::Kind::Addressed;
    }
  catch (const Error& exc)
    {
      VLOG (1)
          << "Payload of Warp message " << res.id
          << " is not an addressed payload: " << exc.what ();
    }

  return res;
}

Json::Value
UnsignedMessage::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["id"] = id.ToCb58 ();
  res["networkID"] = static_cast<Json::Int64> (networkId);
  res["sourceChainID"] = sourceChainId.ToCb58 ();
  res["payload"] = payload.ToJson ();

  return res;
}

/* ************************************************************************** */

Json::Value
SubnetEvmWarpMessage::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["originChainID"] = originChainId.ToCb58 ();
  res["originSenderAddress"] = EncodeHex (originSenderAddress);
  res["destinationChainID"] = destinationChainId.ToCb58 ();
  res["destinationAddress"] = EncodeHex (destinationAddress);
  if (hasPayload)
    res["payload"] = EncodeHex (payload);
  else
    res["payload"] = Json::Value ();

  return res;
}

std::ostream&
operator<< (std::ostream& out, const WarpStatus& s)
{
  switch (s.kind)
    {
    case WarpStatus::Kind::Sent:
      out << "Sent";
      break;
    case WarpStatus::Kind::Signed:
      out << "Signed(" << s.signatures << ")";
      break;
    }

  return out;
}

/* ************************************************************************** */

WarpMessage
WarpMessage::FromSubnetEvmLog (const std::vector<std::string>& topics,
                               const std::string& data)
{
  if (topics.size () < 4)
    throw Error (ErrorKind::MalformedResponse,
                 "SendWarpMessage log needs four topics");
  for (const auto& t : topics)
    if (t.size () != TOPIC_SIZE)
      throw Error (ErrorKind::MalformedResponse,
                   "invalid log topic size in SendWarpMessage log");

  WarpMessage res(UnsignedMessage::DecodeBestEffort (data));
  const auto& msg = res.unsignedMessage;

  res.hasVerified = true;
  res.verified.originChainId = msg.GetSourceChainId ();
  res.verified.destinationChainId = Id::FromBinary (topics[1]);
  res.verified.destinationAddress = AddressFromTopic (topics[2]);
  res.verified.originSenderAddress = AddressFromTopic (topics[3]);

  const auto& payload = msg.GetPayload ();
  if (payload.kind == WarpPayload::Kind::Addressed)
    {
      res.verified.hasPayload = true;
      res.verified.payload = payload.addressed.payload;
    }

  return res;
}

bool
WarpMessage::HasSignature (const NodeId& nodeId) const
{
  for (const auto& s : signatures)
    if (s.nodeId == nodeId)
      return true;

  return false;
}

bool
WarpMessage::AddSignature (const NodeId& nodeId, const std::string& sig)
{
  if (sig.size () != ValidatorSignature::SIZE)
    {
      std::ostringstream msg;
      msg << "signature from " << nodeId << " has " << sig.size ()
          << " bytes, expected " << ValidatorSignature::SIZE;
      throw Error (ErrorKind::InvalidSignature, msg.str ());
    }

  if (HasSignature (nodeId))
    {
      VLOG (1) << "Already have a signature from " << nodeId;
      return false;
    }

  ValidatorSignature entry;
  entry.nodeId = nodeId;
  entry.signature = sig;
  signatures.push_back (std::move (entry));

  return true;
}

WarpStatus
WarpMessage::GetStatus () const
{
  WarpStatus res;
  if (signatures.empty ())
    return res;

  res.kind = WarpStatus::Kind::Signed;
  res.signatures = signatures.size ();

  return res;
}

Json::Value
WarpMessage::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["unsignedMessage"] = unsignedMessage.ToJson ();

  if (hasVerified)
    res["verifiedMessage"] = verified.ToJson ();
  else
    res["verifiedMessage"] = Json::Value ();

  const WarpStatus status = GetStatus ();
  Json::Value statusJson(Json::objectValue);
  switch (status.kind)
    {
    case WarpStatus::Kind::Sent:
      statusJson["status"] = "Sent";
      break;
    case WarpStatus::Kind::Signed:
      statusJson["status"] = "Signed";
      statusJson["signatures"] = static_cast<Json::Int64> (status.signatures);
      break;
    }
  res["status"] = statusJson;

  Json::Value sigs(Json::arrayValue);
  for (const auto& s : signatures)
    {
      Json::Value entry(Json::objectValue);
      entry["nodeID"] = s.nodeId.ToString ();
      entry["signature"] = EncodeHex (s.signature);
      sigs.append (entry);
    }
  res["signatures"] = sigs;

  return res;
}

} // namespace ash
