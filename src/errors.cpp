// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "errors.hpp"

#include <glog/logging.h>

#include <sstream>

namespace ash
{

std::string
ErrorKindToString (const ErrorKind kind)
{
  switch (kind)
    {
    case ErrorKind::ConfigNotFound:
      return "ConfigNotFound";
    case ErrorKind::ConfigInvalid:
      return "ConfigInvalid";
    case ErrorKind::NotFound:
      return "NotFound";
    case ErrorKind::SubnetNotFound:
      return "SubnetNotFound";
    case ErrorKind::RemoteUnavailable:
      return "RemoteUnavailable";
    case ErrorKind::MalformedResponse:
      return "MalformedResponse";
    case ErrorKind::RpcApplicationError:
      return "RpcApplicationError";
    case ErrorKind::PayloadTooShort:
      return "PayloadTooShort";
    case ErrorKind::PayloadIntegrity:
      return "PayloadIntegrity";
    case ErrorKind::PeerNotFound:
      return "PeerNotFound";
    case ErrorKind::UnknownSourceChain:
      return "UnknownSourceChain";
    case ErrorKind::InvalidUrl:
      return "InvalidUrl";
    case ErrorKind::InvalidId:
      return "InvalidId";
    case ErrorKind::InvalidSignature:
      return "InvalidSignature";
    case ErrorKind::OperationNotAllowed:
      return "OperationNotAllowed";
    }

  LOG (FATAL) << "Unexpected error kind: " << static_cast<int> (kind);
}

std::ostream&
operator<< (std::ostream& out, const ErrorKind kind)
{
  out << ErrorKindToString (kind);
  return out;
}

Error::Error (const ErrorKind k, const std::string& msg)
  : std::runtime_error(msg), kind(k)
{}

Error
Error::Lookup (const ErrorKind k, const std::string& scp,
               const std::string& tgt, const std::string& location)
{
  std::ostringstream msg;
  msg << scp << " '" << tgt << "' not found in " << location;

  Error res(k, msg.str ());
  res.scope = scp;
  res.target = tgt;

  return res;
}

Error
Error::Rpc (const int code, const std::string& msg)
{
  std::ostringstream full;
  full << "RPC response contains an error: code " << code
       << ", message: " << msg;

  Error res(ErrorKind::RpcApplicationError, full.str ());
  res.rpcCode = code;

  return res;
}

} // namespace ash
