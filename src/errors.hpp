// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ASH_ERRORS_HPP
#define ASH_ERRORS_HPP

#include <ostream>
#include <stdexcept>
#include <string>

namespace ash
{

/**
 * The different kinds of failures that operations of the library can
 * report to callers.
 */
enum class ErrorKind
{

  /** A named network (or other config entry) does not exist.  */
  ConfigNotFound,
  /** The configuration data itself is invalid.  */
  ConfigInvalid,

  /** A Subnet, blockchain or validator is not known locally.  */
  NotFound,
  /** A Subnet to be refreshed is not known locally.  */
  SubnetNotFound,

  /** Transport failure talking to a remote node.  */
  RemoteUnavailable,
  /** The remote response could not be interpreted.  */
  MalformedResponse,
  /** The remote returned a structured JSON-RPC error.  */
  RpcApplicationError,

  /** A binary payload is shorter than its minimum size.  */
  PayloadTooShort,
  /** A binary payload's length prefix does not match its size.  */
  PayloadIntegrity,

  /** A validator has no discoverable network address.  */
  PeerNotFound,
  /** The source chain of a Warp message is not part of the Subnet.  */
  UnknownSourceChain,
  /** An RPC endpoint URL could not be parsed.  */
  InvalidUrl,
  /** A textual identifier could not be parsed.  */
  InvalidId,
  /** A signature returned by a validator is invalid.  */
  InvalidSignature,

  /** The operation is not supported for the target network or Subnet.  */
  OperationNotAllowed,

};

/**
 * Returns a human-readable name for an error kind.
 */
std::string ErrorKindToString (ErrorKind kind);

std::ostream& operator<< (std::ostream& out, ErrorKind kind);

/**
 * Exception type thrown for all failures of the library that depend on
 * remote or user-provided data (as opposed to internal invariants, which
 * are CHECK'ed).
 */
class Error : public std::runtime_error
{

private:

  /** The kind of this error.  */
  ErrorKind kind;

  /**
   * For lookup failures, the kind of entity that was looked up (e.g.
   * "Subnet" or "blockchain").  Empty otherwise.
   */
  std::string scope;

  /** For lookup failures, the key that was looked up.  */
  std::string target;

  /** For RpcApplicationError, the error code returned by the remote.  */
  int rpcCode = 0;

public:

  explicit Error (ErrorKind k, const std::string& msg);

  /**
   * Constructs an error for a failed lookup.  The location describes
   * where the lookup was done (e.g. the network or Subnet), and is only
   * used for the message.
   */
  static Error Lookup (ErrorKind k, const std::string& scp,
                       const std::string& tgt, const std::string& location);

  /**
   * Constructs an RpcApplicationError for an error object returned
   * by the remote side.
   */
  static Error Rpc (int code, const std::string& msg);

  ErrorKind
  GetKind () const
  {
    return kind;
  }

  const std::string&
  GetScope () const
  {
    return scope;
  }

  const std::string&
  GetTarget () const
  {
    return target;
  }

  int
  GetRpcCode () const
  {
    return rpcCode;
  }

};

} // namespace ash

#endif // ASH_ERRORS_HPP
