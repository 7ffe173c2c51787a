// Copyright (C) 2021-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ASH_RPCUTILS_HPP
#define ASH_RPCUTILS_HPP

#include <jsonrpccpp/client.h>
#include <jsonrpccpp/client/connectors/httpclient.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace ash
{

/** A list of headers that can be added to the requests.  */
using RpcHeaders = std::map<std::string, std::string>;

/**
 * Parses a string into a list of headers.  The format is:
 *  header1=value1;header2=value2;...
 */
RpcHeaders ParseRpcHeaders (const std::string& str);

/** Default HTTP port of AvalancheGo nodes.  */
constexpr uint16_t DEFAULT_HTTP_PORT = 9650;

/**
 * The components of an HTTP(S) endpoint URL.
 */
struct EndpointUrl
{

  std::string scheme;

  /** The host, without brackets for IPv6 addresses.  */
  std::string host;

  uint16_t port = 0;

  /** The path including the leading slash (may be empty).  */
  std::string path;

  /** Encoded user-info part (credentials) without the trailing "@".  */
  std::string userinfo;

  /** Encoded query string without the leading "?".  */
  std::string query;

  /**
   * Returns the URL with the given path instead of ours.  User-info and
   * query are kept.
   */
  std::string WithPath (const std::string& p) const;

  /**
   * Returns the full URL.
   */
  std::string
  ToString () const
  {
    return WithPath (path);
  }

  friend bool
  operator== (const EndpointUrl& a, const EndpointUrl& b)
  {
    return a.scheme == b.scheme && a.host == b.host && a.port == b.port
            && a.path == b.path && a.userinfo == b.userinfo
            && a.query == b.query;
  }

};

/**
 * Parses an endpoint URL like "https://host:port/path".  Missing components
 * are filled in with defaults:  The scheme is "http", the port 9650 (or 443
 * for https) and the path defaultPath.  Credentials in the user-info part
 * and a query string are kept.  Returns false if the URL cannot be parsed
 * or its scheme is not HTTP(S).
 */
bool ParseEndpointUrl (const std::string& url, const std::string& defaultPath,
                       EndpointUrl& res);

/**
 * Splits an address of the form "host:port" (with IPv6 hosts in
 * brackets) into its parts.  Returns false if it is invalid.
 */
bool SplitHostPort (const std::string& str, std::string& host, uint16_t& port);

/**
 * Simple wrapper around a JSON-RPC connection to some HTTP endpoint.
 * We use a fresh instance of this every time we need one, just for simplicity
 * and to ensure thread safety.
 */
template <typename T, jsonrpc::clientVersion_t V>
  class RpcClient
{

private:

  /** HTTP client instance.  */
  jsonrpc::HttpClient http;

  /** Actual JSON-RPC client.  */
  T rpc;

public:

  explicit RpcClient (const std::string& ep)
    : http(ep), rpc(http, V)
  {}

  /**
   * Sets the timeout duration for the RPC call.
   */
  template <typename Rep, typename Period>
    void
    SetTimeout (const std::chrono::duration<Rep, Period>& val)
  {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds> (val);
    http.SetTimeout (ms.count ());
  }

  /**
   * Adds a list of headers to be sent.
   */
  void
  AddHeaders (const RpcHeaders& headers)
  {
    for (const auto& h : headers)
      http.AddHeader (h.first, h.second);
  }

  T&
  operator* ()
  {
    return rpc;
  }

  T*
  operator-> ()
  {
    return &rpc;
  }

};

} // namespace ash

#endif // ASH_RPCUTILS_HPP
