// Copyright (C) 2023-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpcutils.hpp"

#include <boost/url.hpp>

#include <glog/logging.h>

#include <sstream>

namespace ash
{

RpcHeaders
ParseRpcHeaders (const std::string& str)
{
  RpcHeaders res;

  if (str.empty ())
    return res;

  size_t pos = 0;
  while (true)
    {
      size_t keyEnd = str.find ('=', pos);
      if (keyEnd == std::string::npos)
        {
          LOG (WARNING)
              << "Ignoring invalid tail for headers: "
              << str.substr (pos);
          return res;
        }

      size_t valueEnd = str.find (';', pos);
      if (valueEnd < keyEnd)
        {
          LOG (WARNING)
              << "Ignoring invalid tail for headers: "
              << str.substr (pos);
          return res;
        }
      CHECK_GT (valueEnd, keyEnd);

      const std::string key = str.substr (pos, keyEnd - pos);
      const std::string value = str.substr (keyEnd + 1, valueEnd - keyEnd - 1);
      res.emplace (key, value);

      if (valueEnd == std::string::npos)
        return res;

      pos = valueEnd + 1;
    }

  return res;
}

/* ************************************************************************** */

namespace
{

/** Default port for HTTPS endpoints.  */
constexpr uint16_t DEFAULT_HTTPS_PORT = 443;

/**
 * Copies a Boost.URL string view into a std::string.
 */
template <typename S>
  std::string
  ToStdString (const S& str)
{
  return std::string (str.data (), str.size ());
}

/**
 * Extracts the host of a parsed URL or authority.  IPv6 addresses are
 * returned without brackets.  Returns false if there is no usable host.
 */
template <typename V>
  bool
  ExtractHost (const V& parsed, std::string& host)
{
  switch (parsed.host_type ())
    {
    case boost::urls::host_type::ipv6:
      host = parsed.host_ipv6_address ().to_string ();
      return true;

    case boost::urls::host_type::ipv4:
    case boost::urls::host_type::name:
      host = ToStdString (parsed.encoded_host ());
      return !host.empty ();

    default:
      return false;
    }
}

/**
 * Extracts the port of a parsed URL or authority.  If there is none,
 * port is left unchanged.  Returns false if the port is given but
 * not between 1 and 65535.
 */
template <typename V>
  bool
  ExtractPort (const V& parsed, uint16_t& port)
{
  if (!parsed.has_port () || parsed.port ().empty ())
    return true;

  /* port_number returns zero for values that do not fit into 16 bits.  */
  if (parsed.port_number () == 0)
    return false;

  port = parsed.port_number ();
  return true;
}

} // anonymous namespace

std::string
EndpointUrl::WithPath (const std::string& p) const
{
  std::ostringstream out;
  out << scheme << "://";
  if (!userinfo.empty ())
    out << userinfo << '@';
  if (host.find (':') != std::string::npos)
    out << '[' << host << ']';
  else
    out << host;
  out << ':' << port << p;
  if (!query.empty ())
    out << '?' << query;

  return out.str ();
}

bool
SplitHostPort (const std::string& str, std::string& host, uint16_t& port)
{
  const auto parsed = boost::urls::parse_authority (str);
  if (!parsed || parsed->has_userinfo ())
    return false;

  std::string h;
  uint16_t p = 0;
  if (!ExtractHost (*parsed, h) || !ExtractPort (*parsed, p) || p == 0)
    return false;

  host = h;
  port = p;
  return true;
}

bool
ParseEndpointUrl (const std::string& url, const std::string& defaultPath,
                  EndpointUrl& res)
{
  /* Bare "host[:port][/path]" addresses are taken as plain HTTP.  */
  const std::string full
      = url.find ("://") == std::string::npos ? "http://" + url : url;

  const auto parsed = boost::urls::parse_uri (full);
  if (!parsed)
    {
      VLOG (1) << "Invalid endpoint URL '" << url << "': " << parsed.error ();
      return false;
    }
  const boost::urls::url_view& u = *parsed;

  EndpointUrl result;
  switch (u.scheme_id ())
    {
    case boost::urls::scheme::http:
      result.scheme = "http";
      result.port = DEFAULT_HTTP_PORT;
      break;
    case boost::urls::scheme::https:
      result.scheme = "https";
      result.port = DEFAULT_HTTPS_PORT;
      break;
    default:
      return false;
    }

  if (!u.has_authority () || !ExtractHost (u, result.host))
    return false;
  if (!ExtractPort (u, result.port))
    return false;

  if (u.has_userinfo ())
    result.userinfo = ToStdString (u.encoded_userinfo ());
  if (u.has_query ())
    result.query = ToStdString (u.encoded_query ());

  result.path = ToStdString (u.encoded_path ());
  if (result.path.empty () || result.path == "/")
    result.path = defaultPath;

  res = result;
  return true;
}

} // namespace ash
