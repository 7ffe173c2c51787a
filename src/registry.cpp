// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "registry.hpp"

#include "rpcutils.hpp"

namespace ash
{

std::string
AvalancheNode::GetInfoEndpoint () const
{
  EndpointUrl url;
  url.scheme = scheme;
  url.host = host;
  url.port = httpPort;
  url.userinfo = userinfo;
  url.query = query;

  return url.WithPath ("/ext/info");
}

} // namespace ash
