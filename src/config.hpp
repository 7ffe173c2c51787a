// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ASH_CONFIG_HPP
#define ASH_CONFIG_HPP

#include "network.hpp"

#include <json/json.h>

#include <string>
#include <vector>

namespace ash
{

/** The built-in configuration as JSON string.  */
extern const char* const DEFAULT_CONFIG;

/**
 * Static seed data for the known networks:  Their Subnets and blockchains
 * with the operator-supplied RPC URLs and VM types.
 *
 * The JSON format is:
 *
 *  {
 *    "avalancheNetworks":
 *      [
 *        {
 *          "name": "mainnet",
 *          "subnets":
 *            [
 *              {
 *                "id": "<CB58>",
 *                "subnetType": "PrimaryNetwork",  (optional)
 *                "controlKeys": [...],             (optional)
 *                "threshold": 0,                   (optional)
 *                "blockchains":
 *                  [
 *                    {
 *                      "id": "<CB58>",
 *                      "name": "P-Chain",
 *                      "vmID": "<CB58>",
 *                      "vmType": "PlatformVM",
 *                      "rpcUrl": "https://..."
 *                    }
 *                  ]
 *              }
 *            ]
 *        }
 *      ]
 *  }
 */
class Config
{

private:

  /** The configured networks.  */
  std::vector<Network> networks;

  Config () = default;

public:

  Config (const Config&) = default;
  Config (Config&&) = default;

  Config& operator= (const Config&) = default;
  Config& operator= (Config&&) = default;

  /**
   * Parses the configuration from a JSON string.  Throws ConfigInvalid
   * if the data is invalid.
   */
  static Config Load (const std::string& json);

  /**
   * Parses the configuration from a JSON value.
   */
  static Config FromJson (const Json::Value& val);

  /**
   * Reads the configuration from a file.  Throws ConfigNotFound if the
   * file cannot be read and ConfigInvalid if it is invalid.
   */
  static Config LoadFile (const std::string& path);

  /**
   * Returns the built-in configuration.
   */
  static Config Default ();

  /**
   * Looks up a network by name.  Returns false if there is none.
   */
  bool GetNetwork (const std::string& name, Network& res) const;

  /**
   * Returns the names of all configured networks.
   */
  std::vector<std::string> GetNetworkNames () const;

};

} // namespace ash

#endif // ASH_CONFIG_HPP
