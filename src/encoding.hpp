// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ASH_ENCODING_HPP
#define ASH_ENCODING_HPP

#include <cstdint>
#include <string>

namespace ash
{

/**
 * Computes the SHA-256 hash of the given data.  The result is returned
 * as binary string of 32 bytes.
 */
std::string Sha256 (const std::string& data);

/**
 * Encodes binary data as Base58 string (with the Bitcoin alphabet)
 * using libbase58.
 */
std::string EncodeBase58 (const std::string& bin);

/**
 * Decodes a Base58 string to binary.  Returns false if the string contains
 * invalid characters.
 */
bool DecodeBase58 (const std::string& str, std::string& bin);

/**
 * Encodes binary data in the CB58 format used for Avalanche identifiers,
 * i.e. Base58 with a 4-byte SHA-256 checksum appended to the data.
 */
std::string EncodeCb58 (const std::string& bin);

/**
 * Decodes a CB58 string, verifying the checksum.  Returns false if the
 * string is invalid or the checksum does not match.
 */
bool DecodeCb58 (const std::string& str, std::string& bin);

/**
 * Encodes binary data as lower-case hex with 0x prefix.
 */
std::string EncodeHex (const std::string& bin);

/**
 * Decodes a hex string (with or without 0x prefix) into binary data.
 * Returns false if the string is not valid hex.
 */
bool DecodeHex (const std::string& hex, std::string& bin);

/**
 * Parses an unsigned 64-bit integer given either in decimal or as hex
 * with 0x prefix.  Returns false if the string is not a valid number
 * or does not fit.
 */
bool ParseUint64 (const std::string& str, uint64_t& res);

/**
 * Reads a big-endian unsigned 32-bit integer from the given position
 * of the binary data.  The data must be long enough.
 */
uint32_t ReadUint32BE (const std::string& data, size_t pos);

/**
 * Appends a big-endian unsigned 32-bit integer to the given string.
 */
void WriteUint32BE (uint32_t val, std::string& out);

} // namespace ash

#endif // ASH_ENCODING_HPP
