// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ids.hpp"

#include "errors.hpp"
#include "testutils.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace ash
{
namespace
{

using IdsTests = testing::Test;

TEST_F (IdsTests, PrimaryNetworkId)
{
  EXPECT_TRUE (PRIMARY_NETWORK_ID.IsNull ());
  EXPECT_EQ (PRIMARY_NETWORK_ID.ToCb58 (),
             "11111111111111111111111111111111LpoYY");
  EXPECT_EQ (Id::FromCb58 ("11111111111111111111111111111111LpoYY"),
             PRIMARY_NETWORK_ID);
  EXPECT_EQ (Id (), PRIMARY_NETWORK_ID);
}

TEST_F (IdsTests, Cb58RoundTrip)
{
  const std::string str = "2q9e4r6Mu3U68nU1fYjgbR6JvwrRx36CohpAX5UQxse55x1Q5";
  const Id id = Id::FromCb58 (str);
  EXPECT_FALSE (id.IsNull ());
  EXPECT_EQ (id.ToCb58 (), str);
  EXPECT_EQ (id.ToHex (),
             "0x0427d4b22a2a78bcddd456742caf91b5"
               "6badbff985ee19aef14573e7343fd652");

  std::ostringstream out;
  out << id;
  EXPECT_EQ (out.str (), str);
}

TEST_F (IdsTests, AnycastId)
{
  const Id id = Id::FromCb58 (WARP_ANYCAST_ID);
  EXPECT_EQ (id.GetBinary (), std::string (32, '\xff'));
}

TEST_F (IdsTests, InvalidIds)
{
  Id id;
  EXPECT_FALSE (Id::TryFromCb58 ("", id));
  EXPECT_FALSE (Id::TryFromCb58 ("11111111111111111111111111111111LpoYZ", id));
  /* A valid short ID is not a valid full ID.  */
  EXPECT_FALSE (Id::TryFromCb58 ("MFrZFVCXPv5iCn6M9K6XduxGTYp891xXZ", id));

  try
    {
      Id::FromCb58 ("invalid");
      FAIL () << "Expected an exception";
    }
  catch (const Error& exc)
    {
      EXPECT_EQ (exc.GetKind (), ErrorKind::InvalidId);
    }
}

TEST_F (IdsTests, Ordering)
{
  const Id a = Id::FromBinary (std::string (31, '\0') + "\x01");
  const Id b = Id::FromBinary ("\x01" + std::string (31, '\0'));
  EXPECT_TRUE (PRIMARY_NETWORK_ID < a);
  EXPECT_TRUE (a < b);
  EXPECT_NE (a, b);
}

TEST_F (IdsTests, FromBinaryWrongSize)
{
  EXPECT_DEATH (Id::FromBinary ("abc"), "Invalid binary ID size");
}

TEST_F (IdsTests, NodeId)
{
  const std::string str = "NodeID-MFrZFVCXPv5iCn6M9K6XduxGTYp891xXZ";
  const NodeId id = NodeId::FromString (str);
  EXPECT_EQ (id.ToString (), str);
  EXPECT_EQ (id.GetShortId ().ToHex (),
             "0xde31b4d8b22991d51aa6aa1fc733f23a851a8c94");

  EXPECT_EQ (NodeId::FromString ("  " + str + "\n"), id);
}

TEST_F (IdsTests, InvalidNodeIds)
{
  NodeId id;
  EXPECT_FALSE (NodeId::TryFromString ("MFrZFVCXPv5iCn6M9K6XduxGTYp891xXZ", id));
  EXPECT_FALSE (NodeId::TryFromString ("NodeID-", id));
  EXPECT_FALSE (NodeId::TryFromString ("NodeID-MFrZFVCXPv5iCn6M9K6XduxGTYp891xXY",
                                       id));
  EXPECT_FALSE (NodeId::TryFromString (
      "NodeID-11111111111111111111111111111111LpoYY", id));

  EXPECT_THROW (NodeId::FromString ("foo"), Error);
}

TEST_F (IdsTests, TestHelpers)
{
  EXPECT_EQ (TestId (1), TestId (1));
  EXPECT_NE (TestId (1), TestId (2));
  EXPECT_NE (TestId (0), PRIMARY_NETWORK_ID);
  EXPECT_NE (TestNodeId (1), TestNodeId (2));
  EXPECT_EQ (TestSignature (TestNodeId (1)).size (), 96);
}

} // anonymous namespace
} // namespace ash
