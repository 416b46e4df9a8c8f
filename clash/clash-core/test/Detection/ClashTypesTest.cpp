// Ticket: 0003_clash_record_model

#include <gtest/gtest.h>

#include <stdexcept>

#include "clash-core/src/Detection/ClashTypes.hpp"

using namespace clash_core;

TEST(ClashTypesTest, ClashPair_OrderIndependent)
{
  const ClashPair ab{"/B", "/A"};
  const ClashPair ba{"/A", "/B"};

  EXPECT_EQ(ab, ba);
  EXPECT_EQ("/A", ab.first());
  EXPECT_EQ("/B", ab.second());
  EXPECT_FALSE(ab < ba);
  EXPECT_FALSE(ba < ab);
}

TEST(ClashTypesTest, ClashPair_Contains)
{
  const ClashPair pair{"/World/Pipe", "/World/Wall"};
  EXPECT_TRUE(pair.contains("/World/Wall"));
  EXPECT_TRUE(pair.contains("/World/Pipe"));
  EXPECT_FALSE(pair.contains("/World"));
}

TEST(ClashTypesTest, ClashPair_OrdersByFirstThenSecond)
{
  EXPECT_LT(ClashPair("/A", "/B"), ClashPair("/A", "/C"));
  EXPECT_LT(ClashPair("/A", "/C"), ClashPair("/B", "/C"));
}

TEST(ClashTypesTest, ClashRecord_SampleCount)
{
  ClashRecord record;
  record.startSample = 4;
  record.endSample = 4;
  EXPECT_EQ(1u, record.sampleCount());

  record.endSample = 9;
  EXPECT_EQ(6u, record.sampleCount());
}

TEST(ClashTypesTest, Classification_NamesRoundTrip)
{
  for (const auto c : {Classification::None, Classification::Clash, Classification::Clearance})
  {
    EXPECT_EQ(c, classificationFromString(toString(c)));
  }
  EXPECT_THROW(classificationFromString("clash"), std::invalid_argument);
}

TEST(ClashTypesTest, WarningKind_NamesRoundTrip)
{
  for (const auto kind : {WarningKind::MissingObject,
                          WarningKind::MissingMember,
                          WarningKind::DegenerateGeometry,
                          WarningKind::UnsupportedTransform})
  {
    EXPECT_EQ(kind, warningKindFromString(toString(kind)));
  }
  EXPECT_THROW(warningKindFromString(""), std::invalid_argument);
}
