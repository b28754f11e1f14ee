#include <gtest/gtest.h>
#include "HX711Protocol.hpp"
#include "ScriptedClockDataLine.hpp"

class HX711ProtocolTest : public ::testing::Test {
  protected:
    ScriptedClockDataLine line;

    void SetUp() override { ASSERT_EQ(SCREZ_OK, line.begin(5, 6)); }
};

TEST(HX711ProtocolStatic, SignExtendsTwentyFourBitValues)
{
    EXPECT_EQ(0, HX711Protocol::signExtend24(0x000000));
    EXPECT_EQ(8388607, HX711Protocol::signExtend24(0x7FFFFF));
    EXPECT_EQ(-8388608, HX711Protocol::signExtend24(0x800000));
    EXPECT_EQ(-1, HX711Protocol::signExtend24(0xFFFFFF));
    // Bits above the 24th are ignored.
    EXPECT_EQ(1, HX711Protocol::signExtend24(0xAB000001));
}

TEST(HX711ProtocolStatic, GainPulseTableFollowsDatasheet)
{
    uint8_t pulses = 0;
    EXPECT_EQ(SCREZ_OK, HX711Protocol::pulsesForGain(128, pulses));
    EXPECT_EQ(1, pulses);
    EXPECT_EQ(SCREZ_OK, HX711Protocol::pulsesForGain(32, pulses));
    EXPECT_EQ(2, pulses);
    EXPECT_EQ(SCREZ_OK, HX711Protocol::pulsesForGain(64, pulses));
    EXPECT_EQ(3, pulses);

    pulses = 42;
    EXPECT_EQ(SCREZ_INVALID_GAIN, HX711Protocol::pulsesForGain(100, pulses));
    EXPECT_EQ(SCREZ_INVALID_GAIN, HX711Protocol::pulsesForGain(0, pulses));
    EXPECT_EQ(42, pulses);
}

TEST_F(HX711ProtocolTest, ShiftsMostSignificantBitFirst)
{
    HX711Protocol protocol(line);
    line.pushSample(0x123456);
    line.pushSample(-2);

    int32_t value = 0;
    ASSERT_EQ(SCREZ_OK, protocol.readRaw(value));
    EXPECT_EQ(0x123456, value);
    ASSERT_EQ(SCREZ_OK, protocol.readRaw(value));
    EXPECT_EQ(-2, value);
}

TEST_F(HX711ProtocolTest, IssuesTrailingPulsesForSelectedGain)
{
    HX711Protocol protocol(line);
    int32_t value = 0;

    ASSERT_EQ(SCREZ_OK, protocol.setGain(64));
    line.pushSample(1);
    ASSERT_EQ(SCREZ_OK, protocol.readRaw(value));
    EXPECT_EQ(3, line.getLastExtraPulses());

    ASSERT_EQ(SCREZ_OK, protocol.setGain(32));
    line.pushSample(1);
    ASSERT_EQ(SCREZ_OK, protocol.readRaw(value));
    EXPECT_EQ(2, line.getLastExtraPulses());

    ASSERT_EQ(SCREZ_OK, protocol.setGain(128));
    line.pushSample(1);
    ASSERT_EQ(SCREZ_OK, protocol.readRaw(value));
    EXPECT_EQ(1, line.getLastExtraPulses());
}

TEST_F(HX711ProtocolTest, RejectedGainKeepsPreviousSelection)
{
    HX711Protocol protocol(line);
    ASSERT_EQ(SCREZ_OK, protocol.setGain(64));
    EXPECT_EQ(SCREZ_INVALID_GAIN, protocol.setGain(100));
    EXPECT_EQ(64, protocol.getGain());
    EXPECT_EQ(3, protocol.getExtraPulses());
}

TEST_F(HX711ProtocolTest, TimesOutWhenDataNeverGoesLow)
{
    HX711Protocol protocol(line, 200);
    line.setStalled(true);
    line.pushSample(7);

    uint32_t before = line.nowMicros();
    int32_t value   = 99;
    EXPECT_EQ(SCREZ_TIMEOUT, protocol.readRaw(value));
    EXPECT_EQ(99, value);
    EXPECT_GE(line.nowMicros() - before, 200000U);
    // Bounded: at most one poll period past the deadline.
    EXPECT_LE(line.nowMicros() - before, 201000U);
    EXPECT_EQ(1U, line.remaining());
}

TEST_F(HX711ProtocolTest, PulseTrainRunsInsideCriticalSection)
{
    HX711Protocol protocol(line);
    line.pushSample(5);
    int32_t value = 0;
    ASSERT_EQ(SCREZ_OK, protocol.readRaw(value));
    EXPECT_EQ(1, line.getMaxCriticalDepth());
    EXPECT_EQ(0, line.getCriticalDepth());
    EXPECT_FALSE(line.isClockHigh());
}

TEST_F(HX711ProtocolTest, PowerDownHoldsClockHighAndPowerUpReleasesIt)
{
    HX711Protocol protocol(line);
    protocol.powerDown();
    EXPECT_TRUE(line.isClockHigh());
    protocol.powerUp();
    EXPECT_FALSE(line.isClockHigh());
}
