// Copyright (c) 2025
/**
 * @file offset_sample_test.cc
 * @brief Offset bounds, midpoint and record formatting.
 */
#include "udpoffset/offset_sample.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace {

using udpoffset::ComputeOffsetSample;
using udpoffset::OffsetSample;
using udpoffset::TimeSpec;

/**
 * @test OffsetSampleTest.ReferenceExchange
 * @brief Reflector half a second ahead of the send, reply 0.8 s after it.
 *
 * @steps
 * 1. t1 = 1000.0, tau2 = 1000.5, t3 = 1000.8.
 * 2. Compute the sample.
 *
 * @expected offset_min = -0.5, offset_max = 0.3, offset = -0.1.
 */
TEST(OffsetSampleTest, ReferenceExchange) {
  OffsetSample s = ComputeOffsetSample(TimeSpec(1000, 0),
                                       TimeSpec(1000, 500000000),
                                       TimeSpec(1000, 800000000));
  EXPECT_TRUE(s.offset_min_ns == -500000000);
  EXPECT_TRUE(s.offset_max_ns == 300000000);
  EXPECT_DOUBLE_EQ(s.offset_min_s, -0.5);
  EXPECT_DOUBLE_EQ(s.offset_max_s, 0.3);
  EXPECT_DOUBLE_EQ(s.offset_s, -0.1);
  EXPECT_EQ(s.t1, TimeSpec(1000, 0));
  EXPECT_EQ(s.tau2, TimeSpec(1000, 500000000));
  EXPECT_EQ(s.t3, TimeSpec(1000, 800000000));
}

struct Exchange {
  TimeSpec t1;
  TimeSpec tau2;
  TimeSpec t3;
};

std::vector<Exchange> CausalExchanges() {
  return {
      {TimeSpec(1000, 0), TimeSpec(1000, 500000000),
       TimeSpec(1000, 800000000)},
      {TimeSpec(1762139748, 999999999), TimeSpec(1762139700, 1),
       TimeSpec(1762139749, 0)},
      {TimeSpec(1762139748, 1), TimeSpec(1762139748, 1),
       TimeSpec(1762139748, 1)},  // zero delay
      {TimeSpec(1762139748, 0), TimeSpec(1762139748, 200),
       TimeSpec(1762139748, 401)},  // odd sum
      {TimeSpec(-10, 0), TimeSpec(5, 0), TimeSpec(-9, 999999999)},
      {TimeSpec(1762139748, 1500000000), TimeSpec(1762139749, 0),
       TimeSpec(1762139750, -1)},  // unnormalized fields
  };
}

/**
 * @test OffsetSampleTest.MidpointLiesBetweenBounds
 * @brief offset_min <= offset <= offset_max whenever t1 <= t3.
 */
TEST(OffsetSampleTest, MidpointLiesBetweenBounds) {
  for (const Exchange& e : CausalExchanges()) {
    ASSERT_LE(e.t1, e.t3);
    OffsetSample s = ComputeOffsetSample(e.t1, e.tau2, e.t3);
    EXPECT_LE(s.offset_min_s, s.offset_s);
    EXPECT_LE(s.offset_s, s.offset_max_s);
    EXPECT_TRUE(s.offset_min_ns <= s.offset_max_ns);
  }
}

/**
 * @test OffsetSampleTest.MidpointIsMeanOfBounds
 * @brief offset == (offset_min + offset_max) / 2 for all samples.
 */
TEST(OffsetSampleTest, MidpointIsMeanOfBounds) {
  for (const Exchange& e : CausalExchanges()) {
    OffsetSample s = ComputeOffsetSample(e.t1, e.tau2, e.t3);
    EXPECT_EQ(s.offset_s, (s.offset_min_s + s.offset_max_s) / 2.0);
  }
  // Also when causality is violated (reply stamped before the send).
  OffsetSample s = ComputeOffsetSample(TimeSpec(20, 0), TimeSpec(10, 0),
                                       TimeSpec(19, 0));
  EXPECT_EQ(s.offset_s, (s.offset_min_s + s.offset_max_s) / 2.0);
}

/**
 * @test OffsetSampleTest.MidpointIsExactNearCurrentEpoch
 * @brief The reported midpoint equals the mean of the reported bounds.
 *
 * @steps
 * 1. Sweep send, reflect and arrival captures around a 2025 epoch with
 *    nanosecond offsets of varied magnitude.
 *
 * @expected offset == (offset_min + offset_max) / 2 compared exactly.
 */
TEST(OffsetSampleTest, MidpointIsExactNearCurrentEpoch) {
  const int64_t base = 1762139748;
  for (int64_t step = 1; step < 1000000000; step = step * 7 + 3) {
    for (int64_t delay_ns = 13; delay_ns < 900000000; delay_ns *= 11) {
      TimeSpec t1(base, step % 1000000000);
      TimeSpec tau2(base + 1, (step * 3) % 1000000000);
      TimeSpec t3(base + 1, (step % 1000000000 + delay_ns) % 1000000000);
      OffsetSample s = ComputeOffsetSample(t1, tau2, t3);
      EXPECT_EQ(s.offset_s, (s.offset_min_s + s.offset_max_s) / 2.0)
          << "step=" << step << " delay=" << delay_ns;
    }
  }
}

TEST(OffsetSampleTest, HalfNanosecondMidpointIsNotTruncated) {
  OffsetSample s = ComputeOffsetSample(TimeSpec(0, 0), TimeSpec(0, 0),
                                       TimeSpec(0, 1));
  EXPECT_DOUBLE_EQ(s.offset_s, 0.5e-9);
}

TEST(OffsetSampleTest, FormatsRecord) {
  OffsetSample s = ComputeOffsetSample(TimeSpec(1000, 0),
                                       TimeSpec(1000, 500000000),
                                       TimeSpec(1000, 800000000));
  EXPECT_EQ(udpoffset::FormatSample(s),
            "1000.000000000, 1000.500000000, 1000.800000000, "
            "-0.500000000, 0.300000000, -0.100000000");
}

TEST(OffsetSampleTest, FormatsTimestampWithZeroPaddedNanoseconds) {
  EXPECT_EQ(udpoffset::FormatTimestamp(TimeSpec(1762139748, 5)),
            "1762139748.000000005");
  EXPECT_EQ(udpoffset::FormatTimestamp(TimeSpec(0, 999999999)),
            "0.999999999");
}

/**
 * @test OffsetSampleTest.FormatsOutOfRangeNanosecondsAsReceived
 * @brief Unnormalized nsec fields from a peer print with the sign first.
 */
TEST(OffsetSampleTest, FormatsOutOfRangeNanosecondsAsReceived) {
  EXPECT_EQ(udpoffset::FormatTimestamp(TimeSpec(1762139750, -1)),
            "1762139750.-00000001");
  EXPECT_EQ(udpoffset::FormatTimestamp(TimeSpec(1762139750, -123456789)),
            "1762139750.-123456789");
  EXPECT_EQ(udpoffset::FormatTimestamp(TimeSpec(1762139750, 1000000000)),
            "1762139750.1000000000");

  OffsetSample s = ComputeOffsetSample(TimeSpec(1762139750, -1),
                                       TimeSpec(1762139750, 0),
                                       TimeSpec(1762139750, 1));
  const std::string row = udpoffset::FormatSample(s);
  EXPECT_EQ(row.find("1762139750.-00000001, 1762139750.000000000, "
                     "1762139750.000000001, "),
            0u)
      << row;
}

TEST(OffsetSampleTest, HeaderNamesColumns) {
  EXPECT_EQ(udpoffset::SampleHeader(),
            "t1, tau2, t3, offset_min, offset_max, offset");
}

TEST(OffsetSampleTest, ArrivalRecord) {
  udpoffset::ArrivalRecord r = udpoffset::ComputeArrivalRecord(
      TimeSpec(1000, 0), TimeSpec(1000, 250000000));
  EXPECT_DOUBLE_EQ(r.one_way_s, 0.25);
  EXPECT_EQ(udpoffset::FormatArrival(r),
            "1000.000000000, 1000.250000000, 0.250000000");
}

}  // namespace
