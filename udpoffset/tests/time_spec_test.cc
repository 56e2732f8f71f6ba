// Copyright (c) 2025
/**
 * @test TimeSpec arithmetic
 * @brief Test 128-bit nanosecond totals, differences and normalization.
 */
#include "udpoffset/time_spec.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <ctime>
#include <limits>

#include "udpoffset/realtime_clock.hpp"

using udpoffset::DiffNanoseconds;
using udpoffset::Nanoseconds128;
using udpoffset::TimeSpec;

TEST(TimeSpecTest, DefaultConstruction) {
  TimeSpec t;
  EXPECT_EQ(t.sec, 0);
  EXPECT_EQ(t.nsec, 0);
}

TEST(TimeSpecTest, TotalNanoseconds) {
  TimeSpec t(1735689600, 123456789);
  EXPECT_TRUE(t.TotalNanoseconds() ==
              static_cast<Nanoseconds128>(1735689600123456789LL));
}

TEST(TimeSpecTest, TotalNanosecondsDoesNotOverflowInt64Range) {
  // INT64_MAX seconds is far beyond what int64 nanoseconds can hold.
  const int64_t max = std::numeric_limits<int64_t>::max();
  TimeSpec t(max, 999999999);
  Nanoseconds128 expected =
      static_cast<Nanoseconds128>(max) * 1000000000 + 999999999;
  EXPECT_TRUE(t.TotalNanoseconds() == expected);
  EXPECT_TRUE(t.TotalNanoseconds() > 0);
}

TEST(TimeSpecTest, OutOfRangeNanosecondsFoldIntoTotal) {
  TimeSpec a(10, 1500000000);  // 11.5 s, not normalized
  TimeSpec b(11, 500000000);
  EXPECT_NE(a, b);  // field-wise equality
  EXPECT_TRUE(a.TotalNanoseconds() == b.TotalNanoseconds());
  EXPECT_FALSE(a < b);
  EXPECT_FALSE(b < a);

  TimeSpec c(10, -250000000);  // 9.75 s
  EXPECT_TRUE(c.TotalNanoseconds() == 9750000000LL);
}

TEST(TimeSpecTest, DiffNanoseconds) {
  TimeSpec a(1000, 0);
  TimeSpec b(1000, 500000000);
  EXPECT_TRUE(DiffNanoseconds(a, b) == -500000000);
  EXPECT_TRUE(DiffNanoseconds(b, a) == 500000000);
}

TEST(TimeSpecTest, ToSeconds) {
  EXPECT_DOUBLE_EQ(udpoffset::ToSeconds(-500000000), -0.5);
  EXPECT_DOUBLE_EQ(udpoffset::ToSeconds(300000000), 0.3);
  EXPECT_DOUBLE_EQ(udpoffset::ToSeconds(1), 1e-9);
}

TEST(TimeSpecTest, Comparison) {
  TimeSpec a(10, 500000000);
  TimeSpec b(10, 500000000);
  TimeSpec c(10, 600000000);
  TimeSpec d(11, 0);

  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
  EXPECT_LT(a, c);
  EXPECT_LT(c, d);
  EXPECT_GT(d, a);
  EXPECT_LE(a, b);
  EXPECT_GE(d, c);
}

/**
 * @test TimeSpecTest.RealtimeClockReadsWallClock
 * @brief The realtime clock yields normalized Unix time close to time().
 */
TEST(TimeSpecTest, RealtimeClockReadsWallClock) {
  TimeSpec a;
  TimeSpec b;
  ASSERT_TRUE(udpoffset::RealtimeClock::Instance().NowUnix(&a));
  ASSERT_TRUE(udpoffset::RealtimeClock::Instance().NowUnix(&b));
  EXPECT_GE(a.nsec, 0);
  EXPECT_LT(a.nsec, udpoffset::kNsecPerSec);
  const int64_t wall = static_cast<int64_t>(std::time(nullptr));
  EXPECT_LE(wall - a.sec, 2);
  EXPECT_LE(a.sec - wall, 2);
  EXPECT_TRUE(DiffNanoseconds(b, a) >= -1000000000);  // tolerate a step
}
