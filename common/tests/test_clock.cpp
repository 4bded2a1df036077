#include <gtest/gtest.h>

#include <chrono>
#include <switchboard/common/clock.hpp>

using namespace switchboard;
using namespace std::chrono;

namespace {
  SystemTime At(int day, int hour, int minute = 0) {
    return SystemTime(sys_days{year{2025} / March / day} + hours{hour} + minutes{minute});
  }
}  // namespace

TEST(ClockTest, ManualClockMovesOnlyWhenTold) {
  ManualClock clock(At(10, 9));
  EXPECT_EQ(clock.now(), At(10, 9));
  clock.advance(minutes{90});
  EXPECT_EQ(clock.now(), At(10, 10, 30));
  clock.set(At(11, 0));
  EXPECT_EQ(clock.now(), At(11, 0));
}

TEST(ClockTest, SystemClockIsMonotonicEnough) {
  auto clock = make_system_clock();
  auto a = clock->now();
  auto b = clock->now();
  EXPECT_LE(a, b);
}

TEST(ClockTest, UtcDayAndNextMidnight) {
  EXPECT_EQ(utc_day(At(10, 23, 59)), sys_days{year{2025} / March / 10});
  EXPECT_EQ(next_utc_midnight(At(10, 23, 59)), At(11, 0));
  EXPECT_EQ(next_utc_midnight(At(10, 0)), At(11, 0));
  EXPECT_EQ(next_utc_midnight(At(31, 12)), SystemTime(sys_days{year{2025} / April / 1}));
}

TEST(ClockTest, UnixConversions) {
  auto t = SystemTime(sys_days{year{1970} / January / 2});
  EXPECT_EQ(to_unix_seconds(t), 86400);
  EXPECT_EQ(to_unix_millis(t), 86400000);
  EXPECT_EQ(from_unix_millis(86400000), t);
}
