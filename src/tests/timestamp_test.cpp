#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "node/timestamp.hpp"

using namespace vault::node;

TEST(TimestampTest, AcceptsStrictForm) {
  auto parsed = parse_created_at("2024-01-31T12:30:45.1234567Z");
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed->fraction, 1234567);

  auto time = parsed->to_ptime();
  ASSERT_TRUE(time);
  EXPECT_EQ(time->date(), boost::gregorian::date(2024, 1, 31));
  EXPECT_EQ(time->time_of_day().hours(), 12);
  EXPECT_EQ(time->time_of_day().minutes(), 30);
  EXPECT_EQ(time->time_of_day().seconds(), 45);
  // Sub-microsecond digits are dropped
  EXPECT_EQ(time->time_of_day().total_microseconds() % 1000000, 123456);
}

TEST(TimestampTest, AcceptsLeapDay) {
  EXPECT_TRUE(is_valid_created_at("2024-02-29T00:00:00.0000000Z"));
  EXPECT_FALSE(is_valid_created_at("2023-02-29T00:00:00.0000000Z"));
}

TEST(TimestampTest, AcceptsYearsBeforeBoostDates) {
  EXPECT_TRUE(is_valid_created_at("1399-12-31T23:59:59.0000000Z"));
  EXPECT_TRUE(is_valid_created_at("0001-01-01T00:00:00.0000000Z"));
  EXPECT_TRUE(is_valid_created_at("9999-12-31T23:59:59.9999999Z"));

  auto early = parse_created_at("1399-12-31T23:59:59.0000000Z");
  ASSERT_TRUE(early);
  EXPECT_EQ(early->year, 1399);
  EXPECT_FALSE(early->to_ptime());
}

TEST(TimestampTest, LeapRulesHoldForEarlyYears) {
  EXPECT_TRUE(is_valid_created_at("0400-02-29T00:00:00.0000000Z"));
  EXPECT_TRUE(is_valid_created_at("1204-02-29T00:00:00.0000000Z"));
  EXPECT_FALSE(is_valid_created_at("1300-02-29T00:00:00.0000000Z"));
  EXPECT_FALSE(is_valid_created_at("0001-04-31T00:00:00.0000000Z"));
}

TEST(TimestampTest, RejectsMalformedInput) {
  const std::vector<std::string> rejected = {
    "",
    "2024-01-31",
    "2024-01-31T12:30:45Z",
    "2024-01-31T12:30:45.123Z",
    "2024-01-31T12:30:45.1234567",
    "2024-01-31T12:30:45.1234567+00:00",
    "2024-01-31 12:30:45.1234567Z",
    " 2024-01-31T12:30:45.1234567Z",
    "2024-01-31T12:30:45.1234567Z ",
    "2024-13-01T12:30:45.1234567Z",
    "2024-01-32T12:30:45.1234567Z",
    "2024-01-31T24:00:00.0000000Z",
    "2024-01-31T12:60:45.1234567Z",
    "2024-01-31T12:30:60.1234567Z",
    "2024-01-31T12:30:45.12345a7Z",
    "0000-01-01T00:00:00.0000000Z",
  };

  for (const auto& text : rejected) {
    EXPECT_FALSE(is_valid_created_at(text)) << "'" << text << "'";
  }
}

TEST(TimestampTest, FormatProducesParseableText) {
  boost::posix_time::ptime time(boost::gregorian::date(2023, 7, 4),
                                boost::posix_time::hours(9) + boost::posix_time::minutes(5) +
                                boost::posix_time::seconds(7) + boost::posix_time::microseconds(42));

  EXPECT_EQ(format_created_at(time), "2023-07-04T09:05:07.0000420Z");
  EXPECT_TRUE(is_valid_created_at(current_created_at()));
}
