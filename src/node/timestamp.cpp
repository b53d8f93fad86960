#include "node/timestamp.hpp"
#include <cctype>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace vault {
namespace node {

namespace {

// Layout of "2024-01-31T12:30:45.1234567Z"
constexpr std::size_t TIMESTAMP_LENGTH = 28;
constexpr std::size_t FRACTION_OFFSET = 20;
constexpr std::size_t FRACTION_DIGITS = 7;

// First year boost::gregorian::date accepts
constexpr int MIN_PTIME_YEAR = 1400;

bool is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
  static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year)) {
    return 29;
  }
  return DAYS[month - 1];
}

bool read_digits(const std::string& text, std::size_t offset, std::size_t count, int& value) {
  value = 0;
  for (std::size_t i = offset; i < offset + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
    value = value * 10 + (text[i] - '0');
  }
  return true;
}

} // namespace

std::optional<CreatedAt> parse_created_at(const std::string& text) {
  if (text.size() != TIMESTAMP_LENGTH) {
    return std::nullopt;
  }
  if (text[4] != '-' || text[7] != '-' || text[10] != 'T' || text[13] != ':' ||
      text[16] != ':' || text[19] != '.' || text[27] != 'Z') {
    return std::nullopt;
  }

  CreatedAt stamp;
  if (!read_digits(text, 0, 4, stamp.year) || !read_digits(text, 5, 2, stamp.month) ||
      !read_digits(text, 8, 2, stamp.day) || !read_digits(text, 11, 2, stamp.hour) ||
      !read_digits(text, 14, 2, stamp.minute) || !read_digits(text, 17, 2, stamp.second) ||
      !read_digits(text, FRACTION_OFFSET, FRACTION_DIGITS, stamp.fraction)) {
    return std::nullopt;
  }

  if (stamp.year < 1 || stamp.month < 1 || stamp.month > 12 ||
      stamp.day < 1 || stamp.day > days_in_month(stamp.year, stamp.month)) {
    return std::nullopt;
  }
  if (stamp.hour > 23 || stamp.minute > 59 || stamp.second > 59) {
    return std::nullopt;
  }
  return stamp;
}

std::optional<boost::posix_time::ptime> CreatedAt::to_ptime() const {
  if (year < MIN_PTIME_YEAR) {
    return std::nullopt;
  }
  boost::gregorian::date date(static_cast<unsigned short>(year),
                              static_cast<unsigned short>(month),
                              static_cast<unsigned short>(day));
  boost::posix_time::time_duration time_of_day(hour, minute, second);
  // Fractions finer than a microsecond are truncated
  time_of_day += boost::posix_time::microseconds(fraction / 10);
  return boost::posix_time::ptime(date, time_of_day);
}

std::string format_created_at(const boost::posix_time::ptime& time) {
  const auto date = time.date();
  const auto time_of_day = time.time_of_day();
  // Ticks are microseconds at the default resolution
  const auto fraction = time_of_day.fractional_seconds() *
                        (10000000 / boost::posix_time::time_duration::ticks_per_second());

  std::ostringstream out;
  out << std::setfill('0')
      << std::setw(4) << static_cast<int>(date.year()) << '-'
      << std::setw(2) << static_cast<int>(date.month()) << '-'
      << std::setw(2) << static_cast<int>(date.day()) << 'T'
      << std::setw(2) << time_of_day.hours() << ':'
      << std::setw(2) << time_of_day.minutes() << ':'
      << std::setw(2) << time_of_day.seconds() << '.'
      << std::setw(FRACTION_DIGITS) << fraction << 'Z';
  return out.str();
}

std::string current_created_at() {
  return format_created_at(boost::posix_time::microsec_clock::universal_time());
}

} // namespace node
} // namespace vault
