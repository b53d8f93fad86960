#ifndef VAULT_NODE_TIMESTAMP_HPP
#define VAULT_NODE_TIMESTAMP_HPP

#include <optional>
#include <string>
#include <boost/date_time/posix_time/posix_time_types.hpp>

namespace vault {
namespace node {

// Fields of a strict upload timestamp. Years run from 1 to 9999 on the
// proleptic Gregorian calendar.
struct CreatedAt {
  int year = 1;
  int month = 1;
  int day = 1;
  int hour = 0;
  int minute = 0;
  int second = 0;
  int fraction = 0;       // Units of 100 ns

  // Boost dates stop at 1400, earlier years have no ptime
  std::optional<boost::posix_time::ptime> to_ptime() const;
};

// Parses the strict upload timestamp form YYYY-MM-DDTHH:mm:ss.fffffffZ:
// exactly seven fractional digits, a literal Z, no surrounding whitespace and
// a real calendar date.
std::optional<CreatedAt> parse_created_at(const std::string& text);

// Formats a time in the same strict form, padding the fraction to seven digits
std::string format_created_at(const boost::posix_time::ptime& time);

// Current UTC time in the strict form
std::string current_created_at();

inline bool is_valid_created_at(const std::string& text) {
  return parse_created_at(text).has_value();
}

} // namespace node
} // namespace vault

#endif // VAULT_NODE_TIMESTAMP_HPP
