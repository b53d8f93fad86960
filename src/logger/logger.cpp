#include "logger/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace vault::logging {

namespace {

namespace blog = boost::log;
namespace keywords = boost::log::keywords;
namespace expr = boost::log::expressions;

auto record_format() {
  return expr::stream
    << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
    << " [" << blog::trivial::severity << "]"
    << " [Thread " << expr::attr<blog::attributes::current_thread_id::value_type>("ThreadID") << "]"
    << " " << expr::smessage;
}

} // namespace

bool parse_severity(const std::string& name, severity_level& level) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "trace")        level = severity_level::trace;
  else if (lowered == "debug")   level = severity_level::debug;
  else if (lowered == "info")    level = severity_level::info;
  else if (lowered == "warning") level = severity_level::warning;
  else if (lowered == "error")   level = severity_level::error;
  else if (lowered == "fatal")   level = severity_level::fatal;
  else return false;

  return true;
}

void init_logging(const std::string& log_file, severity_level min_level) {
  auto core = blog::core::get();
  core->remove_all_sinks();

  blog::add_common_attributes();

  blog::add_console_log(
    std::clog,
    keywords::format = record_format(),
    keywords::auto_flush = true
  );

  if (!log_file.empty()) {
    blog::add_file_log(
      keywords::file_name = log_file,
      keywords::open_mode = std::ios_base::app,
      keywords::format = record_format(),
      keywords::rotation_size = LOG_ROTATION_SIZE,
      keywords::auto_flush = true
    );
  }

  set_log_level(min_level);
}

void set_log_level(severity_level min_level) {
  blog::core::get()->set_filter(blog::trivial::severity >= min_level);
}

} // namespace vault::logging
