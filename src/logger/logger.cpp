#include "dfsnode/logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <filesystem>
#include <iostream>

namespace dfsnode::logging {

namespace {

namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

BOOST_LOG_ATTRIBUTE_KEYWORD(component_attr, "Component", std::string)

// timestamp [severity] [component] message
auto make_formatter() {
  return expr::stream
    << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%m/%d/%Y %I:%M:%S %p")
    << " [" << boost::log::trivial::severity << "]"
    << " [" << component_attr << "] "
    << expr::smessage;
}

} // namespace

Logger make_logger(const std::string& component) {
  Logger logger;
  logger.add_attribute("Component", boost::log::attributes::constant<std::string>(component));
  return logger;
}

void init_logging(const std::string& log_dir, const std::string& log_file,
                  bool print_on_console, severity_level min_level) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    std::filesystem::path log_path = std::filesystem::path(log_dir) / log_file;
    if (!std::filesystem::exists(log_dir)) {
      std::filesystem::create_directories(log_dir);
    }

    boost::log::add_file_log(
      keywords::file_name = log_path.string(),
      keywords::open_mode = std::ios::out | std::ios::app,
      keywords::format = make_formatter(),
      keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
      keywords::auto_flush = true
    );

    if (print_on_console) {
      boost::log::add_console_log(
        std::clog,
        keywords::format = make_formatter(),
        keywords::auto_flush = true
      );
    }

    boost::log::add_common_attributes();
    set_log_level(min_level);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void init_console_logging(severity_level min_level) {
  boost::log::core::get()->remove_all_sinks();
  boost::log::add_console_log(
    std::cout,
    keywords::format = make_formatter(),
    keywords::auto_flush = true
  );
  boost::log::add_common_attributes();
  set_log_level(min_level);
}

void set_log_level(severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

} // namespace dfsnode::logging
