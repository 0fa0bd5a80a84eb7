#ifndef DFSNODE_LOGGER_HPP
#define DFSNODE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>

namespace dfsnode::logging {

using severity_level = boost::log::trivial::severity_level;

// Thread-safe logger handed to each component at construction
using Logger = boost::log::sources::severity_logger_mt<severity_level>;

// Creates a logger whose records carry the given component name
Logger make_logger(const std::string& component);

// Installs the file sink (and optionally a console sink) for the process.
// The log directory is created if needed. Safe to call more than once; the
// previous sinks are replaced.
void init_logging(const std::string& log_dir,
                  const std::string& log_file,
                  bool print_on_console = false,
                  severity_level min_level = severity_level::debug);

// Installs only a console sink, used by the test binaries
void init_console_logging(severity_level min_level = severity_level::debug);

// Changes the minimum severity of all installed sinks
void set_log_level(severity_level min_level);

} // namespace dfsnode::logging

// Convenience macros for logging through an injected logger
#define DFSNODE_LOG_TRACE(lg) BOOST_LOG_SEV(lg, boost::log::trivial::trace)
#define DFSNODE_LOG_DEBUG(lg) BOOST_LOG_SEV(lg, boost::log::trivial::debug)
#define DFSNODE_LOG_INFO(lg) BOOST_LOG_SEV(lg, boost::log::trivial::info)
#define DFSNODE_LOG_WARN(lg) BOOST_LOG_SEV(lg, boost::log::trivial::warning)
#define DFSNODE_LOG_ERROR(lg) BOOST_LOG_SEV(lg, boost::log::trivial::error)
#define DFSNODE_LOG_FATAL(lg) BOOST_LOG_SEV(lg, boost::log::trivial::fatal)

#endif // DFSNODE_LOGGER_HPP
