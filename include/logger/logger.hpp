#ifndef S3SYNC_LOGGER_HPP
#define S3SYNC_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <string>

namespace s3sync::logging {

using severity_level = boost::log::trivial::severity_level;

// Declare the logger type
using global_logger_t = boost::log::sources::severity_logger_mt<severity_level>;

// Declare the global logger storage
BOOST_LOG_GLOBAL_LOGGER(global_logger, global_logger_t)

// Installs a text file sink. Replaces any sinks added before.
void init_logging(const std::string& log_file = "s3sync.log",
                  severity_level min_level = severity_level::info);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
severity_level parse_severity(const std::string& name);

void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

} // namespace s3sync::logging

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_SEV(s3sync::logging::global_logger::get(), boost::log::trivial::trace)
#define LOG_DEBUG BOOST_LOG_SEV(s3sync::logging::global_logger::get(), boost::log::trivial::debug)
#define LOG_INFO BOOST_LOG_SEV(s3sync::logging::global_logger::get(), boost::log::trivial::info)
#define LOG_WARN BOOST_LOG_SEV(s3sync::logging::global_logger::get(), boost::log::trivial::warning)
#define LOG_ERROR BOOST_LOG_SEV(s3sync::logging::global_logger::get(), boost::log::trivial::error)
#define LOG_FATAL BOOST_LOG_SEV(s3sync::logging::global_logger::get(), boost::log::trivial::fatal)

#endif // S3SYNC_LOGGER_HPP
