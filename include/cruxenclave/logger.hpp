#ifndef CRUXENCLAVE_LOGGER_HPP
#define CRUXENCLAVE_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <ostream>
#include <string>

namespace CruxEnclave {

// Severity levels, lowest first
enum class severity_level {
    trace,
    debug,
    info,
    warning,
    error,
    fatal
};

const char* to_string(severity_level level);
std::ostream& operator<<(std::ostream& strm, severity_level level);

/**
 * @brief Parses "trace", "debug", "info", "warning", "error" or "fatal".
 * @throws CruxEnclave::InvalidArgument for any other name.
 */
severity_level parse_severity(const std::string& name);

using severity_logger_t = boost::log::sources::severity_logger_mt<severity_level>;

BOOST_LOG_GLOBAL_LOGGER(global_logger, severity_logger_t)

/**
 * @brief Installs the log sink.
 * @param log_file Target file; an empty path logs to stderr.
 * @param min_level Records below this level are dropped.
 */
void init_logging(const std::string& log_file = "", severity_level min_level = severity_level::info);

} // namespace CruxEnclave

#define LOG_TRACE BOOST_LOG_SEV(CruxEnclave::global_logger::get(), CruxEnclave::severity_level::trace)
#define LOG_DEBUG BOOST_LOG_SEV(CruxEnclave::global_logger::get(), CruxEnclave::severity_level::debug)
#define LOG_INFO BOOST_LOG_SEV(CruxEnclave::global_logger::get(), CruxEnclave::severity_level::info)
#define LOG_WARN BOOST_LOG_SEV(CruxEnclave::global_logger::get(), CruxEnclave::severity_level::warning)
#define LOG_ERROR BOOST_LOG_SEV(CruxEnclave::global_logger::get(), CruxEnclave::severity_level::error)
#define LOG_FATAL BOOST_LOG_SEV(CruxEnclave::global_logger::get(), CruxEnclave::severity_level::fatal)

#endif // CRUXENCLAVE_LOGGER_HPP
