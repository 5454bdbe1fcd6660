#include "cruxenclave/logger.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

#include <filesystem>
#include <iostream>

#include "cruxenclave/errors.hpp"

namespace CruxEnclave {

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

const char* to_string(severity_level level) {
    switch (level) {
        case severity_level::trace:   return "TRACE";
        case severity_level::debug:   return "DEBUG";
        case severity_level::info:    return "INFO";
        case severity_level::warning: return "WARNING";
        case severity_level::error:   return "ERROR";
        case severity_level::fatal:   return "FATAL";
        default:                      return "UNKNOWN";
    }
}

std::ostream& operator<<(std::ostream& strm, severity_level level) {
    strm << to_string(level);
    return strm;
}

severity_level parse_severity(const std::string& name) {
    if (name == "trace") return severity_level::trace;
    if (name == "debug") return severity_level::debug;
    if (name == "info") return severity_level::info;
    if (name == "warning") return severity_level::warning;
    if (name == "error") return severity_level::error;
    if (name == "fatal") return severity_level::fatal;
    throw InvalidArgument("Unknown log level: " + name);
}

BOOST_LOG_GLOBAL_LOGGER_INIT(global_logger, severity_logger_t) {
    severity_logger_t logger;
    logger.add_attribute("TimeStamp", boost::log::attributes::local_clock());
    logger.add_attribute("ThreadID", boost::log::attributes::current_thread_id());
    return logger;
}

void init_logging(const std::string& log_file, severity_level min_level) {
    namespace expr = boost::log::expressions;
    namespace sinks = boost::log::sinks;

    auto formatter = expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << severity << "] "
        << expr::smessage;

    try {
        boost::log::core::get()->remove_all_sinks();

        if (log_file.empty()) {
            auto backend = boost::make_shared<sinks::text_ostream_backend>();
            backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
            backend->auto_flush(true);

            using text_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;
            auto sink = boost::make_shared<text_sink>(backend);
            sink->set_formatter(formatter);
            boost::log::core::get()->add_sink(sink);
        } else {
            auto backend = boost::make_shared<sinks::text_file_backend>();
            std::filesystem::path log_path = std::filesystem::absolute(log_file);
            backend->set_file_name_pattern(log_path.string());
            backend->set_open_mode(std::ios::out | std::ios::app);
            backend->auto_flush(true);

            using text_sink = sinks::synchronous_sink<sinks::text_file_backend>;
            auto sink = boost::make_shared<text_sink>(backend);
            sink->set_formatter(formatter);
            boost::log::core::get()->add_sink(sink);
        }

        boost::log::core::get()->set_filter(severity >= min_level);
        boost::log::core::get()->set_logging_enabled(true);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

} // namespace CruxEnclave
