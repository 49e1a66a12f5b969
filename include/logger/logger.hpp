#ifndef BLOBDVM_LOGGER_HPP
#define BLOBDVM_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace blobdvm::logger {

using severity_level = boost::log::trivial::severity_level;

// Maps "trace", "debug", "info", "warning", "error" or "fatal" to a
// severity level, throws std::invalid_argument for anything else
severity_level parse_severity(const std::string& name);

// Installs a text file sink (timestamp, severity, thread id) and, when
// console is set, a console sink. An empty log_file skips the file sink.
// Replaces any sinks installed earlier.
void init_logging(const std::string& log_file,
                  severity_level min_level = severity_level::info,
                  bool console = false);

// Flushes and removes every sink
void shutdown_logging();

} // namespace blobdvm::logger

#endif // BLOBDVM_LOGGER_HPP
