#include "logger/logger.hpp"
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace blobdvm::logger {

namespace {

namespace expr = boost::log::expressions;

// Shared record layout for every sink
auto make_formatter() {
    return expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << boost::log::trivial::severity << "]"
        << " [" << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "] "
        << expr::smessage;
}

} // namespace

severity_level parse_severity(const std::string& name) {
    if (name == "trace") return severity_level::trace;
    if (name == "debug") return severity_level::debug;
    if (name == "info") return severity_level::info;
    if (name == "warning" || name == "warn") return severity_level::warning;
    if (name == "error") return severity_level::error;
    if (name == "fatal") return severity_level::fatal;
    throw std::invalid_argument("Unknown log level: " + name);
}

void init_logging(const std::string& log_file, severity_level min_level, bool console) {
    auto core = boost::log::core::get();

    // Clear any existing sinks
    core->remove_all_sinks();

    if (!log_file.empty()) {
        auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

        std::filesystem::path log_path = std::filesystem::absolute(log_file);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        backend->set_file_name_pattern(log_path.string());
        backend->set_open_mode(std::ios::out | std::ios::app);
        backend->auto_flush(true);

        using file_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
        auto sink = boost::make_shared<file_sink>(backend);
        sink->set_formatter(make_formatter());
        core->add_sink(sink);
    }

    if (console) {
        auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
        backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
        backend->auto_flush(true);

        using console_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
        auto sink = boost::make_shared<console_sink>(backend);
        sink->set_formatter(make_formatter());
        core->add_sink(sink);
    }

    boost::log::add_common_attributes();
    core->set_filter(boost::log::trivial::severity >= min_level);
    core->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(info) << "Logger: Initialized (file: "
                            << (log_file.empty() ? std::string("none") : log_file)
                            << ", level: " << min_level << ")";
}

void shutdown_logging() {
    auto core = boost::log::core::get();
    core->flush();
    core->remove_all_sinks();
}

} // namespace blobdvm::logger
