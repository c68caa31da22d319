#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>

namespace peerchunks::logger {

namespace {

namespace expr = boost::log::expressions;

// "timestamp [severity] message"
auto make_formatter() {
  return expr::stream
    << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
    << " [" << boost::log::trivial::severity << "] "
    << expr::smessage;
}

} // namespace

void init_logging(const std::string& log_file, boost::log::trivial::severity_level min_level, bool console) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    // Create and configure text file sink backend
    auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

    // Convert to absolute path
    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    backend->set_file_name_pattern(log_path.string());
    backend->set_open_mode(std::ios::out | std::ios::app);
    backend->auto_flush(true);

    using file_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
    auto sink = boost::make_shared<file_sink>(backend);
    sink->set_formatter(make_formatter());
    boost::log::core::get()->add_sink(sink);

    if (console) {
      auto console_backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
      console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      console_backend->auto_flush(true);

      using console_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
      auto terminal = boost::make_shared<console_sink>(console_backend);
      terminal->set_formatter(make_formatter());
      boost::log::core::get()->add_sink(terminal);
    }

    // Add attributes to the core
    boost::log::add_common_attributes();
    set_log_level(min_level);
    boost::log::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(debug) << "Logger: Logging initialized with file: " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(boost::log::trivial::severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

} // namespace peerchunks::logger
