#ifndef PEERCHUNKS_LOGGER_HPP
#define PEERCHUNKS_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace peerchunks::logger {

// Installs the file sink (and optionally a console sink) on the Boost.Log core.
// Replaces any sinks installed earlier.
void init_logging(const std::string& log_file,
                  boost::log::trivial::severity_level min_level = boost::log::trivial::info,
                  bool console = true);

// Changes the minimum severity of every installed sink
void set_log_level(boost::log::trivial::severity_level min_level);

} // namespace peerchunks::logger

#endif // PEERCHUNKS_LOGGER_HPP
