#ifndef CLOUDSIM_LOGGER_LOGGER_HPP
#define CLOUDSIM_LOGGER_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace cloudsim {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

// Installs a console sink and, when log_file is not empty, a rotating file sink.
// Replaces any sinks installed earlier.
void init_logging(const std::string& log_file = "",
                  severity_level min_level = boost::log::trivial::info);

// Changes the minimum severity of every installed sink
void set_log_level(severity_level min_level);

} // namespace logging
} // namespace cloudsim

#endif // CLOUDSIM_LOGGER_LOGGER_HPP
