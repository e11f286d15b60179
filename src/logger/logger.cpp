#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>

namespace cloudsim {
namespace logging {

namespace {

constexpr std::size_t LOG_ROTATION_SIZE = 10 * 1024 * 1024;

} // namespace

void init_logging(const std::string& log_file, severity_level min_level) {
  namespace expr = boost::log::expressions;
  namespace keywords = boost::log::keywords;

  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    boost::log::formatter format = expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "]"
      << " [" << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "] "
      << expr::smessage;

    boost::log::add_console_log(std::clog, keywords::format = format, keywords::auto_flush = true);

    if (!log_file.empty()) {
      // Rotating text file backend, appended across runs
      std::filesystem::path log_path = std::filesystem::absolute(log_file);
      auto backend = boost::make_shared<boost::log::sinks::text_file_backend>(
        keywords::file_name = log_path.string(),
        keywords::rotation_size = LOG_ROTATION_SIZE,
        keywords::open_mode = std::ios::out | std::ios::app
      );
      backend->auto_flush(true);

      using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
      auto sink = boost::make_shared<text_sink>(backend);
      sink->set_formatter(format);
      boost::log::core::get()->add_sink(sink);
    }

    boost::log::add_common_attributes();
    set_log_level(min_level);
    boost::log::core::get()->set_logging_enabled(true);
  } catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

} // namespace logging
} // namespace cloudsim
