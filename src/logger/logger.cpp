#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace pcloud::logger {

void init(const LogOptions& options, std::ostream& console) {
    namespace logging = boost::log;
    namespace keywords = boost::log::keywords;
    namespace expr = boost::log::expressions;

    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();
    logging::add_common_attributes();

    const auto format = (
        expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << " [" << logging::trivial::severity << "]"
            << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
            << " " << expr::smessage
    );

    logging::add_console_log(
        console,
        keywords::format = format,
        keywords::auto_flush = true
    );

    if (!options.log_file.empty()) {
        logging::add_file_log(
            keywords::file_name = options.log_file,
            keywords::open_mode = std::ios::out | std::ios::app,
            keywords::format = format,
            keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
            keywords::auto_flush = true
        );
    }

    logging::core::get()->set_filter(logging::trivial::severity >= options.min_severity);
}

} // namespace pcloud::logger
