#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/keywords/format.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <iostream>

namespace btp {

namespace logging = boost::log;

bool parseLogLevel(const QString& name, logging::trivial::severity_level& level)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("trace"))        level = logging::trivial::trace;
    else if (key == QLatin1String("debug"))   level = logging::trivial::debug;
    else if (key == QLatin1String("info"))    level = logging::trivial::info;
    else if (key == QLatin1String("warning")) level = logging::trivial::warning;
    else if (key == QLatin1String("error"))   level = logging::trivial::error;
    else if (key == QLatin1String("fatal"))   level = logging::trivial::fatal;
    else return false;
    return true;
}

void initLogging(logging::trivial::severity_level level)
{
    // Diagnostics go to stderr so profile listings on stdout stay clean.
    logging::add_console_log(std::clog,
                             logging::keywords::format =
                                 (logging::expressions::stream
                                  << "[" << logging::trivial::severity << "] "
                                  << logging::expressions::smessage));
    logging::add_common_attributes();
    logging::core::get()->set_filter(logging::trivial::severity >= level);
}

} // namespace btp
