#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

namespace cctl {

boost::log::trivial::severity_level parseLogLevel(const QString& name)
{
    using boost::log::trivial::severity_level;

    const QString level = name.trimmed().toUpper();
    if (level == "TRACE") return severity_level::trace;
    if (level == "DEBUG") return severity_level::debug;
    if (level == "INFO") return severity_level::info;
    if (level == "WARN" || level == "WARNING") return severity_level::warning;
    if (level == "ERROR") return severity_level::error;
    if (level == "CRITICAL" || level == "FATAL") return severity_level::fatal;
    return severity_level::warning;
}

void initLogging(const QString& levelName)
{
    const auto level = parseLogLevel(levelName);
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

} // namespace cctl
