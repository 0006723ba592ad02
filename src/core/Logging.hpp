#pragma once

#include <QString>
#include <boost/log/trivial.hpp>

namespace cctl {

/// Map a level name (DEBUG, INFO, WARN, ERROR, CRITICAL, ...) to a severity.
/// Unknown names map to warning.
boost::log::trivial::severity_level parseLogLevel(const QString& name);

/// Install the global severity filter for BOOST_LOG_TRIVIAL.
void initLogging(const QString& levelName);

} // namespace cctl
