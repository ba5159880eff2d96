#pragma once

#include <QString>
#include <boost/log/trivial.hpp>

namespace btp {

/// Parses trace|debug|info|warning|error|fatal (case-insensitive).
/// Returns false and leaves level untouched on unknown input.
bool parseLogLevel(const QString& name, boost::log::trivial::severity_level& level);

/// Drop records below level from the Boost.Log core.
void initLogging(boost::log::trivial::severity_level level);

} // namespace btp
