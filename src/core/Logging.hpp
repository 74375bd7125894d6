#pragma once

#include <QString>
#include <boost/log/trivial.hpp>

namespace lxp {

/// Parse trace|debug|info|warning|error|fatal (case-insensitive).
/// Unknown names yield info and return false.
bool parseLogLevel(const QString& name, boost::log::trivial::severity_level* level);

/// Install the global Boost.Log severity filter.
void initLogging(boost::log::trivial::severity_level level);

} // namespace lxp
