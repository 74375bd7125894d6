#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

namespace lxp {

bool parseLogLevel(const QString& name, boost::log::trivial::severity_level* level)
{
    using boost::log::trivial::severity_level;

    const QString key = name.trimmed().toLower();
    bool known = true;

    if (key == QLatin1String("trace"))
        *level = severity_level::trace;
    else if (key == QLatin1String("debug"))
        *level = severity_level::debug;
    else if (key == QLatin1String("info"))
        *level = severity_level::info;
    else if (key == QLatin1String("warning"))
        *level = severity_level::warning;
    else if (key == QLatin1String("error"))
        *level = severity_level::error;
    else if (key == QLatin1String("fatal"))
        *level = severity_level::fatal;
    else {
        *level = severity_level::info;
        known = false;
    }
    return known;
}

void initLogging(boost::log::trivial::severity_level level)
{
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

} // namespace lxp
