#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace lnc {

namespace logging = boost::log;

bool setLogLevel(const QString& level)
{
    const QString name = level.trimmed().toLower();
    auto core = logging::core::get();

    if (name == "none" || name == "off") {
        core->set_logging_enabled(false);
        return true;
    }
    core->set_logging_enabled(true);

    logging::trivial::severity_level severity = logging::trivial::info;
    bool known = true;
    if (name == "trace") severity = logging::trivial::trace;
    else if (name == "debug") severity = logging::trivial::debug;
    else if (name == "info") severity = logging::trivial::info;
    else if (name == "warning" || name == "warn") severity = logging::trivial::warning;
    else if (name == "error") severity = logging::trivial::error;
    else if (name == "fatal") severity = logging::trivial::fatal;
    else known = false;

    core->set_filter(logging::trivial::severity >= severity);
    return known;
}

void initLogging(const QString& level)
{
    if (!setLogLevel(level))
        BOOST_LOG_TRIVIAL(warning) << "[Logging] Unknown level '" << level.toStdString() << "', using info";
}

} // namespace lnc
