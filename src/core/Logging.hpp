#pragma once

#include <QString>

namespace lnc {

/// Set the Boost.Log severity filter from a level name
/// (trace, debug, info, warning, error, fatal, none). Unknown names mean info.
/// Returns false if the name was not recognised.
bool setLogLevel(const QString& level);

/// Apply the initial severity filter to the default trivial logger.
void initLogging(const QString& level);

} // namespace lnc
