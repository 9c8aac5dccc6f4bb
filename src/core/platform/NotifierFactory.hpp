#pragma once

#include "core/platform/IPlatformNotifier.hpp"
#include <memory>

namespace lnc {

class NotifyConfig;

/// Picks the notifier named by the "platform" setting. "auto" follows the host OS.
std::unique_ptr<IPlatformNotifier> createPlatformNotifier(const NotifyConfig& config);

} // namespace lnc
