#include "core/platform/NotifierFactory.hpp"
#include "core/NotifyConfig.hpp"
#include "core/platform/AndroidNotifier.hpp"
#include "core/platform/IosNotifier.hpp"
#include "core/platform/NullNotifier.hpp"
#include <boost/log/trivial.hpp>

namespace lnc {

std::unique_ptr<IPlatformNotifier> createPlatformNotifier(const NotifyConfig& config)
{
    QString platform = config.platform();
    if (platform == "auto") {
#if defined(Q_OS_ANDROID)
        platform = "android";
#elif defined(Q_OS_IOS)
        platform = "ios";
#else
        platform = "null";
#endif
    }

    if (platform == "android") {
        AndroidChannelConfig channel;
        channel.id = config.androidChannelId();
        channel.name = config.androidChannelName();
        channel.description = config.androidChannelDescription();
        channel.importance = config.androidImportance();
        return std::make_unique<AndroidNotifier>(channel, config.androidSdkLevel());
    }

    if (platform == "ios")
        return std::make_unique<IosNotifier>(config.iosAutoIncrementBadge());

    if (platform != "null")
        BOOST_LOG_TRIVIAL(warning) << "[NotifierFactory] Unknown platform '" << platform.toStdString()
                                   << "', using null notifier";
    return std::make_unique<NullNotifier>(config.androidMaxPending());
}

} // namespace lnc
