#include <signal.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <boost/log/trivial.hpp>
#include <memory>
#include "core/Logging.hpp"
#include "core/NotifyConfig.hpp"
#include "core/platform/NotifierFactory.hpp"
#include "core/services/NotificationBuilder.hpp"
#include "core/services/NotificationService.hpp"

namespace {
lnc::NotificationService* g_service = nullptr;
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("notifcore");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("notifcore");

    QCommandLineParser parser;
    parser.setApplicationDescription("Local notification scheduler host");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOpt("config", "YAML config file.", "path",
                                 QDir::homePath() + "/.notifcore/config.yaml");
    QCommandLineOption platformOpt("platform", "Override platform (android, ios, null).", "name");
    QCommandLineOption scheduleOpt("schedule", "Schedule \"title|body|delaySeconds[|identifier[|group]]\".", "entry");
    QCommandLineOption cancelOpt("cancel", "Cancel by identifier.", "identifier");
    QCommandLineOption cancelGroupOpt("cancel-group", "Cancel every notification in a group.", "group");
    QCommandLineOption cancelAllOpt("cancel-all", "Cancel everything scheduled.");
    QCommandLineOption listOpt("list", "Print tracked notifications and debug info.");
    QCommandLineOption exportOpt("export-metrics", "Write a metrics snapshot.", "path");
    QCommandLineOption runOpt("run", "Keep running (timers deliver) until interrupted.");
    parser.addOptions({configOpt, platformOpt, scheduleOpt, cancelOpt, cancelGroupOpt,
                       cancelAllOpt, listOpt, exportOpt, runOpt});
    parser.process(app);

    lnc::NotifyConfig config;
    const QString configPath = parser.value(configOpt);
    if (QFile::exists(configPath))
        config.load(configPath);
    if (parser.isSet(platformOpt))
        config.setPlatform(parser.value(platformOpt));

    lnc::initLogging(config.logLevel());

    // --- Platform + service ---
    std::unique_ptr<lnc::IPlatformNotifier> notifier = lnc::createPlatformNotifier(config);
    auto service = std::make_unique<lnc::NotificationService>(notifier.get(), config);
    if (!service->initialize()) {
        BOOST_LOG_TRIVIAL(fatal) << "[main] Notification service failed to start";
        return 1;
    }

    service->events().subscribe("console", [](const lnc::NotificationEvent& e) {
        BOOST_LOG_TRIVIAL(info) << "[main] Event " << lnc::eventTypeToString(e.type).toStdString()
                                << ": " << e.title.toStdString()
                                << (e.error.isEmpty() ? std::string() : " (" + e.error.toStdString() + ")");
    });

    // The platform prompt answers through the event loop.
    if (!service->hasPermission()) {
        QEventLoop wait;
        bool answered = false;
        service->requestPermission([&](bool) {
            answered = true;
            wait.quit();
        });
        if (!answered)
            wait.exec();
        if (!service->hasPermission())
            BOOST_LOG_TRIVIAL(warning) << "[main] Notification permission denied";
    }

    int status = 0;

    for (const QString& entry : parser.values(scheduleOpt)) {
        const QStringList parts = entry.split('|');
        if (parts.size() < 3) {
            BOOST_LOG_TRIVIAL(error) << "[main] Bad --schedule value: " << entry.toStdString();
            status = 2;
            continue;
        }
        lnc::NotificationBuilder builder;
        builder.title(parts.at(0)).body(parts.at(1)).delay(parts.at(2).toLongLong());
        if (parts.size() > 3) builder.identifier(parts.at(3));
        if (parts.size() > 4) builder.group(parts.at(4));
        if (!builder.schedule(*service))
            status = 1;
    }

    for (const QString& id : parser.values(cancelOpt))
        service->cancel(id);
    for (const QString& group : parser.values(cancelGroupOpt))
        service->cancelGroup(group);
    if (parser.isSet(cancelAllOpt))
        service->cancelAll();

    if (parser.isSet(listOpt)) {
        for (const QString& id : service->scheduledIdentifiers())
            BOOST_LOG_TRIVIAL(info) << "[main] " << id.toStdString() << " "
                                    << lnc::notificationStatusToString(service->notificationStatus(id)).toStdString();
        QJsonDocument doc(QJsonObject::fromVariantMap(service->debugInfo()));
        BOOST_LOG_TRIVIAL(info) << "[main] " << doc.toJson(QJsonDocument::Compact).toStdString();
    }

    if (parser.isSet(exportOpt) && !service->exportMetrics(parser.value(exportOpt)))
        status = 1;

    if (!parser.isSet(runOpt)) {
        service->flushNow();
        service->shutdown();
        return status;
    }

    // SIGUSR1 / SIGUSR2 simulate the app going to background / foreground.
    g_service = service.get();
    signal(SIGUSR1, [](int) {
        QMetaObject::invokeMethod(g_service, []() { g_service->handleAppBackgrounded(); },
                                  Qt::QueuedConnection);
    });
    signal(SIGUSR2, [](int) {
        QMetaObject::invokeMethod(g_service, []() { g_service->handleAppForegrounded(); },
                                  Qt::QueuedConnection);
    });
    signal(SIGINT, [](int) { QMetaObject::invokeMethod(qApp, &QCoreApplication::quit, Qt::QueuedConnection); });
    signal(SIGTERM, [](int) { QMetaObject::invokeMethod(qApp, &QCoreApplication::quit, Qt::QueuedConnection); });

    int ret = app.exec();

    // Service before notifier: shutdown flushes and detaches the event callback.
    service->shutdown();
    service.reset();
    g_service = nullptr;

    return ret == 0 ? status : ret;
}
