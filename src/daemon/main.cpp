// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"
#include "../core/logging.h"
#include <QGuiApplication>
#include <QCommandLineParser>
#include <KAboutData>
#include <KLocalizedString>
#include <KDBusService>
#include <signal.h>

using namespace QuickWheel;

namespace {

Daemon* s_daemon = nullptr;

void handleTerminationSignal(int)
{
    if (s_daemon) {
        s_daemon->stop();
    }
    QCoreApplication::quit();
}

void installTerminationHandlers()
{
    for (int sig : {SIGINT, SIGTERM, SIGHUP}) {
        signal(sig, handleTerminationSignal);
    }
}

} // namespace

int main(int argc, char* argv[])
{
    QGuiApplication app(argc, argv);
    // Overlay windows come and go with the chord; they must not end the daemon
    app.setQuitOnLastWindowClosed(false);
    KLocalizedString::setApplicationDomain("quickwheeld");

    KAboutData aboutData(QStringLiteral("quickwheeld"), i18n("QuickWheel Daemon"), QStringLiteral("1.0.0"),
                         i18n("Radial quick-access menu driven by a held key chord"), KAboutLicense::GPL_V3,
                         i18n("© 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    aboutData.setDesktopFileName(QStringLiteral("org.quickwheel.daemon"));
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    const QCommandLineOption replaceOption(QStringList{QStringLiteral("r"), QStringLiteral("replace")},
                                           i18n("Take over from a running quickwheeld"));
    parser.addOption(replaceOption);
    parser.process(app);
    aboutData.processCommandLine(&parser);

    // Two daemons would both grab the chord
    KDBusService service(parser.isSet(replaceOption) ? KDBusService::Unique | KDBusService::Replace
                                                     : KDBusService::StartupOptions(KDBusService::Unique));

    Daemon daemon;
    s_daemon = &daemon;
    installTerminationHandlers();

    if (!daemon.init()) {
        qCCritical(lcDaemon) << "quickwheeld could not initialize, exiting";
        s_daemon = nullptr;
        return 1;
    }

    // A second launch without --replace lands here; the wheel is chord-driven, so there is nothing to raise
    QObject::connect(&service, &KDBusService::activateRequested, &daemon, []() {
        qCDebug(lcDaemon) << "Ignoring activation request from a second instance";
    });

    daemon.start();
    qCInfo(lcDaemon) << "quickwheeld running";

    const int exitCode = app.exec();
    daemon.stop();
    s_daemon = nullptr;
    return exitCode;
}
