// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "pinnedwindow.h"
#include "../config/settings.h"
#include "../core/desktopattach.h"
#include "../core/logging.h"
#include <QCommandLineParser>
#include <QGuiApplication>
#include <QTimer>
#include <KAboutData>
#include <memory>
#include <vector>

using namespace DeskPin;

int main(int argc, char* argv[])
{
    QGuiApplication app(argc, argv);

    KAboutData aboutData(QStringLiteral("deskpin-demo"), QStringLiteral("DeskPin Demo"), QStringLiteral("1.0.0"),
                         QStringLiteral("Pins windows above the desktop icons"), KAboutLicense::GPL_V3,
                         QStringLiteral("© 2026 fuddlesworth"));
    aboutData.addAuthor(QStringLiteral("fuddlesworth"));
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption countOption(QStringList{QStringLiteral("n"), QStringLiteral("count")},
                                   QStringLiteral("Number of windows to pin"), QStringLiteral("count"),
                                   QStringLiteral("2"));
    parser.addOption(countOption);

    QCommandLineOption detachOption(QStringList{QStringLiteral("d"), QStringLiteral("detach-after")},
                                    QStringLiteral("Detach all windows after the given delay (0 = never)"),
                                    QStringLiteral("ms"), QStringLiteral("0"));
    parser.addOption(detachOption);

    parser.process(app);
    aboutData.processCommandLine(&parser);

    bool ok = false;
    const int count = parser.value(countOption).toInt(&ok);
    if (!ok || count < 1 || count > 16) {
        qCCritical(lcDemo) << "Invalid --count" << parser.value(countOption) << "(expected 1-16)";
        return 1;
    }
    const int detachAfter = parser.value(detachOption).toInt(&ok);
    if (!ok || detachAfter < 0) {
        qCCritical(lcDemo) << "Invalid --detach-after" << parser.value(detachOption);
        return 1;
    }

    Settings settings;
    settings.load();

    DesktopAttach desktop;
    desktop.setZOrderConfig(settings.zOrderConfig());
    QObject::connect(&settings, &Settings::settingsChanged, &desktop, [&desktop, &settings]() {
        desktop.setZOrderConfig(settings.zOrderConfig());
    });

    if (!desktop.isAvailable()) {
        qCInfo(lcDemo) << "Desktop attach unavailable:" << desktop.unavailableReason()
                       << "- windows stay ordinary top-level windows";
    }

    std::vector<std::unique_ptr<PinnedWindow>> windows;
    for (int i = 0; i < count; ++i) {
        const QString windowId = QStringLiteral("demo-%1").arg(i + 1);
        auto window = std::make_unique<PinnedWindow>(windowId, QColor::fromHsv((i * 67) % 360, 160, 200));
        window->setGeometry(80 + i * 60, 80 + i * 60, 240, 160);
        window->show();

        if (desktop.attach(windowId, window.get())) {
            qCInfo(lcDemo) << "Pinned" << windowId;
        }
        windows.push_back(std::move(window));
    }

    if (detachAfter > 0) {
        QTimer::singleShot(detachAfter, &desktop, [&desktop, &windows]() {
            for (const auto& window : windows) {
                desktop.detach(window->label(), window.get());
            }
        });
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &desktop, &DesktopAttach::cleanupAll);

    return app.exec();
}
