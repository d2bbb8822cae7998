// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowobserver.h"
#include <QWindow>

namespace DeskPin {

QtWindowObserver::QtWindowObserver(QWindow* window)
    : WindowObserver(window)
    , m_window(window)
{
    Q_ASSERT(window);

    connect(window, &QWindow::activeChanged, this, [this]() {
        if (m_window && m_window->isActive()) {
            Q_EMIT focused();
        }
    });
    // destroyed() fires before the window deletes its children, so this observer is still alive
    connect(window, &QObject::destroyed, this, &WindowObserver::closed);
}

QtWindowObserver::~QtWindowObserver() = default;

QtWindowObserver* QtWindowObserver::forWindow(QWindow* window)
{
    if (!window) {
        return nullptr;
    }
    if (auto* existing = window->findChild<QtWindowObserver*>(QString(), Qt::FindDirectChildrenOnly)) {
        return existing;
    }
    return new QtWindowObserver(window);
}

} // namespace DeskPin
