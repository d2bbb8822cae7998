// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "deskpin_export.h"
#include "interfaces.h"
#include <QPointer>

class QWindow;

namespace DeskPin {

/**
 * @brief WindowObserver fed by a QWindow
 *
 * Emits focused() when the window becomes active and closed() when the
 * QWindow is destroyed. The observer is a child of the window, so it lives
 * exactly as long as the window does.
 */
class DESKPIN_EXPORT QtWindowObserver : public WindowObserver
{
    Q_OBJECT

public:
    explicit QtWindowObserver(QWindow* window);
    ~QtWindowObserver() override;

    /**
     * @brief Get the observer attached to @p window, creating it on first use
     */
    static QtWindowObserver* forWindow(QWindow* window);

    QWindow* window() const { return m_window; }

private:
    QPointer<QWindow> m_window;
};

} // namespace DeskPin
