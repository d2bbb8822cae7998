// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace DeskPin {

Q_LOGGING_CATEGORY(lcCore, "deskpin.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcProbe, "deskpin.probe", QtInfoMsg)
Q_LOGGING_CATEGORY(lcShell, "deskpin.shell", QtInfoMsg)
Q_LOGGING_CATEGORY(lcReparent, "deskpin.reparent", QtInfoMsg)
Q_LOGGING_CATEGORY(lcZOrder, "deskpin.zorder", QtInfoMsg)
Q_LOGGING_CATEGORY(lcConfig, "deskpin.config", QtInfoMsg)
Q_LOGGING_CATEGORY(lcDemo, "deskpin.demo", QtInfoMsg)

} // namespace DeskPin
