// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nativehandle.h"
#include <QtEndian>

namespace DeskPin {

NativeHandle NativeHandle::fromBytes(const QByteArray& bytes)
{
    // 64-bit hosts hand out 8 bytes, 32-bit hosts 4
    if (bytes.size() == 8) {
        return NativeHandle(static_cast<quintptr>(qFromLittleEndian<quint64>(bytes.constData())));
    }
    if (bytes.size() == 4) {
        return NativeHandle(static_cast<quintptr>(qFromLittleEndian<quint32>(bytes.constData())));
    }
    return NativeHandle();
}

QDebug operator<<(QDebug debug, NativeHandle handle)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "NativeHandle(0x" << Qt::hex << handle.value() << ')';
    return debug;
}

} // namespace DeskPin
