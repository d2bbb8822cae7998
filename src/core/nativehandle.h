// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "deskpin_export.h"
#include <QByteArray>
#include <QDebug>
#include <QHashFunctions>
#include <QtGlobal>
#include <qwindowdefs.h>

namespace DeskPin {

/**
 * @brief Opaque identifier of an OS window
 *
 * Wraps the platform-sized integer the windowing API hands out. The value is
 * owned by the OS and only borrowed here: it can be compared and passed back
 * to the binding layer, nothing else. A default-constructed handle is null.
 */
class DESKPIN_EXPORT NativeHandle
{
public:
    constexpr NativeHandle() = default;
    constexpr explicit NativeHandle(quintptr value)
        : m_value(value)
    {
    }

    /**
     * @brief Wrap the id returned by QWindow::winId()
     */
    static NativeHandle fromWinId(WId id)
    {
        return NativeHandle(static_cast<quintptr>(id));
    }

    /**
     * @brief Decode a native-handle buffer
     * @param bytes 4- or 8-byte little-endian handle value
     * @return Decoded handle, or a null handle for any other buffer length
     */
    static NativeHandle fromBytes(const QByteArray& bytes);

    constexpr quintptr value() const { return m_value; }
    constexpr bool isNull() const { return m_value == 0; }

    friend constexpr bool operator==(NativeHandle a, NativeHandle b) { return a.m_value == b.m_value; }
    friend constexpr bool operator!=(NativeHandle a, NativeHandle b) { return a.m_value != b.m_value; }

private:
    quintptr m_value = 0;
};

inline size_t qHash(NativeHandle handle, size_t seed = 0) noexcept
{
    return qHash(handle.value(), seed);
}

DESKPIN_EXPORT QDebug operator<<(QDebug debug, NativeHandle handle);

} // namespace DeskPin
