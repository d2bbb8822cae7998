// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>

#include "core/reparentengine.h"
#include "core/shelllocator.h"
#include "core/zordermanager.h"
#include "mockwindowsystem.h"

#include <memory>

using namespace DeskPin;

/**
 * @brief Unit tests for ReparentEngine
 *
 * Tests cover:
 * - Screen position preserved across attach and detach, on any desktop origin
 * - Parent, style and Z-order registration after attach
 * - Failure paths leave nothing half-attached
 * - Container cache lifecycle
 */
class TestReparentEngine : public QObject
{
    Q_OBJECT

private:
    static constexpr QRect NoteRect{100, 200, 300, 150};

    void buildEngine(const QRect& desktop, bool workerW = false)
    {
        m_mock = std::make_unique<MockWindowSystem>();
        if (workerW) {
            m_mock->createWorkerWShell(desktop);
        } else {
            m_mock->createProgmanShell(desktop);
        }
        m_locator = std::make_unique<ShellLocator>(m_mock.get());
        m_zorder = std::make_unique<ZOrderManager>(m_mock.get(), m_locator.get());
        m_engine = std::make_unique<ReparentEngine>(m_mock.get(), m_locator.get(), m_zorder.get());
    }

    NativeHandle createNote(quint32 style = WindowStyle::Popup)
    {
        return m_mock->createWindow(QStringLiteral("Note"), NoteRect, NativeHandle(), style);
    }

    std::unique_ptr<MockWindowSystem> m_mock;
    std::unique_ptr<ShellLocator> m_locator;
    std::unique_ptr<ZOrderManager> m_zorder;
    std::unique_ptr<ReparentEngine> m_engine;

private Q_SLOTS:
    void init()
    {
        buildEngine(QRect(-1920, 0, 3840, 1080));
    }

    void cleanup()
    {
        m_engine.reset();
        m_zorder.reset();
        m_locator.reset();
        m_mock.reset();
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Attach
    // ═══════════════════════════════════════════════════════════════════════════

    void testAttach_preservesScreenPosition_data()
    {
        QTest::addColumn<QRect>("desktop");
        QTest::addColumn<bool>("workerW");
        QTest::newRow("progman at origin") << QRect(0, 0, 1920, 1080) << false;
        QTest::newRow("progman left of primary") << QRect(-1920, 0, 3840, 1080) << false;
        QTest::newRow("progman above primary") << QRect(0, -1080, 1920, 2160) << false;
        QTest::newRow("workerw left of primary") << QRect(-1920, 0, 3840, 1080) << true;
    }

    void testAttach_preservesScreenPosition()
    {
        QFETCH(QRect, desktop);
        QFETCH(bool, workerW);
        buildEngine(desktop, workerW);
        const NativeHandle note = createNote();

        QVERIFY(m_engine->attachWindow(QStringLiteral("note"), note));

        QCOMPARE(m_mock->screenRectOf(note), NoteRect);
        QCOMPARE(m_mock->parentOf(note), m_mock->container);
    }

    void testAttach_keepsPopupAndSetsVisible()
    {
        const NativeHandle note = createNote(WindowStyle::Popup);

        QVERIFY(m_engine->attachWindow(QStringLiteral("note"), note));

        const quint32 style = m_mock->styleOf(note);
        QVERIFY(style & WindowStyle::Popup);
        QVERIFY(style & WindowStyle::Visible);
        QVERIFY(!(style & WindowStyle::Child));
    }

    void testAttach_visibleWindowStyleUntouched()
    {
        const NativeHandle note = createNote(WindowStyle::Popup | WindowStyle::Visible);

        QVERIFY(m_engine->attachWindow(QStringLiteral("note"), note));

        QVERIFY(m_mock->callsNamed(QStringLiteral("setWindowStyle")).isEmpty());
        QCOMPARE(m_mock->styleOf(note), quint32(WindowStyle::Popup | WindowStyle::Visible));
    }

    void testAttach_registersTopmost()
    {
        const NativeHandle first = createNote();
        const NativeHandle second = createNote();

        QVERIFY(m_engine->attachWindow(QStringLiteral("first"), first));
        QVERIFY(m_engine->attachWindow(QStringLiteral("second"), second));

        QCOMPARE(m_zorder->windowOrder(), (QStringList{QStringLiteral("first"), QStringLiteral("second")}));
        const QVector<NativeHandle> stack = m_mock->stack(m_mock->container);
        QCOMPARE(stack.at(0), second);
        QCOMPARE(stack.at(1), first);
        QCOMPARE(stack.constLast(), m_mock->iconView);
    }

    void testAttach_againRaisesAndReorders()
    {
        const NativeHandle lower = createNote();
        const NativeHandle upper = createNote();
        QVERIFY(m_engine->attachWindow(QStringLiteral("lower"), lower));
        QVERIFY(m_engine->attachWindow(QStringLiteral("upper"), upper));

        QVERIFY(m_engine->attachWindow(QStringLiteral("lower"), lower));

        QCOMPARE(m_zorder->count(), 2);
        QCOMPARE(m_mock->screenRectOf(lower), NoteRect);
        // Queue and OS stack agree: re-attached window on top
        QCOMPARE(m_zorder->windowOrder(), (QStringList{QStringLiteral("upper"), QStringLiteral("lower")}));
        const QVector<NativeHandle> stack = m_mock->stack(m_mock->container);
        QCOMPARE(stack.at(0), lower);
        QCOMPARE(stack.at(1), upper);
    }

    void testAttach_invalidInput()
    {
        QVERIFY(!m_engine->attachWindow(QString(), createNote()));
        QVERIFY(!m_engine->attachWindow(QStringLiteral("note"), NativeHandle()));
        QVERIFY(m_mock->callsNamed(QStringLiteral("setParent")).isEmpty());
    }

    void testAttach_shellNotFound()
    {
        m_mock->destroyWindow(m_mock->iconView);
        const NativeHandle note = createNote();

        QVERIFY(!m_engine->attachWindow(QStringLiteral("note"), note));

        QVERIFY(m_mock->parentOf(note).isNull());
        QVERIFY(m_mock->callsNamed(QStringLiteral("setParent")).isEmpty());
        QVERIFY(!m_engine->isAttached(QStringLiteral("note")));
        QCOMPARE(m_zorder->count(), 0);
    }

    void testAttach_unreadableWindow()
    {
        const NativeHandle note = createNote();
        m_mock->failingCalls.insert(QStringLiteral("windowRect"));

        QVERIFY(!m_engine->attachWindow(QStringLiteral("note"), note));

        QVERIFY(m_mock->parentOf(note).isNull());
        QCOMPARE(m_mock->styleOf(note), quint32(WindowStyle::Popup));
    }

    void testAttach_setParentFailureRestoresStyle()
    {
        const NativeHandle note = createNote(WindowStyle::Popup);
        m_mock->failingCalls.insert(QStringLiteral("setParent"));

        QVERIFY(!m_engine->attachWindow(QStringLiteral("note"), note));

        QCOMPARE(m_mock->styleOf(note), quint32(WindowStyle::Popup));
        QCOMPARE(m_mock->callsNamed(QStringLiteral("setWindowStyle")).size(), 2);
        QVERIFY(!m_engine->isAttached(QStringLiteral("note")));
        QCOMPARE(m_zorder->count(), 0);
    }

    void testAttach_positionFailureRollsBack()
    {
        const NativeHandle note = createNote();
        m_mock->failingCalls.insert(QStringLiteral("setWindowPosition"));

        QVERIFY(!m_engine->attachWindow(QStringLiteral("note"), note));

        // Back to a top-level window at its original place
        QVERIFY(m_mock->parentOf(note).isNull());
        QCOMPARE(m_mock->screenRectOf(note), NoteRect);
        QVERIFY(!m_engine->isAttached(QStringLiteral("note")));
        QVERIFY(!m_zorder->isRegistered(QStringLiteral("note")));
        QVERIFY(!m_zorder->isSweepTimerActive());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Detach
    // ═══════════════════════════════════════════════════════════════════════════

    void testDetach_restoresTopLevelAtSamePosition()
    {
        const NativeHandle note = createNote();
        QVERIFY(m_engine->attachWindow(QStringLiteral("note"), note));

        QVERIFY(m_engine->detachWindow(QStringLiteral("note"), note));

        QVERIFY(m_mock->parentOf(note).isNull());
        QCOMPARE(m_mock->screenRectOf(note), NoteRect);
        QVERIFY(m_mock->styleOf(note) & WindowStyle::Visible);
        QVERIFY(!m_zorder->isRegistered(QStringLiteral("note")));
        QVERIFY(!m_zorder->isSweepTimerActive());
    }

    void testDetach_unregistersBeforeTouchingWindow()
    {
        const NativeHandle note = createNote();
        QVERIFY(m_engine->attachWindow(QStringLiteral("note"), note));
        m_mock->calls.clear();

        bool parentChangedFirst = true;
        QSignalSpy spy(m_zorder.get(), &ZOrderManager::windowUnregistered);
        connect(m_zorder.get(), &ZOrderManager::windowUnregistered, this, [&]() {
            parentChangedFirst = !m_mock->callsNamed(QStringLiteral("setParent")).isEmpty();
        });

        QVERIFY(m_engine->detachWindow(QStringLiteral("note"), note));

        QCOMPARE(spy.count(), 1);
        QVERIFY(!parentChangedFirst);
    }

    void testDetach_failureStillUntracks()
    {
        const NativeHandle note = createNote();
        QVERIFY(m_engine->attachWindow(QStringLiteral("note"), note));
        m_mock->failingCalls.insert(QStringLiteral("setParent"));

        QVERIFY(!m_engine->detachWindow(QStringLiteral("note"), note));

        QVERIFY(!m_zorder->isRegistered(QStringLiteral("note")));
        QVERIFY(!m_engine->isAttached(QStringLiteral("note")));
    }

    void testDetach_destroyedWindow()
    {
        const NativeHandle note = createNote();
        QVERIFY(m_engine->attachWindow(QStringLiteral("note"), note));
        m_mock->destroyWindow(note);

        QVERIFY(!m_engine->detachWindow(QStringLiteral("note"), note));

        QCOMPARE(m_zorder->count(), 0);
        QVERIFY(m_engine->attachedWindows().isEmpty());
    }

    void testDetach_nullHandle()
    {
        const NativeHandle note = createNote();
        QVERIFY(m_engine->attachWindow(QStringLiteral("note"), note));

        QVERIFY(!m_engine->detachWindow(QStringLiteral("note"), NativeHandle()));

        QCOMPARE(m_zorder->count(), 0);
        QVERIFY(!m_engine->isAttached(QStringLiteral("note")));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Container cache
    // ═══════════════════════════════════════════════════════════════════════════

    void testContainerCache_lifecycle()
    {
        const NativeHandle a = createNote();
        const NativeHandle b = createNote();
        QVERIFY(!m_engine->isAttached(QStringLiteral("a")));

        QVERIFY(m_engine->attachWindow(QStringLiteral("a"), a));
        QVERIFY(m_engine->attachWindow(QStringLiteral("b"), b));
        QCOMPARE(m_engine->containerFor(QStringLiteral("a")), m_mock->container);
        QCOMPARE(m_engine->attachedWindows().size(), 2);

        QVERIFY(m_engine->detachWindow(QStringLiteral("a"), a));
        QVERIFY(m_engine->containerFor(QStringLiteral("a")).isNull());
        QVERIFY(m_engine->isAttached(QStringLiteral("b")));

        m_engine->forgetAll();
        QVERIFY(m_engine->attachedWindows().isEmpty());
    }
};

QTEST_MAIN(TestReparentEngine)
#include "test_reparent_engine.moc"
