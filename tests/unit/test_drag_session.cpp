// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>
#include <QJsonDocument>
#include <QMimeData>
#include <memory>

#include "core/dragsession.h"
#include "core/interfaces.h"
#include "core/workspacestore.h"

using namespace Trellis;

namespace {

/**
 * @brief Records every workspace action instead of applying it
 */
class RecordingActions : public IWorkspaceActions
{
public:
    bool splitPane(const QString& paneId, SplitDirection direction, const WorkspaceTab& tab,
                   DropPosition edge) override
    {
        calls.append(QStringLiteral("split %1 %2 %3 %4")
                         .arg(paneId, SplitDirections::toString(direction), tab.id, DropPositions::toString(edge)));
        return true;
    }
    bool addTabToPane(const QString& paneId, const WorkspaceTab& tab) override
    {
        calls.append(QStringLiteral("add %1 %2").arg(paneId, tab.id));
        return true;
    }
    bool moveTabToPane(const QString& tabId, const QString& sourcePaneId, const QString& targetPaneId) override
    {
        calls.append(QStringLiteral("move %1 %2 %3").arg(tabId, sourcePaneId, targetPaneId));
        return true;
    }
    bool moveTabToNewSplit(const QString& tabId, const QString& sourcePaneId, const QString& targetPaneId,
                           DropPosition edge) override
    {
        calls.append(QStringLiteral("moveSplit %1 %2 %3 %4")
                         .arg(tabId, sourcePaneId, targetPaneId, DropPositions::toString(edge)));
        return true;
    }

    QStringList calls;
};

class FakeEditorFiles : public IEditorFiles
{
public:
    bool openFile(const QString& filePath) override
    {
        if (unopenable.contains(filePath)) {
            return false;
        }
        if (!open.contains(filePath)) {
            open.append(filePath);
        }
        return true;
    }
    QJsonArray openFileRecords() const override
    {
        return QJsonArray();
    }
    QString reopenFile(const QJsonObject&) override
    {
        return QString();
    }
    void clearAllFiles() override
    {
        open.clear();
    }
    QString activeFilePath() const override
    {
        return QString();
    }
    void setActiveFilePath(const QString&) override
    {
    }

    QStringList open;
    QStringList unopenable;
};

} // namespace

/**
 * @brief Unit tests for DragPayload and DragSession
 *
 * Tests cover:
 * - Payload wire format and rejection of malformed data
 * - Drag state transitions and signals
 * - Preview target tracking across panes
 * - Dispatch of tab and file drops to the workspace actions
 */
class TestDragSession : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    // ═══════════════════════════════════════════════════════════════════════════
    // DragPayload
    // ═══════════════════════════════════════════════════════════════════════════

    void testPayload_tabWireFormat()
    {
        const QByteArray wire = DragPayload::tab(QStringLiteral("term-1"), QStringLiteral("pane-1")).toWire();
        const QJsonObject json = QJsonDocument::fromJson(wire).object();
        QCOMPARE(json.value(QStringLiteral("type")).toString(), QStringLiteral("tab"));
        QCOMPARE(json.value(QStringLiteral("tabId")).toString(), QStringLiteral("term-1"));
        QCOMPARE(json.value(QStringLiteral("sourcePaneId")).toString(), QStringLiteral("pane-1"));

        const std::optional<DragPayload> parsed = DragPayload::fromWire(wire);
        QVERIFY(parsed.has_value());
        QVERIFY(parsed->isTab());
        QCOMPARE(parsed->tabId, QStringLiteral("term-1"));
    }

    void testPayload_fileWireFormat()
    {
        const std::optional<DragPayload> parsed =
            DragPayload::fromWire(QByteArrayLiteral("{\"type\":\"file\",\"filePath\":\"/p/a.cpp\"}"));
        QVERIFY(parsed.has_value());
        QVERIFY(parsed->isFile());
        QCOMPARE(parsed->filePath, QStringLiteral("/p/a.cpp"));
    }

    void testPayload_rejectsMalformed()
    {
        QVERIFY(!DragPayload::fromWire(QByteArray()).has_value());
        QVERIFY(!DragPayload::fromWire(QByteArrayLiteral("not json")).has_value());
        QVERIFY(!DragPayload::fromWire(QByteArrayLiteral("[1,2]")).has_value());
        QVERIFY(!DragPayload::fromWire(QByteArrayLiteral("{\"type\":\"window\"}")).has_value());
        QVERIFY(!DragPayload::fromWire(QByteArrayLiteral("{\"type\":\"tab\",\"tabId\":\"term-1\"}")).has_value());
        QVERIFY(!DragPayload::fromWire(QByteArrayLiteral("{\"type\":\"file\"}")).has_value());
    }

    void testPayload_mimeData()
    {
        const DragPayload payload = DragPayload::tab(QStringLiteral("term-1"), QStringLiteral("pane-1"));
        const std::unique_ptr<QMimeData> mimeData(payload.toMimeData());
        QVERIFY(mimeData->hasFormat(QStringLiteral("application/json")));
        const std::optional<DragPayload> parsed = DragPayload::fromMimeData(mimeData.get());
        QVERIFY(parsed.has_value());
        QVERIFY(*parsed == payload);

        QMimeData plainText;
        plainText.setText(QStringLiteral("/p/a.cpp"));
        QVERIFY(!DragPayload::fromMimeData(&plainText).has_value());
        QVERIFY(!DragPayload::fromMimeData(nullptr).has_value());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // State and preview
    // ═══════════════════════════════════════════════════════════════════════════

    void testStartAndEnd_stateSignals()
    {
        DragSession session(nullptr, nullptr);
        QSignalSpy stateSpy(&session, &DragSession::stateChanged);
        QVERIFY(session.state() == DragSession::State::Idle);

        session.startTabDrag(QStringLiteral("term-1"), QStringLiteral("pane-1"));
        QVERIFY(session.isDragging());
        QCOMPARE(stateSpy.count(), 1);

        session.endDrag();
        QVERIFY(!session.isDragging());
        QVERIFY(!session.payload().has_value());
        QCOMPARE(stateSpy.count(), 2);

        // Ending twice is harmless
        session.endDrag();
        QCOMPARE(stateSpy.count(), 2);
    }

    void testPreviewTarget_onePaneAtATime()
    {
        DragSession session(nullptr, nullptr);
        QSignalSpy previewSpy(&session, &DragSession::previewTargetChanged);
        session.startFileDrag(QStringLiteral("/f"));

        session.setPreviewTarget(QStringLiteral("pane-1"), DropPosition::Left);
        session.setPreviewTarget(QStringLiteral("pane-1"), DropPosition::Left);
        QCOMPARE(previewSpy.count(), 1);

        session.setPreviewTarget(QStringLiteral("pane-2"), DropPosition::Center);
        QCOMPARE(session.previewTarget()->paneId, QStringLiteral("pane-2"));

        // A stale leave from the previous pane must not clear the new target
        session.clearPreviewTarget(QStringLiteral("pane-1"));
        QVERIFY(session.previewTarget().has_value());

        session.clearPreviewTarget(QStringLiteral("pane-2"));
        QVERIFY(!session.previewTarget().has_value());
        QCOMPARE(previewSpy.count(), 3);
    }

    void testEndDrag_clearsPreview()
    {
        DragSession session(nullptr, nullptr);
        session.startTabDrag(QStringLiteral("term-1"), QStringLiteral("pane-1"));
        session.setPreviewTarget(QStringLiteral("pane-2"), DropPosition::Top);
        session.endDrag();
        QVERIFY(!session.previewTarget().has_value());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Drop dispatch
    // ═══════════════════════════════════════════════════════════════════════════

    void testDrop_tabEveryPosition_data()
    {
        QTest::addColumn<QString>("position");
        QTest::addColumn<QString>("expectedCall");

        QTest::newRow("center") << QStringLiteral("center") << QStringLiteral("move term-1 pane-1 pane-2");
        QTest::newRow("left") << QStringLiteral("left") << QStringLiteral("moveSplit term-1 pane-1 pane-2 left");
        QTest::newRow("right") << QStringLiteral("right") << QStringLiteral("moveSplit term-1 pane-1 pane-2 right");
        QTest::newRow("top") << QStringLiteral("top") << QStringLiteral("moveSplit term-1 pane-1 pane-2 top");
        QTest::newRow("bottom") << QStringLiteral("bottom")
                                << QStringLiteral("moveSplit term-1 pane-1 pane-2 bottom");
    }

    void testDrop_tabEveryPosition()
    {
        QFETCH(QString, position);
        QFETCH(QString, expectedCall);

        const std::optional<DropPosition> zone = DropPositions::fromString(position);
        QVERIFY(zone.has_value());
        QCOMPARE(DropPositions::toString(*zone), position);

        RecordingActions actions;
        DragSession session(&actions, nullptr);
        session.startTabDrag(QStringLiteral("term-1"), QStringLiteral("pane-1"));

        QVERIFY(session.handleDrop(QStringLiteral("pane-2"), *zone));
        QCOMPARE(actions.calls, QStringList({expectedCall}));
        QVERIFY(!session.isDragging());
    }

    void testDropPositionNames_unknownRejected()
    {
        QVERIFY(!DropPositions::fromString(QStringLiteral("middle")).has_value());
        QVERIFY(!DropPositions::fromString(QString()).has_value());
    }

    void testDrop_fileCenterOpensAndAdds()
    {
        RecordingActions actions;
        FakeEditorFiles files;
        DragSession session(&actions, &files);
        session.startFileDrag(QStringLiteral("/p/a.cpp"));

        QVERIFY(session.handleDrop(QStringLiteral("pane-1"), DropPosition::Center));
        QCOMPARE(files.open, QStringList({QStringLiteral("/p/a.cpp")}));
        QCOMPARE(actions.calls, QStringList({QStringLiteral("add pane-1 edit-/p/a.cpp")}));
    }

    void testDrop_fileEdgeSplitsAlongEdgeAxis()
    {
        RecordingActions actions;
        FakeEditorFiles files;
        DragSession session(&actions, &files);
        session.startFileDrag(QStringLiteral("/p/a.cpp"));

        QVERIFY(session.handleDrop(QStringLiteral("pane-1"), DropPosition::Top));
        QCOMPARE(actions.calls, QStringList({QStringLiteral("split pane-1 vertical edit-/p/a.cpp top")}));
    }

    void testDrop_fileThatFailsToOpenDoesNothing()
    {
        RecordingActions actions;
        FakeEditorFiles files;
        files.unopenable.append(QStringLiteral("/p/gone.cpp"));
        DragSession session(&actions, &files);
        session.startFileDrag(QStringLiteral("/p/gone.cpp"));

        QVERIFY(!session.handleDrop(QStringLiteral("pane-1"), DropPosition::Center));
        QVERIFY(actions.calls.isEmpty());
        QVERIFY(!session.isDragging());
    }

    void testDrop_usesWireDataFromAnotherSession()
    {
        RecordingActions actions;
        DragSession session(&actions, nullptr);
        const QByteArray wire = DragPayload::tab(QStringLiteral("term-9"), QStringLiteral("pane-9")).toWire();

        QVERIFY(session.handleDrop(QStringLiteral("pane-1"), DropPosition::Center, wire));
        QCOMPARE(actions.calls, QStringList({QStringLiteral("move term-9 pane-9 pane-1")}));
    }

    void testDrop_malformedWireIgnored()
    {
        RecordingActions actions;
        DragSession session(&actions, nullptr);
        QVERIFY(!session.handleDrop(QStringLiteral("pane-1"), DropPosition::Center, QByteArrayLiteral("{")));
        QVERIFY(actions.calls.isEmpty());
    }

    void testDrop_appliedToRealStore()
    {
        WorkspaceStore store;
        store.addTerminalTab(QStringLiteral("t1"));
        store.addTerminalTab(QStringLiteral("t2"));
        const QString paneId = store.activePaneId();

        DragSession session(&store, nullptr);
        session.startTabDrag(QStringLiteral("term-t2"), paneId);
        QVERIFY(session.handleDrop(paneId, DropPosition::Right));

        QCOMPARE(PaneTree::leafCount(store.root()), 2);
        QCOMPARE(store.root()->children().at(0)->id(), paneId);
        QCOMPARE(store.activePane()->activeTabId(), QStringLiteral("term-t2"));
    }
};

QTEST_MAIN(TestDragSession)
#include "test_drag_session.moc"
