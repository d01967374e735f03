// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QtNumeric>

#include "core/constants.h"
#include "core/panetree.h"

using namespace Trellis;

namespace {

WorkspaceTab term(const QString& id)
{
    return WorkspaceTab::terminal(id);
}

WorkspaceTab edit(const QString& path)
{
    return WorkspaceTab::editor(path);
}

PaneNodePtr leaf(const QString& id, const QVector<WorkspaceTab>& tabs, const QString& activeTabId = QString())
{
    return PaneNode::makeLeaf(id, tabs, activeTabId);
}

/**
 * split-1 horizontal [pane-1 {term-a}, pane-2 {term-b}] at 50/50
 */
PaneNodePtr twoPanes()
{
    return PaneNode::makeSplit(QStringLiteral("split-1"), SplitDirection::Horizontal,
                               {leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a"))}),
                                leaf(QStringLiteral("pane-2"), {term(QStringLiteral("b"))})},
                               {50, 50});
}

QStringList leafIds(const PaneNodePtr& root)
{
    QStringList ids;
    for (const PaneNodePtr& node : PaneTree::leaves(root)) {
        ids.append(node->id());
    }
    return ids;
}

QString paneOf(const PaneNodePtr& root, const QString& terminalId)
{
    const PaneNodePtr pane = PaneTree::leafContainingTab(root, WorkspaceTab::terminal(terminalId).id);
    return pane ? pane->id() : QString();
}

QString violations(const PaneNodePtr& root)
{
    return PaneTree::validate(root).join(QLatin1Char('\n'));
}

} // namespace

/**
 * @brief Unit tests for the pane tree transformations
 *
 * Tests cover:
 * - split on every edge, same-axis insertion and cross-axis wrapping
 * - moving and adding tabs between panes, active tab fallback
 * - pruning of emptied panes and collapse of single-child splits
 * - size validation and renormalization
 * - structural sharing and validate()/describe() diagnostics
 */
class TestPaneTree : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    // ═══════════════════════════════════════════════════════════════════════════
    // Node construction
    // ═══════════════════════════════════════════════════════════════════════════

    void testMakeLeaf_dedupesAndDefaultsActive()
    {
        const PaneNodePtr node = leaf(QStringLiteral("pane-1"),
                                      {term(QStringLiteral("a")), term(QStringLiteral("b")), term(QStringLiteral("a"))},
                                      QStringLiteral("term-missing"));
        QCOMPARE(node->tabs().size(), 2);
        QCOMPARE(node->activeTabId(), QStringLiteral("term-a"));
    }

    void testTabIds_derivedFromResource()
    {
        QCOMPARE(term(QStringLiteral("7")).id, QStringLiteral("term-7"));
        QCOMPARE(edit(QStringLiteral("/src/main.cpp")).id, QStringLiteral("edit-/src/main.cpp"));
        QVERIFY(PaneNode::generateLeafId().startsWith(IdPrefix::Leaf));
        QVERIFY(PaneNode::generateSplitId().startsWith(IdPrefix::Split));
        QVERIFY(PaneNode::generateLeafId() != PaneNode::generateLeafId());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // split
    // ═══════════════════════════════════════════════════════════════════════════

    void testSplit_rightOfLoneLeaf()
    {
        const PaneNodePtr root = leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a"))});
        const PaneTree::MutationResult result =
            PaneTree::split(root, QStringLiteral("pane-1"), SplitDirection::Horizontal, term(QStringLiteral("b")),
                            DropPosition::Right);

        QVERIFY(result.changed);
        QVERIFY(result.root->isSplit());
        QVERIFY(result.root->direction() == SplitDirection::Horizontal);
        QCOMPARE(result.root->sizes(), QVector<qreal>({50, 50}));
        QCOMPARE(result.root->children().at(0)->id(), QStringLiteral("pane-1"));

        const PaneNodePtr created = result.root->children().at(1);
        QCOMPARE(created->tabs().size(), 1);
        QCOMPARE(created->activeTabId(), QStringLiteral("term-b"));
        QCOMPARE(result.activePaneId, created->id());
        QVERIFY(PaneTree::validate(result.root).isEmpty());
    }

    void testSplit_leadingEdgesInsertBefore()
    {
        const PaneNodePtr root = leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a"))});

        const auto left = PaneTree::split(root, QStringLiteral("pane-1"), SplitDirection::Horizontal,
                                          term(QStringLiteral("b")), DropPosition::Left);
        QCOMPARE(left.root->children().at(0)->id(), left.activePaneId);
        QCOMPARE(left.root->children().at(1)->id(), QStringLiteral("pane-1"));

        const auto top = PaneTree::split(root, QStringLiteral("pane-1"), SplitDirection::Vertical,
                                         term(QStringLiteral("b")), DropPosition::Top);
        QVERIFY(top.root->direction() == SplitDirection::Vertical);
        QCOMPARE(top.root->children().at(0)->id(), top.activePaneId);
    }

    void testSplit_sameAxisInsertsSibling()
    {
        const auto result = PaneTree::split(twoPanes(), QStringLiteral("pane-2"), SplitDirection::Horizontal,
                                            term(QStringLiteral("c")), DropPosition::Right);

        QCOMPARE(result.root->id(), QStringLiteral("split-1"));
        QCOMPARE(result.root->children().size(), 3);
        QCOMPARE(leafIds(result.root), QStringList({QStringLiteral("pane-1"), QStringLiteral("pane-2"),
                                                    result.activePaneId}));
        QCOMPARE(result.root->sizes(), QVector<qreal>({50, 25, 25}));
    }

    void testSplit_crossAxisWrapsTarget()
    {
        const auto result = PaneTree::split(twoPanes(), QStringLiteral("pane-2"), SplitDirection::Vertical,
                                            term(QStringLiteral("c")), DropPosition::Bottom);

        QCOMPARE(result.root->sizes(), QVector<qreal>({50, 50}));
        const PaneNodePtr wrapper = result.root->children().at(1);
        QVERIFY(wrapper->isSplit());
        QVERIFY(wrapper->direction() == SplitDirection::Vertical);
        QCOMPARE(wrapper->sizes(), QVector<qreal>({50, 50}));
        QCOMPARE(wrapper->children().at(0)->id(), QStringLiteral("pane-2"));
        QCOMPARE(wrapper->children().at(1)->id(), result.activePaneId);
    }

    void testSplit_centerIsNoOp()
    {
        const PaneNodePtr root = twoPanes();
        const auto result = PaneTree::split(root, QStringLiteral("pane-1"), SplitDirection::Horizontal,
                                            term(QStringLiteral("c")), DropPosition::Center);
        QVERIFY(!result.changed);
        QVERIFY(result.root == root);
    }

    void testSplit_unknownPaneIsNoOp()
    {
        const PaneNodePtr root = twoPanes();
        const auto result = PaneTree::split(root, QStringLiteral("pane-x"), SplitDirection::Horizontal,
                                            term(QStringLiteral("c")), DropPosition::Right);
        QVERIFY(!result.changed);
        QVERIFY(result.root == root);
    }

    void testSplit_edgeAxisWinsOverDirection()
    {
        const PaneNodePtr root = leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a"))});
        const auto result = PaneTree::split(root, QStringLiteral("pane-1"), SplitDirection::Horizontal,
                                            term(QStringLiteral("b")), DropPosition::Bottom);
        QVERIFY(result.root->direction() == SplitDirection::Vertical);
    }

    void testSplit_tabTakenFromPreviousHolder()
    {
        const PaneNodePtr root = leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a")), term(QStringLiteral("b"))});
        const auto result = PaneTree::split(root, QStringLiteral("pane-1"), SplitDirection::Horizontal,
                                            term(QStringLiteral("b")), DropPosition::Right);

        QCOMPARE(PaneTree::allTabs(result.root).size(), 2);
        QCOMPARE(PaneTree::findLeaf(result.root, QStringLiteral("pane-1"))->tabs().size(), 1);
        QVERIFY(PaneTree::validate(result.root).isEmpty());
    }

    void testSplit_untouchedSubtreeShared()
    {
        const PaneNodePtr root = twoPanes();
        const auto result = PaneTree::split(root, QStringLiteral("pane-2"), SplitDirection::Vertical,
                                            term(QStringLiteral("c")), DropPosition::Top);
        QVERIFY(result.root->children().at(0) == root->children().at(0));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // moveTabToPane / moveTabToNewSplit / addTabToPane
    // ═══════════════════════════════════════════════════════════════════════════

    void testMoveTabToPane_prunesSourceAndCollapses()
    {
        const auto result =
            PaneTree::moveTabToPane(twoPanes(), QStringLiteral("term-a"), QStringLiteral("pane-1"), QStringLiteral("pane-2"));

        QVERIFY(result.changed);
        // The split collapsed into its surviving child, which keeps its own id
        QVERIFY(result.root->isLeaf());
        QCOMPARE(result.root->id(), QStringLiteral("pane-2"));
        QCOMPARE(result.root->tabs().size(), 2);
        QCOMPARE(result.root->tabs().last().id, QStringLiteral("term-a"));
        QCOMPARE(result.root->activeTabId(), QStringLiteral("term-a"));
        QCOMPARE(result.activePaneId, QStringLiteral("pane-2"));
    }

    void testMoveTabToPane_activeFallsToNextThenPrevious()
    {
        const PaneNodePtr source = leaf(QStringLiteral("pane-1"),
                                        {term(QStringLiteral("a")), term(QStringLiteral("b")), term(QStringLiteral("c"))},
                                        QStringLiteral("term-b"));
        const PaneNodePtr root = PaneNode::makeSplit(
            QStringLiteral("split-1"), SplitDirection::Horizontal,
            {source, leaf(QStringLiteral("pane-2"), {term(QStringLiteral("d"))})}, {50, 50});

        const auto middle =
            PaneTree::moveTabToPane(root, QStringLiteral("term-b"), QStringLiteral("pane-1"), QStringLiteral("pane-2"));
        QCOMPARE(PaneTree::findLeaf(middle.root, QStringLiteral("pane-1"))->activeTabId(), QStringLiteral("term-c"));

        const PaneNodePtr lastActive = PaneTree::setActiveTab(root, QStringLiteral("pane-1"), QStringLiteral("term-c"));
        const auto last = PaneTree::moveTabToPane(lastActive, QStringLiteral("term-c"), QStringLiteral("pane-1"),
                                                  QStringLiteral("pane-2"));
        QCOMPARE(PaneTree::findLeaf(last.root, QStringLiteral("pane-1"))->activeTabId(), QStringLiteral("term-b"));
    }

    void testMoveTabToPane_samePaneOnlyActivates()
    {
        const PaneNodePtr root = leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a")), term(QStringLiteral("b"))});
        const auto result =
            PaneTree::moveTabToPane(root, QStringLiteral("term-b"), QStringLiteral("pane-1"), QStringLiteral("pane-1"));
        QCOMPARE(result.root->tabs().size(), 2);
        QCOMPARE(result.root->activeTabId(), QStringLiteral("term-b"));
    }

    void testMoveTabToPane_rejectsForeignTab()
    {
        const PaneNodePtr root = twoPanes();
        const auto result =
            PaneTree::moveTabToPane(root, QStringLiteral("term-b"), QStringLiteral("pane-1"), QStringLiteral("pane-2"));
        QVERIFY(!result.changed);
        QVERIFY(result.root == root);
    }

    void testMoveTabToNewSplit_rejectsOwnOnlyTab()
    {
        const PaneNodePtr root = leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a"))});
        const auto result = PaneTree::moveTabToNewSplit(root, QStringLiteral("term-a"), QStringLiteral("pane-1"),
                                                        QStringLiteral("pane-1"), DropPosition::Right);
        QVERIFY(!result.changed);
        QVERIFY(result.root == root);
    }

    void testMoveTabToNewSplit_keepsTabIdentity()
    {
        const WorkspaceTab file = edit(QStringLiteral("/p/readme.md"));
        const PaneNodePtr root = leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a")), file});
        const auto result = PaneTree::moveTabToNewSplit(root, file.id, QStringLiteral("pane-1"),
                                                        QStringLiteral("pane-1"), DropPosition::Bottom);

        QVERIFY(result.changed);
        QVERIFY(result.root->direction() == SplitDirection::Vertical);
        const PaneNodePtr created = PaneTree::findLeaf(result.root, result.activePaneId);
        QVERIFY(created);
        QVERIFY(created->tabs().first() == file);
        QVERIFY(!PaneTree::findLeaf(result.root, QStringLiteral("pane-1"))->containsTab(file.id));
    }

    void testMoveTabToNewSplit_sourceEmptiedIsPruned()
    {
        const auto result = PaneTree::moveTabToNewSplit(twoPanes(), QStringLiteral("term-a"), QStringLiteral("pane-1"),
                                                        QStringLiteral("pane-2"), DropPosition::Bottom);
        QVERIFY(!PaneTree::findLeaf(result.root, QStringLiteral("pane-1")));
        QCOMPARE(PaneTree::leafCount(result.root), 2);
        QVERIFY(PaneTree::validate(result.root).isEmpty());
    }

    void testAddTabToPane_appendsAndActivates()
    {
        const auto result = PaneTree::addTabToPane(twoPanes(), QStringLiteral("pane-1"), edit(QStringLiteral("/x")));
        const PaneNodePtr pane = PaneTree::findLeaf(result.root, QStringLiteral("pane-1"));
        QCOMPARE(pane->tabs().size(), 2);
        QCOMPARE(pane->activeTabId(), QStringLiteral("edit-/x"));
        QCOMPARE(result.activePaneId, QStringLiteral("pane-1"));
    }

    void testAddTabToPane_movesTabHeldElsewhere()
    {
        const auto result = PaneTree::addTabToPane(twoPanes(), QStringLiteral("pane-1"), term(QStringLiteral("b")));
        QVERIFY(result.root->isLeaf());
        QCOMPARE(result.root->id(), QStringLiteral("pane-1"));
        QCOMPARE(result.root->tabs().size(), 2);
    }

    void testAddTabToPane_existingTabOnlyActivates()
    {
        const PaneNodePtr root = leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a")), term(QStringLiteral("b"))});
        const auto result = PaneTree::addTabToPane(root, QStringLiteral("pane-1"), term(QStringLiteral("b")));
        QCOMPARE(result.root->tabs().size(), 2);
        QCOMPARE(result.root->activeTabId(), QStringLiteral("term-b"));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // removeTab / normalize
    // ═══════════════════════════════════════════════════════════════════════════

    void testRemoveTab_renormalizesSurvivingSizes()
    {
        const PaneNodePtr root = PaneNode::makeSplit(
            QStringLiteral("split-1"), SplitDirection::Horizontal,
            {leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a"))}),
             leaf(QStringLiteral("pane-2"), {term(QStringLiteral("b"))}),
             leaf(QStringLiteral("pane-3"), {term(QStringLiteral("c"))})},
            {20, 30, 50});

        const PaneNodePtr result = PaneTree::removeTab(root, QStringLiteral("term-c"));
        QCOMPARE(result->children().size(), 2);
        QCOMPARE(result->sizes(), QVector<qreal>({40, 60}));
    }

    void testRemoveTab_unknownTabReturnsSameRoot()
    {
        const PaneNodePtr root = twoPanes();
        QVERIFY(PaneTree::removeTab(root, QStringLiteral("term-zzz")) == root);
    }

    void testRemoveTab_lastTabLeavesEmptyRoot()
    {
        const PaneNodePtr root = leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a"))});
        const PaneNodePtr result = PaneTree::removeTab(root, QStringLiteral("term-a"));
        QVERIFY(result->isLeaf());
        QVERIFY(result->tabs().isEmpty());
        QVERIFY(result->activeTabId().isEmpty());
        QVERIFY(PaneTree::validate(result).isEmpty());
    }

    void testNormalize_nestedCollapse()
    {
        const PaneNodePtr inner = PaneNode::makeSplit(QStringLiteral("split-2"), SplitDirection::Vertical,
                                                      {leaf(QStringLiteral("pane-2"), {term(QStringLiteral("b"))}),
                                                       leaf(QStringLiteral("pane-3"), {})},
                                                      {50, 50});
        const PaneNodePtr root = PaneNode::makeSplit(
            QStringLiteral("split-1"), SplitDirection::Horizontal,
            {leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a"))}), inner}, {30, 70});

        const PaneNodePtr result = PaneTree::normalize(root);
        QCOMPARE(leafIds(result), QStringList({QStringLiteral("pane-1"), QStringLiteral("pane-2")}));
        QCOMPARE(result->children().at(1)->id(), QStringLiteral("pane-2"));
        QCOMPARE(result->sizes(), QVector<qreal>({30, 70}));
    }

    void testNormalize_repairsMismatchedSizes()
    {
        const PaneNodePtr root = PaneNode::makeSplit(
            QStringLiteral("split-1"), SplitDirection::Horizontal,
            {leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a"))}),
             leaf(QStringLiteral("pane-2"), {term(QStringLiteral("b"))})},
            {100});
        QCOMPARE(PaneTree::normalize(root)->sizes(), QVector<qreal>({50, 50}));
    }

    void testNormalize_drainedTreeBecomesEmptyLeaf()
    {
        const PaneNodePtr root = PaneNode::makeSplit(QStringLiteral("split-1"), SplitDirection::Horizontal,
                                                     {leaf(QStringLiteral("pane-1"), {}), leaf(QStringLiteral("pane-2"), {})},
                                                     {50, 50});
        const PaneNodePtr result = PaneTree::normalize(root);
        QVERIFY(result->isLeaf());
        QVERIFY(result->tabs().isEmpty());
    }

    void testNormalize_validTreeReturnedAsIs()
    {
        const PaneNodePtr root = twoPanes();
        QVERIFY(PaneTree::normalize(root) == root);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Non-structural mutations
    // ═══════════════════════════════════════════════════════════════════════════

    void testReorderTabs_permutationOnly()
    {
        const PaneNodePtr root = leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a")), term(QStringLiteral("b"))});

        const PaneNodePtr reordered = PaneTree::reorderTabsInPane(
            root, QStringLiteral("pane-1"), {QStringLiteral("term-b"), QStringLiteral("term-a")});
        QCOMPARE(reordered->tabs().first().id, QStringLiteral("term-b"));
        QCOMPARE(reordered->activeTabId(), QStringLiteral("term-a"));

        QVERIFY(PaneTree::reorderTabsInPane(root, QStringLiteral("pane-1"), {QStringLiteral("term-a")}) == root);
        QVERIFY(PaneTree::reorderTabsInPane(root, QStringLiteral("pane-1"),
                                            {QStringLiteral("term-a"), QStringLiteral("term-a")})
                == root);
        QVERIFY(PaneTree::reorderTabsInPane(root, QStringLiteral("pane-1"),
                                            {QStringLiteral("term-a"), QStringLiteral("term-x")})
                == root);
    }

    void testUpdatePaneSizes_rescalesTo100()
    {
        const PaneNodePtr result = PaneTree::updatePaneSizes(twoPanes(), QStringLiteral("split-1"), {1, 3});
        QCOMPARE(result->sizes(), QVector<qreal>({25, 75}));
    }

    void testUpdatePaneSizes_rejectsInvalid()
    {
        const PaneNodePtr root = twoPanes();
        QVERIFY(PaneTree::updatePaneSizes(root, QStringLiteral("split-1"), {0, 100}) == root);
        QVERIFY(PaneTree::updatePaneSizes(root, QStringLiteral("split-1"), {-10, 110}) == root);
        QVERIFY(PaneTree::updatePaneSizes(root, QStringLiteral("split-1"), {30, 30, 40}) == root);
        QVERIFY(PaneTree::updatePaneSizes(root, QStringLiteral("pane-1"), {100}) == root);
        QVERIFY(PaneTree::updatePaneSizes(root, QStringLiteral("split-1"), {qInf(), 50}) == root);
    }

    void testSetActiveTab_ignoresForeignTab()
    {
        const PaneNodePtr root = twoPanes();
        QVERIFY(PaneTree::setActiveTab(root, QStringLiteral("pane-1"), QStringLiteral("term-b")) == root);
    }

    void testFilterTabs_fallsBackToFirstRemaining()
    {
        const PaneNodePtr root = leaf(QStringLiteral("pane-1"),
                                      {term(QStringLiteral("a")), edit(QStringLiteral("/f")), term(QStringLiteral("b"))},
                                      QStringLiteral("edit-/f"));
        const PaneNodePtr filtered = PaneTree::filterTabs(root, [](const WorkspaceTab& tab) {
            return tab.isTerminal();
        });
        QCOMPARE(filtered->tabs().size(), 2);
        QCOMPARE(filtered->activeTabId(), QStringLiteral("term-a"));
    }

    void testMapTabs_activeFollowsTab()
    {
        const PaneNodePtr root = leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a")), term(QStringLiteral("b"))},
                                      QStringLiteral("term-b"));
        const PaneNodePtr mapped = PaneTree::mapTabs(root, [](const WorkspaceTab& tab) {
            return tab.terminalId == QLatin1String("b") ? WorkspaceTab::terminal(QStringLiteral("z")) : tab;
        });
        QCOMPARE(mapped->activeTabId(), QStringLiteral("term-z"));
        QCOMPARE(mapped->tabs().at(1).terminalId, QStringLiteral("z"));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Diagnostics
    // ═══════════════════════════════════════════════════════════════════════════

    // ═══════════════════════════════════════════════════════════════════════════
    // Mixed sequences
    // ═══════════════════════════════════════════════════════════════════════════

    void testSequence_treeStaysValidAfterEveryStep()
    {
        PaneNodePtr root = leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a")), term(QStringLiteral("b")),
                                                          term(QStringLiteral("c")), term(QStringLiteral("d"))});
        const QString pane1 = QStringLiteral("pane-1");

        root = PaneTree::split(root, pane1, SplitDirection::Horizontal, term(QStringLiteral("e")), DropPosition::Right)
                   .root;
        QVERIFY2(violations(root).isEmpty(), qPrintable(violations(root)));

        root = PaneTree::split(root, paneOf(root, QStringLiteral("e")), SplitDirection::Vertical,
                               term(QStringLiteral("f")), DropPosition::Bottom)
                   .root;
        QVERIFY2(violations(root).isEmpty(), qPrintable(violations(root)));

        root = PaneTree::split(root, pane1, SplitDirection::Horizontal, term(QStringLiteral("g")), DropPosition::Left)
                   .root;
        QVERIFY2(violations(root).isEmpty(), qPrintable(violations(root)));
        QCOMPARE(root->children().size(), 3);
        QCOMPARE(PaneTree::leafCount(root), 4);

        root = PaneTree::moveTabToNewSplit(root, QStringLiteral("term-a"), pane1, paneOf(root, QStringLiteral("f")),
                                           DropPosition::Top)
                   .root;
        QVERIFY2(violations(root).isEmpty(), qPrintable(violations(root)));

        root = PaneTree::moveTabToNewSplit(root, QStringLiteral("term-b"), pane1, paneOf(root, QStringLiteral("e")),
                                           DropPosition::Right)
                   .root;
        QVERIFY2(violations(root).isEmpty(), qPrintable(violations(root)));
        QCOMPARE(PaneTree::leafCount(root), 6);

        root = PaneTree::moveTabToPane(root, QStringLiteral("term-e"), paneOf(root, QStringLiteral("e")), pane1).root;
        QVERIFY2(violations(root).isEmpty(), qPrintable(violations(root)));

        root = PaneTree::removeTab(root, QStringLiteral("term-g"));
        QVERIFY2(violations(root).isEmpty(), qPrintable(violations(root)));

        root = PaneTree::moveTabToPane(root, QStringLiteral("term-f"), paneOf(root, QStringLiteral("f")),
                                       paneOf(root, QStringLiteral("a")))
                   .root;
        QVERIFY2(violations(root).isEmpty(), qPrintable(violations(root)));

        root = PaneTree::moveTabToPane(root, QStringLiteral("term-b"), paneOf(root, QStringLiteral("b")), pane1).root;
        QVERIFY2(violations(root).isEmpty(), qPrintable(violations(root)));
        QCOMPARE(PaneTree::leafCount(root), 2);
        QCOMPARE(root->sizes().size(), 2);

        root = PaneTree::removeTab(root, QStringLiteral("term-a"));
        QVERIFY2(violations(root).isEmpty(), qPrintable(violations(root)));
        root = PaneTree::removeTab(root, QStringLiteral("term-f"));
        QVERIFY2(violations(root).isEmpty(), qPrintable(violations(root)));

        QVERIFY(root->isLeaf());
        QCOMPARE(root->id(), pane1);
        QStringList tabIds;
        for (const WorkspaceTab& tab : root->tabs()) {
            tabIds.append(tab.id);
        }
        QCOMPARE(tabIds, QStringList({QStringLiteral("term-c"), QStringLiteral("term-d"), QStringLiteral("term-e"),
                                      QStringLiteral("term-b")}));
        QCOMPARE(root->activeTabId(), QStringLiteral("term-b"));
    }

    void testValidate_reportsViolations()
    {
        const PaneNodePtr root = PaneNode::makeSplit(
            QStringLiteral("split-1"), SplitDirection::Horizontal,
            {leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a"))}),
             leaf(QStringLiteral("pane-1"), {term(QStringLiteral("a"))}), leaf(QStringLiteral("pane-3"), {})},
            {10, 10, 10});

        const QStringList violations = PaneTree::validate(root);
        QCOMPARE(violations.size(), 4); // sizes sum, duplicate id, duplicate tab, empty leaf
    }

    void testDescribe_marksActiveTab()
    {
        const QString text = PaneTree::describe(twoPanes());
        QVERIFY(text.startsWith(QStringLiteral("split split-1 horizontal [50, 50]\n")));
        QVERIFY(text.contains(QStringLiteral("  leaf pane-1\n    * term-a\n")));
    }
};

QTEST_MAIN(TestPaneTree)
#include "test_pane_tree.moc"
