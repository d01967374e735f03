// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trellis_export.h"
#include "panenode.h"
#include <QStringList>
#include <functional>

namespace Trellis {

/**
 * @brief Pure queries and transformations over the pane tree
 *
 * Every transformation takes a root and returns a new root. Nothing is
 * modified in place; untouched subtrees are shared with the input, and a call
 * that changes nothing hands back the input root itself.
 *
 * Structural transformations (split, move, add, remove) run normalize() on
 * their result, so the returned tree always satisfies:
 * - every split has at least two children and one positive size per child,
 *   summing to 100
 * - no empty leaf exists unless it is the only node of the tree
 * - every leaf's active tab id names one of its tabs (or is empty)
 */
namespace PaneTree {

/**
 * @brief Outcome of a mutation that also decides which pane becomes active
 */
struct TRELLIS_EXPORT MutationResult
{
    PaneNodePtr root;
    QString activePaneId; ///< Pane that should receive focus, empty if unchanged
    bool changed = false;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════════

TRELLIS_EXPORT PaneNodePtr findNode(const PaneNodePtr& root, const QString& id);

/**
 * @brief Find a leaf by id; splits with that id are not returned
 */
TRELLIS_EXPORT PaneNodePtr findLeaf(const PaneNodePtr& root, const QString& paneId);

/**
 * @brief Parent split of the node with @p id, or nullptr for the root / unknown ids
 */
TRELLIS_EXPORT PaneNodePtr parentOf(const PaneNodePtr& root, const QString& id);

/**
 * @brief All leaves in pre-order (left/top before right/bottom)
 */
TRELLIS_EXPORT QVector<PaneNodePtr> leaves(const PaneNodePtr& root);
TRELLIS_EXPORT PaneNodePtr firstLeaf(const PaneNodePtr& root);
TRELLIS_EXPORT int leafCount(const PaneNodePtr& root);

TRELLIS_EXPORT PaneNodePtr leafContainingTab(const PaneNodePtr& root, const QString& tabId);

/**
 * @brief Every tab of the tree, leaves in pre-order, tabs in display order
 */
TRELLIS_EXPORT QVector<WorkspaceTab> allTabs(const PaneNodePtr& root);

// ═══════════════════════════════════════════════════════════════════════════════
// Normalization
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Restore the structural invariants
 *
 * Empty leaves are removed, a split left with no children disappears, a split
 * left with one child is replaced by that child (promoted unchanged, keeping
 * its own id), and the surviving sizes are rescaled proportionally to sum to
 * 100. Size vectors that do not match their children are replaced by an equal
 * distribution. If nothing survives a fresh empty leaf is returned; a root that
 * already is a lone leaf is returned as is.
 */
TRELLIS_EXPORT PaneNodePtr normalize(const PaneNodePtr& root);

/**
 * @brief true if @p sizes has @p count positive finite entries
 */
TRELLIS_EXPORT bool sizesValid(const QVector<qreal>& sizes, int count);

/**
 * @brief Rescale @p sizes to sum to 100, or split 100 equally when they are invalid
 */
TRELLIS_EXPORT QVector<qreal> normalizedSizes(const QVector<qreal>& sizes, int count);

// ═══════════════════════════════════════════════════════════════════════════════
// Structural mutations
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Open @p tab in a new pane next to @p paneId
 *
 * The axis comes from @p edge (left/right horizontal, top/bottom vertical);
 * @p direction is expected to agree with it. If the target's parent already
 * splits along that axis the new leaf becomes a sibling on the requested side
 * and takes half of the target's size. Otherwise the target is replaced by a
 * new split [target, new] or [new, target] with sizes [50, 50].
 *
 * The new leaf holds only @p tab and becomes the active pane. Center is not an
 * edge and leaves the tree unchanged.
 */
TRELLIS_EXPORT MutationResult split(const PaneNodePtr& root, const QString& paneId, SplitDirection direction,
                                    const WorkspaceTab& tab, DropPosition edge);

/**
 * @brief Move a tab into another pane's tab strip
 *
 * The tab is removed from the source (the source's active tab moves to the
 * next tab, or the previous one if it was last), appended to the target and
 * activated there. A source left without tabs is pruned. Moving a tab onto its
 * own pane only activates it.
 */
TRELLIS_EXPORT MutationResult moveTabToPane(const PaneNodePtr& root, const QString& tabId,
                                            const QString& sourcePaneId, const QString& targetPaneId);

/**
 * @brief Move a tab out of its pane into a new split next to the target pane
 *
 * The existing tab object is reused, so its identity survives the move.
 * Splitting a pane off its own only tab is rejected.
 */
TRELLIS_EXPORT MutationResult moveTabToNewSplit(const PaneNodePtr& root, const QString& tabId,
                                                const QString& sourcePaneId, const QString& targetPaneId,
                                                DropPosition edge);

/**
 * @brief Append a tab to a pane and activate it
 *
 * A tab the pane already holds is only activated. A tab with the same id held
 * by a different pane is moved from there.
 */
TRELLIS_EXPORT MutationResult addTabToPane(const PaneNodePtr& root, const QString& paneId, const WorkspaceTab& tab);

/**
 * @brief Remove a tab from whichever pane holds it, pruning the pane if emptied
 */
TRELLIS_EXPORT PaneNodePtr removeTab(const PaneNodePtr& root, const QString& tabId);

// ═══════════════════════════════════════════════════════════════════════════════
// Non-structural mutations
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Reorder a pane's tabs; ignored unless @p orderedTabIds is a permutation
 */
TRELLIS_EXPORT PaneNodePtr reorderTabsInPane(const PaneNodePtr& root, const QString& paneId,
                                             const QStringList& orderedTabIds);

/**
 * @brief Replace a split's sizes (rescaled to sum to 100)
 *
 * Ignored if @p splitId is not a split, the count differs from the number of
 * children, or a size is not positive and finite.
 */
TRELLIS_EXPORT PaneNodePtr updatePaneSizes(const PaneNodePtr& root, const QString& splitId,
                                           const QVector<qreal>& sizes);

/**
 * @brief Activate a tab of a pane; ignored if the pane does not hold it
 */
TRELLIS_EXPORT PaneNodePtr setActiveTab(const PaneNodePtr& root, const QString& paneId, const QString& tabId);

/**
 * @brief Keep only the tabs accepted by @p keep (not normalized)
 *
 * A leaf whose active tab is dropped falls back to its first remaining tab.
 */
TRELLIS_EXPORT PaneNodePtr filterTabs(const PaneNodePtr& root, const std::function<bool(const WorkspaceTab&)>& keep);

/**
 * @brief Rewrite every tab through @p transform (not normalized)
 *
 * Active tab ids follow their tab. Transformed tabs that collide with an
 * earlier tab of the same leaf are dropped.
 */
TRELLIS_EXPORT PaneNodePtr mapTabs(const PaneNodePtr& root,
                                   const std::function<WorkspaceTab(const WorkspaceTab&)>& transform);

// ═══════════════════════════════════════════════════════════════════════════════
// Diagnostics
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Describe every invariant the tree violates
 * @return Human readable violations, empty for a well-formed tree
 */
TRELLIS_EXPORT QStringList validate(const PaneNodePtr& root);

/**
 * @brief Indented multi-line rendering of the tree, for logs and the CLI
 */
TRELLIS_EXPORT QString describe(const PaneNodePtr& root);

} // namespace PaneTree

} // namespace Trellis
