// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "panetree.h"
#include "constants.h"
#include "logging.h"
#include <QSet>
#include <QtMath>

namespace Trellis {

namespace PaneTree {

namespace {

qreal sumOf(const QVector<qreal>& sizes)
{
    qreal sum = 0.0;
    for (qreal size : sizes) {
        sum += size;
    }
    return sum;
}

QVector<qreal> equalSizes(int count)
{
    return QVector<qreal>(count, Defaults::TotalSize / count);
}

/**
 * @brief Replace the node with @p id by @p replacement, rebuilding only the path to it
 */
PaneNodePtr replaceNode(const PaneNodePtr& node, const QString& id, const PaneNodePtr& replacement)
{
    if (node->id() == id) {
        return replacement;
    }
    if (node->isLeaf()) {
        return node;
    }

    QVector<PaneNodePtr> children = node->children();
    for (int i = 0; i < children.size(); ++i) {
        PaneNodePtr updated = replaceNode(children.at(i), id, replacement);
        if (updated != children.at(i)) {
            children[i] = updated;
            return node->withChildren(children, node->sizes());
        }
    }
    return node;
}

/**
 * @brief Leaf without @p tabId; the active tab moves to the next tab, or the previous one if it was last
 */
PaneNodePtr leafWithoutTab(const PaneNodePtr& leaf, const QString& tabId)
{
    const int index = leaf->tabIndex(tabId);
    if (index < 0) {
        return leaf;
    }

    QVector<WorkspaceTab> tabs = leaf->tabs();
    tabs.removeAt(index);

    QString activeTabId = leaf->activeTabId();
    if (activeTabId == tabId) {
        if (tabs.isEmpty()) {
            activeTabId.clear();
        } else if (index < tabs.size()) {
            activeTabId = tabs.at(index).id;
        } else {
            activeTabId = tabs.last().id;
        }
    }
    return leaf->withTabs(tabs, activeTabId);
}

/**
 * @brief Leaf with @p tab appended (or kept in place if already present) and activated
 */
PaneNodePtr leafWithTab(const PaneNodePtr& leaf, const WorkspaceTab& tab)
{
    if (leaf->containsTab(tab.id)) {
        return leaf->activeTabId() == tab.id ? leaf : leaf->withActiveTab(tab.id);
    }
    QVector<WorkspaceTab> tabs = leaf->tabs();
    tabs.append(tab);
    return leaf->withTabs(tabs, tab.id);
}

/**
 * @brief Normalize a subtree; nullptr when nothing survives
 */
PaneNodePtr normalizeNode(const PaneNodePtr& node)
{
    if (node->isLeaf()) {
        return node->tabs().isEmpty() ? nullptr : node;
    }

    const int count = node->children().size();
    const bool validSizes = sizesValid(node->sizes(), count);
    const QVector<qreal> baseSizes = validSizes ? node->sizes() : equalSizes(count);

    QVector<PaneNodePtr> children;
    QVector<qreal> sizes;
    bool childrenChanged = false;

    for (int i = 0; i < count; ++i) {
        const PaneNodePtr& child = node->children().at(i);
        PaneNodePtr normalized = normalizeNode(child);
        if (normalized != child) {
            childrenChanged = true;
        }
        if (normalized) {
            children.append(normalized);
            sizes.append(baseSizes.at(i));
        }
    }

    if (children.isEmpty()) {
        return nullptr;
    }
    if (children.size() == 1) {
        // Collapse: the survivor takes the split's place with its own id
        qCDebug(lcPaneTree) << "Collapsing split" << node->id() << "into" << children.first()->id();
        return children.first();
    }

    if (!childrenChanged && validSizes && qAbs(sumOf(sizes) - Defaults::TotalSize) <= Defaults::SizeTolerance) {
        return node;
    }
    return node->withChildren(children, normalizedSizes(sizes, children.size()));
}

void collectLeaves(const PaneNodePtr& node, QVector<PaneNodePtr>& out)
{
    if (node->isLeaf()) {
        out.append(node);
        return;
    }
    for (const PaneNodePtr& child : node->children()) {
        collectLeaves(child, out);
    }
}

PaneNodePtr filterNode(const PaneNodePtr& node, const std::function<bool(const WorkspaceTab&)>& keep)
{
    if (node->isSplit()) {
        QVector<PaneNodePtr> children = node->children();
        bool changed = false;
        for (PaneNodePtr& child : children) {
            PaneNodePtr filtered = filterNode(child, keep);
            if (filtered != child) {
                child = filtered;
                changed = true;
            }
        }
        return changed ? node->withChildren(children, node->sizes()) : node;
    }

    QVector<WorkspaceTab> kept;
    for (const WorkspaceTab& tab : node->tabs()) {
        if (keep(tab)) {
            kept.append(tab);
        }
    }
    if (kept.size() == node->tabs().size()) {
        return node;
    }
    return node->withTabs(kept, node->activeTabId());
}

PaneNodePtr mapNode(const PaneNodePtr& node, const std::function<WorkspaceTab(const WorkspaceTab&)>& transform)
{
    if (node->isSplit()) {
        QVector<PaneNodePtr> children = node->children();
        bool changed = false;
        for (PaneNodePtr& child : children) {
            PaneNodePtr mapped = mapNode(child, transform);
            if (mapped != child) {
                child = mapped;
                changed = true;
            }
        }
        return changed ? node->withChildren(children, node->sizes()) : node;
    }

    QVector<WorkspaceTab> tabs;
    tabs.reserve(node->tabs().size());
    QString activeTabId;
    bool changed = false;
    for (const WorkspaceTab& tab : node->tabs()) {
        const WorkspaceTab mapped = transform(tab);
        if (!(mapped == tab)) {
            changed = true;
        }
        if (tab.id == node->activeTabId()) {
            activeTabId = mapped.id;
        }
        tabs.append(mapped);
    }
    return changed ? node->withTabs(tabs, activeTabId) : node;
}

void validateNode(const PaneNodePtr& node, bool isRoot, QSet<QString>& nodeIds, QSet<QString>& tabIds,
                  QStringList& violations)
{
    if (node->id().isEmpty()) {
        violations.append(QStringLiteral("node without id"));
    } else if (nodeIds.contains(node->id())) {
        violations.append(QStringLiteral("duplicate node id %1").arg(node->id()));
    } else {
        nodeIds.insert(node->id());
    }

    if (node->isLeaf()) {
        if (node->tabs().isEmpty() && !isRoot) {
            violations.append(QStringLiteral("empty leaf %1 inside a split").arg(node->id()));
        }
        if (!node->activeTabId().isEmpty() && !node->containsTab(node->activeTabId())) {
            violations.append(
                QStringLiteral("leaf %1 has dangling active tab %2").arg(node->id(), node->activeTabId()));
        }
        for (const WorkspaceTab& tab : node->tabs()) {
            if (tabIds.contains(tab.id)) {
                violations.append(QStringLiteral("tab %1 appears in more than one leaf").arg(tab.id));
            }
            tabIds.insert(tab.id);
        }
        return;
    }

    const int count = node->children().size();
    if (count < 2) {
        violations.append(QStringLiteral("split %1 has %2 child(ren)").arg(node->id()).arg(count));
    }
    if (!sizesValid(node->sizes(), count)) {
        violations.append(QStringLiteral("split %1 has invalid sizes for %2 children").arg(node->id()).arg(count));
    } else if (qAbs(sumOf(node->sizes()) - Defaults::TotalSize) > Defaults::SizeTolerance) {
        violations.append(QStringLiteral("split %1 sizes sum to %2").arg(node->id()).arg(sumOf(node->sizes())));
    }
    for (const PaneNodePtr& child : node->children()) {
        validateNode(child, false, nodeIds, tabIds, violations);
    }
}

void describeNode(const PaneNodePtr& node, int depth, QString& out)
{
    const QString indent(depth * 2, QLatin1Char(' '));
    if (node->isLeaf()) {
        out += indent + QStringLiteral("leaf %1\n").arg(node->id());
        for (const WorkspaceTab& tab : node->tabs()) {
            const QLatin1Char marker(tab.id == node->activeTabId() ? '*' : ' ');
            out += indent + QStringLiteral("  %1 %2\n").arg(marker).arg(tab.id);
        }
        return;
    }

    QStringList sizes;
    for (qreal size : node->sizes()) {
        sizes.append(QString::number(size, 'g', 4));
    }
    out += indent
        + QStringLiteral("split %1 %2 [%3]\n")
              .arg(node->id(), SplitDirections::toString(node->direction()), sizes.join(QStringLiteral(", ")));
    for (const PaneNodePtr& child : node->children()) {
        describeNode(child, depth + 1, out);
    }
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════════

PaneNodePtr findNode(const PaneNodePtr& root, const QString& id)
{
    if (!root) {
        return nullptr;
    }
    if (root->id() == id) {
        return root;
    }
    for (const PaneNodePtr& child : root->children()) {
        if (PaneNodePtr found = findNode(child, id)) {
            return found;
        }
    }
    return nullptr;
}

PaneNodePtr findLeaf(const PaneNodePtr& root, const QString& paneId)
{
    PaneNodePtr node = findNode(root, paneId);
    return node && node->isLeaf() ? node : nullptr;
}

PaneNodePtr parentOf(const PaneNodePtr& root, const QString& id)
{
    if (!root || root->isLeaf()) {
        return nullptr;
    }
    for (const PaneNodePtr& child : root->children()) {
        if (child->id() == id) {
            return root;
        }
        if (PaneNodePtr parent = parentOf(child, id)) {
            return parent;
        }
    }
    return nullptr;
}

QVector<PaneNodePtr> leaves(const PaneNodePtr& root)
{
    QVector<PaneNodePtr> result;
    if (root) {
        collectLeaves(root, result);
    }
    return result;
}

PaneNodePtr firstLeaf(const PaneNodePtr& root)
{
    PaneNodePtr node = root;
    while (node && node->isSplit()) {
        node = node->children().isEmpty() ? nullptr : node->children().first();
    }
    return node;
}

int leafCount(const PaneNodePtr& root)
{
    return leaves(root).size();
}

PaneNodePtr leafContainingTab(const PaneNodePtr& root, const QString& tabId)
{
    for (const PaneNodePtr& leaf : leaves(root)) {
        if (leaf->containsTab(tabId)) {
            return leaf;
        }
    }
    return nullptr;
}

QVector<WorkspaceTab> allTabs(const PaneNodePtr& root)
{
    QVector<WorkspaceTab> result;
    for (const PaneNodePtr& leaf : leaves(root)) {
        result.append(leaf->tabs());
    }
    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Normalization
// ═══════════════════════════════════════════════════════════════════════════════

bool sizesValid(const QVector<qreal>& sizes, int count)
{
    if (sizes.size() != count) {
        return false;
    }
    for (qreal size : sizes) {
        if (!qIsFinite(size) || size <= 0.0) {
            return false;
        }
    }
    return true;
}

QVector<qreal> normalizedSizes(const QVector<qreal>& sizes, int count)
{
    if (count <= 0) {
        return {};
    }
    if (!sizesValid(sizes, count)) {
        return equalSizes(count);
    }

    const qreal sum = sumOf(sizes);
    QVector<qreal> result;
    result.reserve(count);
    for (qreal size : sizes) {
        result.append(size * Defaults::TotalSize / sum);
    }
    return result;
}

PaneNodePtr normalize(const PaneNodePtr& root)
{
    if (!root) {
        return PaneNode::emptyLeaf();
    }
    if (root->isLeaf()) {
        return root;
    }

    PaneNodePtr normalized = normalizeNode(root);
    if (!normalized) {
        qCDebug(lcPaneTree) << "Tree drained completely, substituting an empty leaf";
        return PaneNode::emptyLeaf();
    }
    return normalized;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Structural mutations
// ═══════════════════════════════════════════════════════════════════════════════

MutationResult split(const PaneNodePtr& root, const QString& paneId, SplitDirection direction,
                     const WorkspaceTab& tab, DropPosition edge)
{
    MutationResult result{root, QString(), false};

    if (!DropPositions::isEdge(edge)) {
        qCDebug(lcPaneTree) << "Split rejected: center is not an edge";
        return result;
    }
    const PaneNodePtr target = findLeaf(root, paneId);
    if (!target) {
        qCDebug(lcPaneTree) << "Split rejected: no leaf" << paneId;
        return result;
    }

    const SplitDirection axis = DropPositions::axisOf(edge);
    if (axis != direction) {
        qCDebug(lcPaneTree) << "Split direction" << SplitDirections::toString(direction)
                            << "disagrees with edge" << DropPositions::toString(edge) << "- using the edge axis";
    }
    const bool leading = DropPositions::isLeadingEdge(edge);

    // Remove the tab from wherever it lives so it is held by one leaf only
    PaneNodePtr tree = root;
    if (PaneNodePtr holder = leafContainingTab(tree, tab.id)) {
        tree = replaceNode(tree, holder->id(), leafWithoutTab(holder, tab.id));
    }

    const PaneNodePtr currentTarget = findLeaf(tree, paneId);
    const PaneNodePtr newLeaf = PaneNode::makeLeaf(PaneNode::generateLeafId(), {tab}, tab.id);
    const PaneNodePtr parent = parentOf(tree, paneId);

    if (parent && parent->direction() == axis) {
        // Same axis: become a sibling and share the target's extent
        const int index = parent->childIndex(paneId);
        QVector<PaneNodePtr> children = parent->children();
        QVector<qreal> sizes = normalizedSizes(parent->sizes(), children.size());

        const qreal half = sizes.at(index) / 2.0;
        sizes[index] = half;
        const int insertAt = leading ? index : index + 1;
        children.insert(insertAt, newLeaf);
        sizes.insert(insertAt, half);

        tree = replaceNode(tree, parent->id(), parent->withChildren(children, sizes));
    } else {
        const QVector<PaneNodePtr> children =
            leading ? QVector<PaneNodePtr>{newLeaf, currentTarget} : QVector<PaneNodePtr>{currentTarget, newLeaf};
        const qreal half = Defaults::TotalSize / 2.0;
        tree = replaceNode(tree, paneId, PaneNode::makeSplit(PaneNode::generateSplitId(), axis, children, {half, half}));
    }

    result.root = normalize(tree);
    result.activePaneId = newLeaf->id();
    result.changed = true;
    return result;
}

MutationResult moveTabToPane(const PaneNodePtr& root, const QString& tabId, const QString& sourcePaneId,
                             const QString& targetPaneId)
{
    MutationResult result{root, QString(), false};

    const PaneNodePtr source = findLeaf(root, sourcePaneId);
    const PaneNodePtr target = findLeaf(root, targetPaneId);
    if (!source || !target || !source->containsTab(tabId)) {
        qCDebug(lcPaneTree) << "Move rejected:" << tabId << "from" << sourcePaneId << "to" << targetPaneId;
        return result;
    }

    if (sourcePaneId == targetPaneId) {
        result.root = setActiveTab(root, targetPaneId, tabId);
        result.activePaneId = targetPaneId;
        result.changed = true;
        return result;
    }

    const WorkspaceTab tab = *source->tab(tabId);
    PaneNodePtr tree = replaceNode(root, sourcePaneId, leafWithoutTab(source, tabId));
    tree = replaceNode(tree, targetPaneId, leafWithTab(target, tab));

    result.root = normalize(tree);
    result.activePaneId = targetPaneId;
    result.changed = true;
    return result;
}

MutationResult moveTabToNewSplit(const PaneNodePtr& root, const QString& tabId, const QString& sourcePaneId,
                                 const QString& targetPaneId, DropPosition edge)
{
    MutationResult result{root, QString(), false};

    const PaneNodePtr source = findLeaf(root, sourcePaneId);
    if (!source || !source->containsTab(tabId) || !findLeaf(root, targetPaneId)) {
        qCDebug(lcPaneTree) << "Split move rejected:" << tabId << "from" << sourcePaneId << "to" << targetPaneId;
        return result;
    }
    if (sourcePaneId == targetPaneId && source->tabs().size() == 1) {
        qCDebug(lcPaneTree) << "Split move rejected: pane" << sourcePaneId << "would split off its only tab";
        return result;
    }

    // split() takes the tab out of its source leaf before inserting the new one
    return split(root, targetPaneId, DropPositions::axisOf(edge), *source->tab(tabId), edge);
}

MutationResult addTabToPane(const PaneNodePtr& root, const QString& paneId, const WorkspaceTab& tab)
{
    MutationResult result{root, QString(), false};

    const PaneNodePtr leaf = findLeaf(root, paneId);
    if (!leaf || tab.id.isEmpty()) {
        qCDebug(lcPaneTree) << "Add rejected: no leaf" << paneId;
        return result;
    }

    PaneNodePtr tree = root;
    const PaneNodePtr holder = leafContainingTab(root, tab.id);
    if (holder && holder->id() != paneId) {
        tree = replaceNode(tree, holder->id(), leafWithoutTab(holder, tab.id));
    }
    tree = replaceNode(tree, paneId, leafWithTab(leaf, tab));

    result.root = normalize(tree);
    result.activePaneId = paneId;
    result.changed = true;
    return result;
}

PaneNodePtr removeTab(const PaneNodePtr& root, const QString& tabId)
{
    const PaneNodePtr holder = leafContainingTab(root, tabId);
    if (!holder) {
        return root;
    }
    return normalize(replaceNode(root, holder->id(), leafWithoutTab(holder, tabId)));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Non-structural mutations
// ═══════════════════════════════════════════════════════════════════════════════

PaneNodePtr reorderTabsInPane(const PaneNodePtr& root, const QString& paneId, const QStringList& orderedTabIds)
{
    const PaneNodePtr leaf = findLeaf(root, paneId);
    if (!leaf) {
        return root;
    }

    const QSet<QString> requested(orderedTabIds.cbegin(), orderedTabIds.cend());
    if (orderedTabIds.size() != leaf->tabs().size() || requested.size() != orderedTabIds.size()) {
        qCDebug(lcPaneTree) << "Reorder rejected for" << paneId << ": not a permutation";
        return root;
    }

    QVector<WorkspaceTab> tabs;
    tabs.reserve(orderedTabIds.size());
    for (const QString& tabId : orderedTabIds) {
        const WorkspaceTab* tab = leaf->tab(tabId);
        if (!tab) {
            qCDebug(lcPaneTree) << "Reorder rejected for" << paneId << ": unknown tab" << tabId;
            return root;
        }
        tabs.append(*tab);
    }

    if (tabs == leaf->tabs()) {
        return root;
    }
    return replaceNode(root, paneId, leaf->withTabs(tabs, leaf->activeTabId()));
}

PaneNodePtr updatePaneSizes(const PaneNodePtr& root, const QString& splitId, const QVector<qreal>& sizes)
{
    const PaneNodePtr node = findNode(root, splitId);
    if (!node || !node->isSplit()) {
        qCDebug(lcPaneTree) << "Resize rejected: no split" << splitId;
        return root;
    }
    if (!sizesValid(sizes, node->children().size())) {
        qCDebug(lcPaneTree) << "Resize rejected for" << splitId << ": invalid sizes" << sizes;
        return root;
    }

    const QVector<qreal> normalized = normalizedSizes(sizes, node->children().size());
    if (normalized == node->sizes()) {
        return root;
    }
    return replaceNode(root, splitId, node->withSizes(normalized));
}

PaneNodePtr setActiveTab(const PaneNodePtr& root, const QString& paneId, const QString& tabId)
{
    const PaneNodePtr leaf = findLeaf(root, paneId);
    if (!leaf || !leaf->containsTab(tabId) || leaf->activeTabId() == tabId) {
        return root;
    }
    return replaceNode(root, paneId, leaf->withActiveTab(tabId));
}

PaneNodePtr filterTabs(const PaneNodePtr& root, const std::function<bool(const WorkspaceTab&)>& keep)
{
    return root ? filterNode(root, keep) : root;
}

PaneNodePtr mapTabs(const PaneNodePtr& root, const std::function<WorkspaceTab(const WorkspaceTab&)>& transform)
{
    return root ? mapNode(root, transform) : root;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Diagnostics
// ═══════════════════════════════════════════════════════════════════════════════

QStringList validate(const PaneNodePtr& root)
{
    QStringList violations;
    if (!root) {
        violations.append(QStringLiteral("missing root"));
        return violations;
    }
    QSet<QString> nodeIds;
    QSet<QString> tabIds;
    validateNode(root, true, nodeIds, tabIds, violations);
    return violations;
}

QString describe(const PaneNodePtr& root)
{
    QString out;
    if (root) {
        describeNode(root, 0, out);
    }
    return out;
}

} // namespace PaneTree

} // namespace Trellis
