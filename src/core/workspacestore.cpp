// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "workspacestore.h"
#include "logging.h"
#include <QSet>

namespace Trellis {

WorkspaceStore::WorkspaceStore(QObject* parent)
    : QObject(parent)
    , m_root(PaneNode::emptyLeaf())
    , m_activePaneId(m_root->id())
{
}

WorkspaceStore::~WorkspaceStore() = default;

PaneNodePtr WorkspaceStore::activePane() const
{
    return PaneTree::findLeaf(m_root, m_activePaneId);
}

bool WorkspaceStore::commit(const PaneNodePtr& root, const QString& activePaneId)
{
    const PaneNodePtr newRoot = root ? root : PaneNode::emptyLeaf();

    QString newActive = activePaneId;
    if (newActive.isEmpty() || !PaneTree::findLeaf(newRoot, newActive)) {
        newActive = m_activePaneId;
    }
    if (!PaneTree::findLeaf(newRoot, newActive)) {
        const PaneNodePtr first = PaneTree::firstLeaf(newRoot);
        newActive = first ? first->id() : QString();
        qCDebug(lcStore) << "Active pane fell back to first leaf" << newActive;
    }

    const bool layoutDiffers = newRoot != m_root;
    const bool activeDiffers = newActive != m_activePaneId;
    if (!layoutDiffers && !activeDiffers) {
        return false;
    }

    m_root = newRoot;
    m_activePaneId = newActive;

    if (layoutDiffers) {
        Q_EMIT layoutChanged();
    }
    if (activeDiffers) {
        Q_EMIT activePaneChanged(m_activePaneId);
    }
    Q_EMIT stateChanged();
    return true;
}

bool WorkspaceStore::commit(const PaneTree::MutationResult& result)
{
    if (!result.changed) {
        return false;
    }
    return commit(result.root, result.activePaneId);
}

// ═══════════════════════════════════════════════════════════════════════════════
// IWorkspaceActions
// ═══════════════════════════════════════════════════════════════════════════════

bool WorkspaceStore::splitPane(const QString& paneId, SplitDirection direction, const WorkspaceTab& tab,
                               DropPosition edge)
{
    return commit(PaneTree::split(m_root, paneId, direction, tab, edge));
}

bool WorkspaceStore::addTabToPane(const QString& paneId, const WorkspaceTab& tab)
{
    return commit(PaneTree::addTabToPane(m_root, paneId, tab));
}

bool WorkspaceStore::moveTabToPane(const QString& tabId, const QString& sourcePaneId, const QString& targetPaneId)
{
    return commit(PaneTree::moveTabToPane(m_root, tabId, sourcePaneId, targetPaneId));
}

bool WorkspaceStore::moveTabToNewSplit(const QString& tabId, const QString& sourcePaneId, const QString& targetPaneId,
                                       DropPosition edge)
{
    return commit(PaneTree::moveTabToNewSplit(m_root, tabId, sourcePaneId, targetPaneId, edge));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Tab management
// ═══════════════════════════════════════════════════════════════════════════════

bool WorkspaceStore::addTerminalTab(const QString& terminalId, const QString& paneId)
{
    if (terminalId.isEmpty()) {
        return false;
    }
    return addTabToPane(paneId.isEmpty() ? m_activePaneId : paneId, WorkspaceTab::terminal(terminalId));
}

bool WorkspaceStore::addEditorTab(const QString& filePath, const QString& paneId)
{
    if (filePath.isEmpty()) {
        return false;
    }
    return addTabToPane(paneId.isEmpty() ? m_activePaneId : paneId, WorkspaceTab::editor(filePath));
}

bool WorkspaceStore::removeTab(const QString& tabId)
{
    return commit(PaneTree::removeTab(m_root, tabId));
}

bool WorkspaceStore::reorderTabsInPane(const QString& paneId, const QStringList& orderedTabIds)
{
    return commit(PaneTree::reorderTabsInPane(m_root, paneId, orderedTabIds));
}

bool WorkspaceStore::updatePaneSizes(const QString& splitId, const QVector<qreal>& sizes)
{
    return commit(PaneTree::updatePaneSizes(m_root, splitId, sizes));
}

bool WorkspaceStore::setActiveTab(const QString& paneId, const QString& tabId)
{
    const PaneNodePtr leaf = PaneTree::findLeaf(m_root, paneId);
    if (!leaf || !leaf->containsTab(tabId)) {
        qCDebug(lcStore) << "setActiveTab ignored:" << tabId << "is not in pane" << paneId;
        return false;
    }
    return commit(PaneTree::setActiveTab(m_root, paneId, tabId), paneId);
}

bool WorkspaceStore::setActivePane(const QString& paneId)
{
    if (!PaneTree::findLeaf(m_root, paneId)) {
        qCDebug(lcStore) << "setActivePane ignored: no leaf" << paneId;
        return false;
    }
    return commit(m_root, paneId);
}

QString WorkspaceStore::nextTabId(int step) const
{
    const PaneNodePtr leaf = activePane();
    if (!leaf || leaf->tabs().isEmpty()) {
        return QString();
    }

    const int count = leaf->tabs().size();
    const int current = qMax(0, leaf->tabIndex(leaf->activeTabId()));
    const int next = ((current + step) % count + count) % count;
    return leaf->tabs().at(next).id;
}

bool WorkspaceStore::syncTerminalTabs(const QStringList& terminalIds)
{
    const QSet<QString> live(terminalIds.cbegin(), terminalIds.cend());

    PaneNodePtr tree = PaneTree::normalize(PaneTree::filterTabs(m_root, [&live](const WorkspaceTab& tab) {
        return !tab.isTerminal() || live.contains(tab.terminalId);
    }));

    QSet<QString> present;
    for (const WorkspaceTab& tab : PaneTree::allTabs(tree)) {
        if (tab.isTerminal()) {
            present.insert(tab.terminalId);
        }
    }

    QString targetPaneId = m_activePaneId;
    if (!PaneTree::findLeaf(tree, targetPaneId)) {
        targetPaneId = PaneTree::firstLeaf(tree)->id();
    }

    QString activePaneId;
    for (const QString& terminalId : terminalIds) {
        if (terminalId.isEmpty() || present.contains(terminalId)) {
            continue;
        }
        present.insert(terminalId);
        const PaneTree::MutationResult result =
            PaneTree::addTabToPane(tree, targetPaneId, WorkspaceTab::terminal(terminalId));
        tree = result.root;
        activePaneId = result.activePaneId;
    }

    return commit(tree, activePaneId);
}

bool WorkspaceStore::remapTerminalTabs(const QHash<QString, QString>& oldToNew)
{
    if (oldToNew.isEmpty()) {
        return false;
    }

    // A remapped tab whose new terminal already has a tab is dropped rather
    // than duplicated; tabs that are not remapped keep their terminal.
    QSet<QString> claimed;
    for (const WorkspaceTab& tab : PaneTree::allTabs(m_root)) {
        if (tab.isTerminal() && !oldToNew.contains(tab.terminalId)) {
            claimed.insert(tab.terminalId);
        }
    }
    const PaneNodePtr deduplicated = PaneTree::filterTabs(m_root, [&oldToNew, &claimed](const WorkspaceTab& tab) {
        if (!tab.isTerminal() || !oldToNew.contains(tab.terminalId)) {
            return true;
        }
        const QString target = oldToNew.value(tab.terminalId);
        if (claimed.contains(target)) {
            qCDebug(lcStore) << "Remap of" << tab.id << "dropped: terminal" << target << "already has a tab";
            return false;
        }
        claimed.insert(target);
        return true;
    });

    const PaneNodePtr remapped = PaneTree::mapTabs(deduplicated, [&oldToNew](const WorkspaceTab& tab) {
        if (tab.isTerminal() && oldToNew.contains(tab.terminalId)) {
            return WorkspaceTab::terminal(oldToNew.value(tab.terminalId));
        }
        return tab;
    });
    return commit(PaneTree::normalize(remapped));
}

bool WorkspaceStore::clearEditorTabs()
{
    const PaneNodePtr filtered = PaneTree::filterTabs(m_root, [](const WorkspaceTab& tab) {
        return !tab.isEditor();
    });
    return commit(PaneTree::normalize(filtered));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Whole-state operations
// ═══════════════════════════════════════════════════════════════════════════════

void WorkspaceStore::resetLayout()
{
    const PaneNodePtr leaf = PaneNode::emptyLeaf();
    commit(leaf, leaf->id());
    qCDebug(lcStore) << "Layout reset to" << leaf->id();
}

void WorkspaceStore::replaceState(const PaneNodePtr& root, const QString& activePaneId)
{
    const PaneNodePtr normalized = PaneTree::normalize(root);

    QString active = activePaneId;
    if (!PaneTree::findLeaf(normalized, active)) {
        active = PaneTree::firstLeaf(normalized)->id();
    }
    commit(normalized, active);
    qCInfo(lcStore) << "Layout replaced:" << PaneTree::leafCount(normalized) << "pane(s), active" << active;
}

} // namespace Trellis
