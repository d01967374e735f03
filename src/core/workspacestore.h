// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trellis_export.h"
#include "interfaces.h"
#include "panetree.h"
#include <QHash>
#include <QObject>

namespace Trellis {

/**
 * @brief Holder of the current pane tree and active pane
 *
 * WorkspaceStore is the single mutable owner of the layout. Every mutation
 * computes a new tree with PaneTree, installs it atomically and notifies
 * subscribers synchronously before returning. There is no global instance;
 * each window (or test) constructs its own store.
 *
 * The active pane id always names an existing leaf. When a mutation removes
 * the active leaf the pointer moves to the first remaining leaf (pre-order).
 *
 * Signals:
 * - layoutChanged: the root node changed (identity comparison)
 * - activePaneChanged: the active pane id changed
 * - stateChanged: either of the above; emitted once per mutation
 */
class TRELLIS_EXPORT WorkspaceStore : public QObject, public IWorkspaceActions
{
    Q_OBJECT
    Q_PROPERTY(QString activePaneId READ activePaneId NOTIFY activePaneChanged)

public:
    explicit WorkspaceStore(QObject* parent = nullptr);
    ~WorkspaceStore() override;

    PaneNodePtr root() const
    {
        return m_root;
    }
    QString activePaneId() const
    {
        return m_activePaneId;
    }
    PaneNodePtr activePane() const;

    // ═══════════════════════════════════════════════════════════════════════════
    // IWorkspaceActions
    // ═══════════════════════════════════════════════════════════════════════════

    bool splitPane(const QString& paneId, SplitDirection direction, const WorkspaceTab& tab,
                   DropPosition edge) override;
    bool addTabToPane(const QString& paneId, const WorkspaceTab& tab) override;
    bool moveTabToPane(const QString& tabId, const QString& sourcePaneId, const QString& targetPaneId) override;
    bool moveTabToNewSplit(const QString& tabId, const QString& sourcePaneId, const QString& targetPaneId,
                           DropPosition edge) override;

    // ═══════════════════════════════════════════════════════════════════════════
    // Tab management
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Add a terminal tab to @p paneId, or to the active pane if empty
     */
    bool addTerminalTab(const QString& terminalId, const QString& paneId = QString());

    /**
     * @brief Add an editor tab to @p paneId, or to the active pane if empty
     */
    bool addEditorTab(const QString& filePath, const QString& paneId = QString());

    bool removeTab(const QString& tabId);
    bool reorderTabsInPane(const QString& paneId, const QStringList& orderedTabIds);
    bool updatePaneSizes(const QString& splitId, const QVector<qreal>& sizes);

    /**
     * @brief Activate a tab and the pane holding it
     */
    bool setActiveTab(const QString& paneId, const QString& tabId);

    /**
     * @brief Focus a pane; ignored unless @p paneId names a leaf
     */
    bool setActivePane(const QString& paneId);

    /**
     * @brief Id of the tab @p step positions away from the active tab of the active pane
     *
     * Wraps around at both ends. Returns an empty string if the active pane has
     * no tabs.
     */
    QString nextTabId(int step = 1) const;

    /**
     * @brief Bring terminal tabs in line with the set of live terminals
     *
     * Tabs of terminals not in @p terminalIds are removed; terminals without a
     * tab get one appended to the active pane.
     */
    bool syncTerminalTabs(const QStringList& terminalIds);

    /**
     * @brief Rewrite terminal ids after terminals were respawned
     *
     * A tab remapped onto a terminal that already has a tab is removed.
     * @param oldToNew Maps previous terminal ids to their replacements
     */
    bool remapTerminalTabs(const QHash<QString, QString>& oldToNew);

    /**
     * @brief Remove every editor tab (panes left empty are pruned)
     */
    bool clearEditorTabs();

    // ═══════════════════════════════════════════════════════════════════════════
    // Whole-state operations
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Replace the layout with a single empty leaf and focus it
     */
    void resetLayout();

    /**
     * @brief Install a restored tree in one step
     *
     * The tree is normalized; an active pane id that does not name a leaf falls
     * back to the first leaf.
     */
    void replaceState(const PaneNodePtr& root, const QString& activePaneId);

Q_SIGNALS:
    void layoutChanged();
    void activePaneChanged(const QString& paneId);
    void stateChanged();

private:
    /**
     * @brief Install @p root and @p activePaneId, emitting the matching signals
     *
     * An empty or stale @p activePaneId keeps the current active pane if it
     * still exists, else falls back to the first leaf.
     * @return true if anything changed
     */
    bool commit(const PaneNodePtr& root, const QString& activePaneId = QString());
    bool commit(const PaneTree::MutationResult& result);

    PaneNodePtr m_root;
    QString m_activePaneId;
};

} // namespace Trellis
