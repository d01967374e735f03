// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trellis_export.h"
#include "types.h"
#include "workspacetab.h"
#include <QString>
#include <QVector>
#include <memory>

namespace Trellis {

class PaneNode;

/**
 * @brief Shared handle to an immutable pane node
 *
 * Nodes never change after construction. Transformations build new nodes and
 * share every untouched subtree with the previous version, so a caller holding
 * an older root can compare it against the current one by identity.
 */
using PaneNodePtr = std::shared_ptr<const PaneNode>;

/**
 * @brief A node of the pane tree: a Leaf holding tabs, or a Split holding children
 *
 * Leaf: ordered tabs plus the active tab id (empty when there are no tabs).
 * Split: direction, two or more children and one size (percent) per child.
 *
 * The factories establish the per-node invariants:
 * - a leaf never holds two tabs with the same id (first occurrence wins)
 * - a leaf's active tab id names one of its tabs, or is empty when it has none
 *
 * Tree-level invariants (no degenerate splits, sizes summing to 100, no empty
 * leaves besides a lone root) are restored by PaneTree::normalize().
 */
class TRELLIS_EXPORT PaneNode
{
public:
    enum class Type {
        Leaf,
        Split
    };

    /**
     * @brief Create a leaf
     * @param id Node id (must not be empty)
     * @param tabs Tabs in display order, duplicates by id are dropped
     * @param activeTabId Active tab; falls back to the first tab if it does not
     *        name one of @p tabs
     */
    static PaneNodePtr makeLeaf(const QString& id, const QVector<WorkspaceTab>& tabs = {},
                                const QString& activeTabId = QString());

    /**
     * @brief Create a split
     *
     * Sizes are taken as given; PaneTree::normalize() repairs them if they do
     * not match the children.
     */
    static PaneNodePtr makeSplit(const QString& id, SplitDirection direction, const QVector<PaneNodePtr>& children,
                                 const QVector<qreal>& sizes);

    /**
     * @brief Fresh empty leaf with a generated id
     */
    static PaneNodePtr emptyLeaf();

    static QString generateLeafId();
    static QString generateSplitId();

    Type type() const
    {
        return m_type;
    }
    bool isLeaf() const
    {
        return m_type == Type::Leaf;
    }
    bool isSplit() const
    {
        return m_type == Type::Split;
    }
    QString id() const
    {
        return m_id;
    }

    // Leaf accessors
    const QVector<WorkspaceTab>& tabs() const
    {
        return m_tabs;
    }
    QString activeTabId() const
    {
        return m_activeTabId;
    }
    int tabIndex(const QString& tabId) const;
    bool containsTab(const QString& tabId) const
    {
        return tabIndex(tabId) >= 0;
    }
    const WorkspaceTab* tab(const QString& tabId) const;
    const WorkspaceTab* activeTab() const
    {
        return tab(m_activeTabId);
    }

    // Split accessors
    SplitDirection direction() const
    {
        return m_direction;
    }
    const QVector<PaneNodePtr>& children() const
    {
        return m_children;
    }
    const QVector<qreal>& sizes() const
    {
        return m_sizes;
    }
    int childIndex(const QString& childId) const;

    // Copy-with helpers, the only way to "modify" a node
    PaneNodePtr withTabs(const QVector<WorkspaceTab>& tabs, const QString& activeTabId) const;
    PaneNodePtr withActiveTab(const QString& activeTabId) const;
    PaneNodePtr withChildren(const QVector<PaneNodePtr>& children, const QVector<qreal>& sizes) const;
    PaneNodePtr withSizes(const QVector<qreal>& sizes) const;

private:
    PaneNode() = default;

    Type m_type = Type::Leaf;
    QString m_id;

    QVector<WorkspaceTab> m_tabs;
    QString m_activeTabId;

    SplitDirection m_direction = SplitDirection::Horizontal;
    QVector<PaneNodePtr> m_children;
    QVector<qreal> m_sizes;
};

} // namespace Trellis
