// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "panenode.h"
#include "constants.h"
#include <QSet>
#include <QUuid>

namespace Trellis {

namespace {
QString generateId(QLatin1String prefix)
{
    return QString(prefix) + QUuid::createUuid().toString(QUuid::WithoutBraces);
}
} // namespace

QString PaneNode::generateLeafId()
{
    return generateId(IdPrefix::Leaf);
}

QString PaneNode::generateSplitId()
{
    return generateId(IdPrefix::Split);
}

PaneNodePtr PaneNode::makeLeaf(const QString& id, const QVector<WorkspaceTab>& tabs, const QString& activeTabId)
{
    // make_shared can't reach the private constructor
    std::shared_ptr<PaneNode> node(new PaneNode);
    node->m_type = Type::Leaf;
    node->m_id = id;

    QSet<QString> seen;
    node->m_tabs.reserve(tabs.size());
    for (const WorkspaceTab& tab : tabs) {
        if (tab.id.isEmpty() || seen.contains(tab.id)) {
            continue;
        }
        seen.insert(tab.id);
        node->m_tabs.append(tab);
    }

    if (seen.contains(activeTabId)) {
        node->m_activeTabId = activeTabId;
    } else if (!node->m_tabs.isEmpty()) {
        node->m_activeTabId = node->m_tabs.first().id;
    }

    return node;
}

PaneNodePtr PaneNode::makeSplit(const QString& id, SplitDirection direction, const QVector<PaneNodePtr>& children,
                                const QVector<qreal>& sizes)
{
    std::shared_ptr<PaneNode> node(new PaneNode);
    node->m_type = Type::Split;
    node->m_id = id;
    node->m_direction = direction;
    node->m_children = children;
    node->m_sizes = sizes;
    return node;
}

PaneNodePtr PaneNode::emptyLeaf()
{
    return makeLeaf(generateLeafId());
}

int PaneNode::tabIndex(const QString& tabId) const
{
    for (int i = 0; i < m_tabs.size(); ++i) {
        if (m_tabs.at(i).id == tabId) {
            return i;
        }
    }
    return -1;
}

const WorkspaceTab* PaneNode::tab(const QString& tabId) const
{
    const int index = tabIndex(tabId);
    return index >= 0 ? &m_tabs.at(index) : nullptr;
}

int PaneNode::childIndex(const QString& childId) const
{
    for (int i = 0; i < m_children.size(); ++i) {
        if (m_children.at(i)->id() == childId) {
            return i;
        }
    }
    return -1;
}

PaneNodePtr PaneNode::withTabs(const QVector<WorkspaceTab>& tabs, const QString& activeTabId) const
{
    return makeLeaf(m_id, tabs, activeTabId);
}

PaneNodePtr PaneNode::withActiveTab(const QString& activeTabId) const
{
    return makeLeaf(m_id, m_tabs, activeTabId);
}

PaneNodePtr PaneNode::withChildren(const QVector<PaneNodePtr>& children, const QVector<qreal>& sizes) const
{
    return makeSplit(m_id, m_direction, children, sizes);
}

PaneNodePtr PaneNode::withSizes(const QVector<qreal>& sizes) const
{
    return makeSplit(m_id, m_direction, m_children, sizes);
}

} // namespace Trellis
