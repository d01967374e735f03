// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "panelayoutserialization.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include "../core/panetree.h"

#include <QJsonArray>
#include <QSet>

namespace Trellis {
namespace PaneLayoutSerialization {

using namespace JsonKeys;

namespace {

QVector<WorkspaceTab> readTabs(const QJsonObject& json, QSet<QString>& seenTabIds)
{
    QVector<WorkspaceTab> tabs;

    const QJsonArray tabsArray = json[Tabs].toArray();
    for (const QJsonValue& value : tabsArray) {
        const std::optional<WorkspaceTab> tab = WorkspaceTab::fromReference(value.toObject());
        if (!tab) {
            qCDebug(lcPersistence) << "Skipping malformed tab entry" << value;
            continue;
        }
        if (seenTabIds.contains(tab->id)) {
            qCDebug(lcPersistence) << "Skipping duplicate tab" << tab->id;
            continue;
        }
        seenTabIds.insert(tab->id);
        tabs.append(*tab);
    }

    // Leaves written before per-pane tabs only listed their editor files
    if (tabs.isEmpty() && json[EditorFilePaths].isArray()) {
        const QJsonArray paths = json[EditorFilePaths].toArray();
        for (const QJsonValue& value : paths) {
            const QString filePath = value.toString();
            if (filePath.isEmpty()) {
                continue;
            }
            const WorkspaceTab tab = WorkspaceTab::editor(filePath);
            if (seenTabIds.contains(tab.id)) {
                continue;
            }
            seenTabIds.insert(tab.id);
            tabs.append(tab);
        }
        if (!tabs.isEmpty()) {
            qCDebug(lcPersistence) << "Migrated legacy leaf with" << tabs.size() << "editor file(s)";
        }
    }

    return tabs;
}

PaneNodePtr readNode(const QJsonObject& json, QSet<QString>& seenTabIds)
{
    const QString type = json[Type].toString();
    QString id = json[Id].toString();

    if (type == JsonValues::Leaf) {
        if (id.isEmpty()) {
            id = PaneNode::generateLeafId();
        }
        return PaneNode::makeLeaf(id, readTabs(json, seenTabIds), json[ActiveTabId].toString());
    }

    if (type == JsonValues::Split) {
        if (id.isEmpty()) {
            id = PaneNode::generateSplitId();
        }
        const SplitDirection direction =
            SplitDirections::fromString(json[Direction].toString()).value_or(SplitDirection::Horizontal);

        const QJsonArray childArray = json[Children].toArray();
        const QJsonArray sizeArray = json[Sizes].toArray();

        QVector<PaneNodePtr> children;
        QVector<qreal> sizes;
        for (int i = 0; i < childArray.size(); ++i) {
            PaneNodePtr child = readNode(childArray.at(i).toObject(), seenTabIds);
            if (!child) {
                continue;
            }
            children.append(child);
            // Missing or non-numeric sizes read as 0 and get repaired by normalization
            sizes.append(i < sizeArray.size() ? sizeArray.at(i).toDouble(0.0) : 0.0);
        }

        if (children.isEmpty()) {
            qCDebug(lcPersistence) << "Dropping split" << id << "without usable children";
            return nullptr;
        }
        return PaneNode::makeSplit(id, direction, children, sizes);
    }

    qCDebug(lcPersistence) << "Skipping node of unknown type" << type;
    return nullptr;
}

} // namespace

QJsonObject serializeNode(const PaneNodePtr& node)
{
    QJsonObject json;
    if (!node) {
        return json;
    }

    json[Id] = node->id();

    if (node->isLeaf()) {
        json[Type] = JsonValues::Leaf;
        QJsonArray tabs;
        for (const WorkspaceTab& tab : node->tabs()) {
            tabs.append(tab.toReference());
        }
        json[Tabs] = tabs;
        json[ActiveTabId] =
            node->activeTabId().isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(node->activeTabId());
        return json;
    }

    json[Type] = JsonValues::Split;
    json[Direction] = SplitDirections::toString(node->direction());
    QJsonArray sizes;
    for (qreal size : node->sizes()) {
        sizes.append(size);
    }
    json[Sizes] = sizes;
    QJsonArray children;
    for (const PaneNodePtr& child : node->children()) {
        children.append(serializeNode(child));
    }
    json[Children] = children;
    return json;
}

PaneNodePtr deserializeNode(const QJsonObject& json)
{
    QSet<QString> seenTabIds;
    return readNode(json, seenTabIds);
}

void writeLayout(QJsonObject& state, const PaneNodePtr& root, const QString& activePaneId)
{
    state[PaneLayout] = serializeNode(root);
    state[ActivePaneId] = activePaneId;
}

std::optional<RestoredLayout> restoreLayout(const QJsonObject& state,
                                            const std::function<bool(const QString&)>& isFileAvailable)
{
    if (!state.contains(PaneLayout) || state[PaneLayout].isNull()) {
        return std::nullopt;
    }

    PaneNodePtr root = deserializeNode(state[PaneLayout].toObject());
    if (!root) {
        qCWarning(lcPersistence) << "Stored pane layout is unusable, starting from an empty pane";
    }

    if (root && isFileAvailable) {
        root = PaneTree::filterTabs(root, [&isFileAvailable](const WorkspaceTab& tab) {
            return !tab.isEditor() || isFileAvailable(tab.filePath);
        });
    }
    root = PaneTree::normalize(root);

    QString activePaneId = state[ActivePaneId].toString();
    if (!PaneTree::findLeaf(root, activePaneId)) {
        activePaneId = PaneTree::firstLeaf(root)->id();
    }

    return RestoredLayout{root, activePaneId};
}

std::optional<QJsonObject> migrateState(const QJsonObject& state)
{
    const std::optional<RestoredLayout> restored = restoreLayout(state);
    if (!restored) {
        return std::nullopt;
    }
    QJsonObject migrated = state;
    writeLayout(migrated, restored->root, restored->activePaneId);
    return migrated;
}

} // namespace PaneLayoutSerialization
} // namespace Trellis
