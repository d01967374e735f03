// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "workspacepersistence.h"
#include "panelayoutserialization.h"
#include "restorescope.h"
#include "../core/constants.h"
#include "../core/interfaces.h"
#include "../core/logging.h"
#include "../core/workspacestore.h"

#include <QJsonArray>
#include <QSet>

namespace Trellis {

using namespace JsonKeys;

namespace {

QJsonValue stringOrNull(const QString& value)
{
    return value.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(value);
}

/**
 * @brief Keep @p dirs that are @p root itself or below it; all of them when @p root is empty
 */
QStringList dirsWithinRoot(const QStringList& dirs, const QString& root)
{
    if (root.isEmpty()) {
        return dirs;
    }

    QString base = root;
    while (base.size() > 1 && base.endsWith(QLatin1Char('/'))) {
        base.chop(1);
    }
    const QString prefix = base == QLatin1String("/") ? base : base + QLatin1Char('/');

    QStringList result;
    for (const QString& dir : dirs) {
        if (dir == base || dir.startsWith(prefix)) {
            result.append(dir);
        }
    }
    return result;
}

} // namespace

WorkspacePersistence::WorkspacePersistence(WorkspaceStore* store, IKeyValueStore* storage, IEditorFiles* editorFiles,
                                           IFileExplorer* fileExplorer, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_storage(storage)
    , m_editorFiles(editorFiles)
    , m_fileExplorer(fileExplorer)
{
    if (m_store) {
        connect(m_store, &WorkspaceStore::stateChanged, this, &WorkspacePersistence::scheduleSave);
    }
}

WorkspacePersistence::~WorkspacePersistence() = default;

QString WorkspacePersistence::storageKey(const QString& projectId)
{
    return QString(Storage::EditorStatePrefix) + projectId;
}

void WorkspacePersistence::beginRestore()
{
    ++m_restoreDepth;
}

void WorkspacePersistence::endRestore()
{
    if (m_restoreDepth > 0) {
        --m_restoreDepth;
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Saving
// ═══════════════════════════════════════════════════════════════════════════════

QJsonObject WorkspacePersistence::captureState() const
{
    QJsonObject state;
    if (!m_store) {
        return state;
    }

    PaneLayoutSerialization::writeLayout(state, m_store->root(), m_store->activePaneId());

    const PaneNodePtr activePane = m_store->activePane();
    state[ActiveTabId] = stringOrNull(activePane ? activePane->activeTabId() : QString());

    state[OpenFiles] = m_editorFiles ? m_editorFiles->openFileRecords() : QJsonArray();
    state[ActiveFilePath] = stringOrNull(m_editorFiles ? m_editorFiles->activeFilePath() : QString());

    state[ExpandedDirs] = QJsonArray::fromStringList(m_fileExplorer ? m_fileExplorer->expandedDirs() : QStringList());
    state[FileExplorerVisible] = m_fileExplorer ? m_fileExplorer->isVisible() : true;

    return state;
}

void WorkspacePersistence::scheduleSave()
{
    if (isRestoring() || m_projectId.isEmpty() || !m_storage) {
        return;
    }
    m_storage->writeDebounced(storageKey(m_projectId), captureState());
}

bool WorkspacePersistence::persistNow()
{
    if (m_projectId.isEmpty() || !m_storage) {
        return false;
    }
    // Land older debounced values first so they cannot overwrite this one later
    m_storage->flushPendingWrites();
    return m_storage->write(storageKey(m_projectId), captureState());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Project switching
// ═══════════════════════════════════════════════════════════════════════════════

void WorkspacePersistence::setProject(const QString& projectId, const QString& projectRoot)
{
    if (projectId.isEmpty() || projectId == m_projectId) {
        return;
    }

    if (!m_projectId.isEmpty() && !persistNow()) {
        qCWarning(lcPersistence) << "Could not save state of project" << m_projectId << "before switching";
    }

    qCInfo(lcPersistence) << "Switching to project" << projectId;
    m_projectId = projectId;
    m_projectRoot = projectRoot;

    restoreProject();
}

void WorkspacePersistence::restoreProject()
{
    RestoreScope scope(this);

    if (m_editorFiles) {
        m_editorFiles->clearAllFiles();
    }
    if (m_store) {
        m_store->clearEditorTabs();
    }

    const ReadResult result = m_storage ? m_storage->read(storageKey(m_projectId)) : ReadResult();
    if (!result.success) {
        if (result.error != StorageError::FileNotFound && result.error != StorageError::None) {
            qCWarning(lcPersistence) << "Could not read state of project" << m_projectId << ":"
                                     << storageErrorName(result.error) << result.errorString;
        }
        if (m_store) {
            m_store->resetLayout();
        }
        Q_EMIT projectRestored(m_projectId, false);
        return;
    }
    const QJsonObject& state = result.data;

    // File explorer
    if (m_fileExplorer) {
        m_fileExplorer->setVisible(state[FileExplorerVisible].toBool(true));
        QStringList dirs;
        const QJsonArray dirArray = state[ExpandedDirs].toArray();
        for (const QJsonValue& value : dirArray) {
            if (!value.toString().isEmpty()) {
                dirs.append(value.toString());
            }
        }
        m_fileExplorer->setExpandedDirs(dirsWithinRoot(dirs, m_projectRoot));
    }

    // Open files, in their stored order
    QSet<QString> reopened;
    QStringList reopenedInOrder;
    if (m_editorFiles) {
        const QJsonArray records = state[OpenFiles].toArray();
        for (const QJsonValue& record : records) {
            const QString filePath = m_editorFiles->reopenFile(record.toObject());
            if (filePath.isEmpty()) {
                qCDebug(lcPersistence) << "Skipping file that did not reopen:" << record;
                continue;
            }
            if (!reopened.contains(filePath)) {
                reopened.insert(filePath);
                reopenedInOrder.append(filePath);
            }
        }

        const QString activeFilePath = state[ActiveFilePath].toString();
        if (reopened.contains(activeFilePath)) {
            m_editorFiles->setActiveFilePath(activeFilePath);
        }
    }

    if (!m_store) {
        Q_EMIT projectRestored(m_projectId, true);
        return;
    }

    const std::optional<PaneLayoutSerialization::RestoredLayout> layout =
        PaneLayoutSerialization::restoreLayout(state, [&reopened](const QString& filePath) {
            return reopened.contains(filePath);
        });

    if (layout) {
        m_store->replaceState(layout->root, layout->activePaneId);
    } else if (!reopenedInOrder.isEmpty()) {
        // State saved before pane layouts existed: one pane with the reopened files
        QVector<WorkspaceTab> tabs;
        for (const QString& filePath : std::as_const(reopenedInOrder)) {
            tabs.append(WorkspaceTab::editor(filePath));
        }
        const QString activeTabId = WorkspaceTab::editorTabId(state[ActiveFilePath].toString());
        const PaneNodePtr leaf = PaneNode::makeLeaf(PaneNode::generateLeafId(), tabs, activeTabId);
        m_store->replaceState(leaf, leaf->id());
    } else {
        m_store->resetLayout();
    }

    const QString activeTabId = state[ActiveTabId].toString();
    if (!activeTabId.isEmpty() && m_store->activePane() && m_store->activePane()->containsTab(activeTabId)) {
        m_store->setActiveTab(m_store->activePaneId(), activeTabId);
    }

    qCInfo(lcPersistence) << "Restored project" << m_projectId << "with" << reopened.size() << "file(s) and"
                          << PaneTree::leafCount(m_store->root()) << "pane(s)";
    Q_EMIT projectRestored(m_projectId, true);
}

} // namespace Trellis
