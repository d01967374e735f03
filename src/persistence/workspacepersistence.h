// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trellis_export.h"
#include <QJsonObject>
#include <QObject>
#include <QPointer>

namespace Trellis {

class IEditorFiles;
class IFileExplorer;
class IKeyValueStore;
class WorkspaceStore;

/**
 * @brief Saves and restores the per-project editor state
 *
 * The state of project P lives under key "editor-state/P":
 *   {paneLayout, activePaneId, openFiles, activeFilePath, expandedDirs,
 *    fileExplorerVisible, activeTabId}
 *
 * Every store change schedules a debounced write of the current project. While
 * a restore is running (see RestoreScope) those writes are suppressed, so a
 * half-restored state is never persisted.
 *
 * Switching projects runs, in order:
 * 1. write the outgoing project's state immediately
 * 2. close all files and remove all editor tabs
 * 3. read the incoming project's state
 * 4. restore explorer state, reopen files, rebuild the layout keeping only
 *    editor tabs whose file reopened
 * 5. install the layout with a single WorkspaceStore::replaceState(), or
 *    reset it when the project has no stored state
 */
class TRELLIS_EXPORT WorkspacePersistence : public QObject
{
    Q_OBJECT

public:
    WorkspacePersistence(WorkspaceStore* store, IKeyValueStore* storage, IEditorFiles* editorFiles,
                         IFileExplorer* fileExplorer, QObject* parent = nullptr);
    ~WorkspacePersistence() override;

    static QString storageKey(const QString& projectId);

    QString projectId() const { return m_projectId; }
    QString projectRoot() const { return m_projectRoot; }

    /**
     * @brief Switch to another project
     * @param projectId Project to restore; switching to the current project does nothing
     * @param projectRoot Root directory of the project. When set, only expanded
     *        directories inside it are restored
     */
    void setProject(const QString& projectId, const QString& projectRoot = QString());

    /**
     * @brief Current state in its persisted form
     */
    QJsonObject captureState() const;

    /**
     * @brief Write the current project's state now, bypassing the debounce
     * @return false if there is no current project or the write failed
     */
    bool persistNow();

    /**
     * @brief Schedule a debounced write of the current project
     *
     * Connected to the store; editor and file explorer hosts call it when
     * their own state changes. Ignored during a restore.
     */
    void scheduleSave();

    bool isRestoring() const { return m_restoreDepth > 0; }

    // Used by RestoreScope
    void beginRestore();
    void endRestore();

Q_SIGNALS:
    /**
     * @brief A project switch finished
     * @param hadState false if the project had no stored state and the layout was reset
     */
    void projectRestored(const QString& projectId, bool hadState);

private:
    void restoreProject();

    QPointer<WorkspaceStore> m_store;
    IKeyValueStore* m_storage;
    IEditorFiles* m_editorFiles;
    IFileExplorer* m_fileExplorer;

    QString m_projectId;
    QString m_projectRoot;
    int m_restoreDepth = 0;
};

} // namespace Trellis
