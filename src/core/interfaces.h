// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trellis_export.h"
#include "types.h"
#include "workspacetab.h"
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace Trellis {

/**
 * @brief Mutation surface the drag session dispatches drops to
 *
 * This is a pure abstract interface (no QObject). The concrete WorkspaceStore
 * inherits from QObject and provides the signals; tests substitute a recorder.
 *
 * Each call returns true if the layout changed.
 */
class TRELLIS_EXPORT IWorkspaceActions
{
public:
    IWorkspaceActions() = default;
    virtual ~IWorkspaceActions();

    virtual bool splitPane(const QString& paneId, SplitDirection direction, const WorkspaceTab& tab,
                           DropPosition edge) = 0;
    virtual bool addTabToPane(const QString& paneId, const WorkspaceTab& tab) = 0;
    virtual bool moveTabToPane(const QString& tabId, const QString& sourcePaneId, const QString& targetPaneId) = 0;
    virtual bool moveTabToNewSplit(const QString& tabId, const QString& sourcePaneId, const QString& targetPaneId,
                                   DropPosition edge) = 0;
};

/**
 * @brief Open-files registry owned by the editor
 *
 * The layout engine only references files by path. Persisted records are
 * opaque to it and passed back unchanged on restore.
 */
class TRELLIS_EXPORT IEditorFiles
{
public:
    IEditorFiles() = default;
    virtual ~IEditorFiles();

    /**
     * @brief Open a file in the registry
     * @return false if the file could not be opened
     */
    virtual bool openFile(const QString& filePath) = 0;

    /**
     * @brief Persistable description of every open file (the "openFiles" array)
     */
    virtual QJsonArray openFileRecords() const = 0;

    /**
     * @brief Reopen a file from a record produced by openFileRecords()
     * @return Path of the reopened file, empty on failure
     */
    virtual QString reopenFile(const QJsonObject& record) = 0;

    /**
     * @brief Close every open file without prompting
     */
    virtual void clearAllFiles() = 0;

    virtual QString activeFilePath() const = 0;
    virtual void setActiveFilePath(const QString& filePath) = 0;
};

/**
 * @brief File explorer view state carried along with the layout
 */
class TRELLIS_EXPORT IFileExplorer
{
public:
    IFileExplorer() = default;
    virtual ~IFileExplorer();

    virtual QStringList expandedDirs() const = 0;
    virtual void setExpandedDirs(const QStringList& dirs) = 0;
    virtual bool isVisible() const = 0;
    virtual void setVisible(bool visible) = 0;
};

/**
 * @brief Error classification of key-value storage operations
 */
enum class StorageError {
    None = 0,
    FileNotFound,
    ParseError,
    WriteError,
    DeleteError,
    InvalidKey
};

/**
 * @brief Outcome of IKeyValueStore::read()
 */
struct TRELLIS_EXPORT ReadResult
{
    bool success = false;
    QJsonObject data;
    StorageError error = StorageError::None;
    QString errorString;
};

/**
 * @brief Key-value persistence backend
 *
 * Keys are slash separated paths ("editor-state/<projectId>"). Values are JSON
 * objects. Debounced writes are coalesced per key and land after the
 * configured delay, or immediately on flushPendingWrites().
 */
class TRELLIS_EXPORT IKeyValueStore
{
public:
    IKeyValueStore() = default;
    virtual ~IKeyValueStore();

    virtual ReadResult read(const QString& key) const = 0;
    virtual bool write(const QString& key, const QJsonObject& data) = 0;
    virtual void writeDebounced(const QString& key, const QJsonObject& data) = 0;
    virtual void flushPendingWrites() = 0;
    virtual bool remove(const QString& key) = 0;
};

TRELLIS_EXPORT QString storageErrorName(StorageError error);

} // namespace Trellis
