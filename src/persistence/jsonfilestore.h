// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trellis_export.h"
#include "../core/interfaces.h"
#include <QHash>
#include <QObject>

class QTimer;

namespace Trellis {

/**
 * @brief IKeyValueStore backed by one JSON file per key
 *
 * Key "editor-state/proj-1" is stored in <storageDirectory>/editor-state/proj-1.json.
 * Keys may only contain letters, digits, '-', '_' and '/', and never "..".
 *
 * Writes go through QSaveFile, so a crash mid-write leaves the old file intact.
 * The file being replaced is kept next to it with a ".backup" suffix.
 *
 * writeDebounced() coalesces per key: only the last value written for a key
 * within the debounce interval reaches the disk. Pending writes are flushed on
 * destruction.
 */
class TRELLIS_EXPORT JsonFileStore : public QObject, public IKeyValueStore
{
    Q_OBJECT

public:
    /**
     * @param storageDirectory Root directory, QStandardPaths::AppDataLocation when empty
     */
    explicit JsonFileStore(const QString& storageDirectory = QString(), QObject* parent = nullptr);
    ~JsonFileStore() override;

    QString storageDirectory() const { return m_storageDirectory; }

    int debounceInterval() const { return m_debounceInterval; }
    void setDebounceInterval(int milliseconds);

    static QString defaultStorageDirectory();
    static bool isValidKey(const QString& key);

    /**
     * @brief Absolute path of the file holding @p key, empty for invalid keys
     */
    QString filePath(const QString& key) const;
    static QString backupPath(const QString& filePath);

    // IKeyValueStore
    ReadResult read(const QString& key) const override;
    bool write(const QString& key, const QJsonObject& data) override;
    void writeDebounced(const QString& key, const QJsonObject& data) override;
    void flushPendingWrites() override;

    /**
     * @brief Delete the file of @p key; a key that was never written counts as removed
     */
    bool remove(const QString& key) override;

    int pendingWriteCount() const { return m_pendingWrites.size(); }

    /**
     * @brief Drop pending debounced writes without writing them
     */
    void clearPendingWrites();

    /**
     * @brief Error of the last failed write() or remove()
     */
    StorageError lastError() const { return m_lastError; }

Q_SIGNALS:
    void written(const QString& key);
    void writeFailed(const QString& key, Trellis::StorageError error);

private:
    void writePending(const QString& key);
    void releaseTimer(const QString& key);
    bool fail(const QString& key, StorageError error, const QString& detail);

    QString m_storageDirectory;
    int m_debounceInterval;
    StorageError m_lastError = StorageError::None;
    QHash<QString, QJsonObject> m_pendingWrites;
    QHash<QString, QTimer*> m_debounceTimers;
};

} // namespace Trellis
