// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trellis_export.h"
#include <QObject>
#include <QString>

namespace Trellis {

/**
 * @brief User settings of the layout engine, stored in trellisrc
 *
 * Groups:
 * - [Persistence] DebounceMs, StorageDirectory
 * - [Layout] MinimumPaneSize
 *
 * Defaults come from trellis.kcfg through ConfigDefaults. Out-of-range values
 * read from disk or passed to setters are clamped.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class TRELLIS_EXPORT Settings : public QObject
{
    Q_OBJECT

    Q_PROPERTY(int debounceMs READ debounceMs WRITE setDebounceMs NOTIFY debounceMsChanged)
    Q_PROPERTY(QString storageDirectory READ storageDirectory WRITE setStorageDirectory NOTIFY
                   storageDirectoryChanged)
    Q_PROPERTY(int minimumPaneSize READ minimumPaneSize WRITE setMinimumPaneSize NOTIFY minimumPaneSizeChanged)

public:
    explicit Settings(QObject* parent = nullptr);
    ~Settings() override;

    void load();
    void save();
    void reset();

    int debounceMs() const { return m_debounceMs; }
    void setDebounceMs(int value);

    /**
     * @brief Configured storage directory; empty selects the application data location
     */
    QString storageDirectory() const { return m_storageDirectory; }
    void setStorageDirectory(const QString& directory);

    /**
     * @brief storageDirectory() with the application data location filled in
     */
    QString effectiveStorageDirectory() const;

    int minimumPaneSize() const { return m_minimumPaneSize; }
    void setMinimumPaneSize(int value);

Q_SIGNALS:
    void settingsChanged();
    void debounceMsChanged();
    void storageDirectoryChanged();
    void minimumPaneSizeChanged();

private:
    int m_debounceMs;
    QString m_storageDirectory;
    int m_minimumPaneSize;
};

} // namespace Trellis
