// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trellis_export.h"
#include <QObject>
#include <QPointer>

namespace Trellis {

class DragSession;
class DropZoneOverlay;
class IEditorFiles;
class IFileExplorer;
class JsonFileStore;
class Settings;
class SplitResizeController;
class WorkspacePersistence;
class WorkspaceStore;

/**
 * @brief Layout engine objects of one window, wired together
 *
 * Owns the store, the drag session, the JSON storage and the project
 * persistence, configured from Settings. The editor and file explorer are
 * provided by the host and must outlive the session.
 *
 * Settings changes apply live: the debounce delay to pending and future
 * writes, the minimum pane size to resize controllers created afterwards.
 * The storage directory is read once at construction.
 */
class TRELLIS_EXPORT WorkspaceSession : public QObject
{
    Q_OBJECT

public:
    WorkspaceSession(Settings* settings, IEditorFiles* editorFiles, IFileExplorer* fileExplorer,
                     QObject* parent = nullptr);
    ~WorkspaceSession() override;

    WorkspaceStore* store() const { return m_store; }
    DragSession* dragSession() const { return m_dragSession; }
    JsonFileStore* storage() const { return m_storage; }
    WorkspacePersistence* persistence() const { return m_persistence; }

    /**
     * @brief Drop zone overlay for a pane, sharing this window's drag session
     *
     * The overlay is parented to @p parent, or to the session when null.
     */
    DropZoneOverlay* createDropZoneOverlay(const QString& paneId, QObject* parent = nullptr);

    /**
     * @brief Resize controller for a split, using the configured minimum pane size
     */
    SplitResizeController* createResizeController(const QString& splitId, QObject* parent = nullptr);

private:
    QPointer<Settings> m_settings;
    WorkspaceStore* m_store;
    DragSession* m_dragSession;
    JsonFileStore* m_storage;
    WorkspacePersistence* m_persistence;
};

} // namespace Trellis
