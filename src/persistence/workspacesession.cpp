// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "workspacesession.h"
#include "jsonfilestore.h"
#include "workspacepersistence.h"
#include "../config/configdefaults.h"
#include "../config/settings.h"
#include "../core/dragsession.h"
#include "../core/dropzoneoverlay.h"
#include "../core/logging.h"
#include "../core/splitresizecontroller.h"
#include "../core/workspacestore.h"

namespace Trellis {

WorkspaceSession::WorkspaceSession(Settings* settings, IEditorFiles* editorFiles, IFileExplorer* fileExplorer,
                                   QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_store(new WorkspaceStore(this))
    , m_dragSession(new DragSession(m_store, editorFiles, this))
    , m_storage(new JsonFileStore(settings ? settings->effectiveStorageDirectory() : QString(), this))
    , m_persistence(new WorkspacePersistence(m_store, m_storage, editorFiles, fileExplorer, this))
{
    if (m_settings) {
        m_storage->setDebounceInterval(m_settings->debounceMs());
        connect(m_settings, &Settings::debounceMsChanged, this, [this]() {
            m_storage->setDebounceInterval(m_settings->debounceMs());
        });
    }
    qCDebug(lcCore) << "Workspace session storing in" << m_storage->storageDirectory();
}

WorkspaceSession::~WorkspaceSession()
{
    // Children are destroyed after this body; save before the store goes away
    if (!m_persistence->projectId().isEmpty() && !m_persistence->persistNow()) {
        qCWarning(lcCore) << "Could not save project" << m_persistence->projectId() << "on shutdown";
    }
}

DropZoneOverlay* WorkspaceSession::createDropZoneOverlay(const QString& paneId, QObject* parent)
{
    return new DropZoneOverlay(paneId, m_dragSession, parent ? parent : this);
}

SplitResizeController* WorkspaceSession::createResizeController(const QString& splitId, QObject* parent)
{
    const int minimumSize = m_settings ? m_settings->minimumPaneSize() : ConfigDefaults::minimumPaneSize();
    return new SplitResizeController(m_store, splitId, minimumSize, parent ? parent : this);
}

} // namespace Trellis
