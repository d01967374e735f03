// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dragsession.h"
#include "constants.h"
#include "interfaces.h"
#include "logging.h"
#include <QJsonDocument>
#include <QJsonParseError>
#include <QMimeData>

namespace Trellis {

using namespace JsonKeys;

// ═══════════════════════════════════════════════════════════════════════════════
// DragPayload
// ═══════════════════════════════════════════════════════════════════════════════

DragPayload DragPayload::tab(const QString& tabId, const QString& sourcePaneId)
{
    DragPayload payload;
    payload.kind = Kind::Tab;
    payload.tabId = tabId;
    payload.sourcePaneId = sourcePaneId;
    return payload;
}

DragPayload DragPayload::file(const QString& filePath)
{
    DragPayload payload;
    payload.kind = Kind::File;
    payload.filePath = filePath;
    return payload;
}

QJsonObject DragPayload::toJson() const
{
    QJsonObject json;
    if (isTab()) {
        json[Type] = JsonValues::Tab;
        json[TabId] = tabId;
        json[SourcePaneId] = sourcePaneId;
    } else {
        json[Type] = JsonValues::File;
        json[FilePath] = filePath;
    }
    return json;
}

QByteArray DragPayload::toWire() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

std::optional<DragPayload> DragPayload::fromJson(const QJsonObject& json)
{
    const QString type = json[Type].toString();

    if (type == JsonValues::Tab) {
        const QString tabId = json[TabId].toString();
        const QString sourcePaneId = json[SourcePaneId].toString();
        if (tabId.isEmpty() || sourcePaneId.isEmpty()) {
            return std::nullopt;
        }
        return tab(tabId, sourcePaneId);
    }

    if (type == JsonValues::File) {
        const QString filePath = json[FilePath].toString();
        if (filePath.isEmpty()) {
            return std::nullopt;
        }
        return file(filePath);
    }

    return std::nullopt;
}

std::optional<DragPayload> DragPayload::fromWire(const QByteArray& data)
{
    if (data.isEmpty()) {
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qCDebug(lcDrag) << "Ignoring drag data that is not a JSON object:" << parseError.errorString();
        return std::nullopt;
    }
    return fromJson(doc.object());
}

QMimeData* DragPayload::toMimeData() const
{
    auto* mimeData = new QMimeData();
    mimeData->setData(DragAndDrop::MimeType, toWire());
    return mimeData;
}

std::optional<DragPayload> DragPayload::fromMimeData(const QMimeData* mimeData)
{
    if (!mimeData || !mimeData->hasFormat(DragAndDrop::MimeType)) {
        return std::nullopt;
    }
    return fromWire(mimeData->data(DragAndDrop::MimeType));
}

// ═══════════════════════════════════════════════════════════════════════════════
// DragSession
// ═══════════════════════════════════════════════════════════════════════════════

DragSession::DragSession(IWorkspaceActions* actions, IEditorFiles* editorFiles, QObject* parent)
    : QObject(parent)
    , m_actions(actions)
    , m_editorFiles(editorFiles)
{
}

DragSession::~DragSession() = default;

QByteArray DragSession::startTabDrag(const QString& tabId, const QString& sourcePaneId)
{
    const DragPayload payload = DragPayload::tab(tabId, sourcePaneId);
    start(payload);
    return payload.toWire();
}

QByteArray DragSession::startFileDrag(const QString& filePath)
{
    const DragPayload payload = DragPayload::file(filePath);
    start(payload);
    return payload.toWire();
}

void DragSession::start(const DragPayload& payload)
{
    const bool wasDragging = isDragging();
    const bool hadPreview = m_preview.has_value();

    m_payload = payload;
    m_preview.reset();
    qCDebug(lcDrag) << "Drag started:" << payload.toJson();

    if (!wasDragging) {
        Q_EMIT stateChanged(State::Dragging);
    }
    if (hadPreview) {
        Q_EMIT previewTargetChanged();
    }
}

void DragSession::setPreviewTarget(const QString& paneId, DropPosition position)
{
    const DropPreview preview{paneId, position};
    if (m_preview == preview) {
        return;
    }
    m_preview = preview;
    Q_EMIT previewTargetChanged();
}

void DragSession::clearPreviewTarget(const QString& paneId)
{
    if (!m_preview || m_preview->paneId != paneId) {
        return;
    }
    m_preview.reset();
    Q_EMIT previewTargetChanged();
}

bool DragSession::handleDrop(const QString& paneId, DropPosition position, const QByteArray& wireData)
{
    std::optional<DragPayload> payload = m_payload;
    if (!payload) {
        payload = DragPayload::fromWire(wireData);
    }

    bool dispatched = false;
    if (payload) {
        dispatched = dispatch(*payload, paneId, position);
    } else {
        qCDebug(lcDrag) << "Drop on" << paneId << "ignored: no usable payload";
    }

    clearPreviewTarget(paneId);
    finish();
    return dispatched;
}

bool DragSession::dispatch(const DragPayload& payload, const QString& paneId, DropPosition position)
{
    if (!m_actions) {
        qCWarning(lcDrag) << "Drop ignored: no workspace actions attached";
        return false;
    }

    const bool center = position == DropPosition::Center;
    qCDebug(lcDrag) << "Drop" << payload.toJson() << "on" << paneId << DropPositions::toString(position);

    if (payload.isTab()) {
        if (center) {
            return m_actions->moveTabToPane(payload.tabId, payload.sourcePaneId, paneId);
        }
        return m_actions->moveTabToNewSplit(payload.tabId, payload.sourcePaneId, paneId, position);
    }

    if (!m_editorFiles || !m_editorFiles->openFile(payload.filePath)) {
        qCDebug(lcDrag) << "Drop ignored: could not open" << payload.filePath;
        return false;
    }

    const WorkspaceTab tab = WorkspaceTab::editor(payload.filePath);
    if (center) {
        return m_actions->addTabToPane(paneId, tab);
    }
    return m_actions->splitPane(paneId, DropPositions::axisOf(position), tab, position);
}

void DragSession::endDrag()
{
    if (m_preview) {
        m_preview.reset();
        Q_EMIT previewTargetChanged();
    }
    finish();
}

void DragSession::finish()
{
    if (!m_payload) {
        return;
    }
    m_payload.reset();
    qCDebug(lcDrag) << "Drag finished";
    Q_EMIT stateChanged(State::Idle);
}

} // namespace Trellis
