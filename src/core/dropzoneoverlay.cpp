// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dropzoneoverlay.h"
#include "constants.h"
#include "dragsession.h"
#include "logging.h"

namespace Trellis {

DropZoneOverlay::DropZoneOverlay(const QString& paneId, DragSession* session, QObject* parent)
    : QObject(parent)
    , m_paneId(paneId)
    , m_session(session)
{
    if (!m_session) {
        qCWarning(lcDrag) << "Drop zone overlay for" << paneId << "created without a drag session";
        return;
    }

    connect(session, &DragSession::stateChanged, this, &DropZoneOverlay::activeChanged);
    // Only re-emit when this pane's highlight actually changed
    connect(session, &DragSession::previewTargetChanged, this, [this]() {
        const std::optional<DropPosition> hovered = hoveredZone();
        if (hovered != m_lastHovered) {
            m_lastHovered = hovered;
            Q_EMIT hoveredZoneChanged();
        }
    });
}

DropZoneOverlay::~DropZoneOverlay() = default;

bool DropZoneOverlay::isActive() const
{
    return m_session && m_session->isDragging();
}

std::optional<DropPosition> DropZoneOverlay::hoveredZone() const
{
    if (!m_session) {
        return std::nullopt;
    }
    const std::optional<DropPreview> preview = m_session->previewTarget();
    if (!preview || preview->paneId != m_paneId) {
        return std::nullopt;
    }
    return preview->position;
}

void DropZoneOverlay::zoneDragEnter(DropPosition zone)
{
    if (m_session) {
        m_session->setPreviewTarget(m_paneId, zone);
    }
}

void DropZoneOverlay::overlayDragLeave(bool enteringSiblingZone)
{
    if (enteringSiblingZone || !m_session) {
        return;
    }
    m_session->clearPreviewTarget(m_paneId);
}

Qt::DropAction DropZoneOverlay::zoneDragOver(DropPosition zone) const
{
    Q_UNUSED(zone)
    return Qt::MoveAction;
}

bool DropZoneOverlay::zoneDrop(DropPosition zone, const QByteArray& wireData)
{
    if (!m_session) {
        return false;
    }
    return m_session->handleDrop(m_paneId, zone, wireData);
}

QRectF DropZoneOverlay::zoneRect(DropPosition zone, const QRectF& bounds)
{
    const qreal edgeW = bounds.width() * Defaults::EdgeZoneFraction;
    const qreal edgeH = bounds.height() * Defaults::EdgeZoneFraction;
    const qreal middleW = bounds.width() - 2 * edgeW;
    const qreal middleH = bounds.height() - 2 * edgeH;

    switch (zone) {
    case DropPosition::Left:
        return QRectF(bounds.left(), bounds.top(), edgeW, bounds.height());
    case DropPosition::Right:
        return QRectF(bounds.right() - edgeW, bounds.top(), edgeW, bounds.height());
    case DropPosition::Top:
        return QRectF(bounds.left() + edgeW, bounds.top(), middleW, edgeH);
    case DropPosition::Bottom:
        return QRectF(bounds.left() + edgeW, bounds.bottom() - edgeH, middleW, edgeH);
    case DropPosition::Center:
        break;
    }
    return QRectF(bounds.left() + edgeW, bounds.top() + edgeH, middleW, middleH);
}

std::optional<DropPosition> DropZoneOverlay::zoneAt(const QPointF& point, const QRectF& bounds)
{
    if (bounds.width() <= 0 || bounds.height() <= 0) {
        return std::nullopt;
    }

    const qreal fx = (point.x() - bounds.left()) / bounds.width();
    const qreal fy = (point.y() - bounds.top()) / bounds.height();
    if (fx < 0.0 || fx > 1.0 || fy < 0.0 || fy > 1.0) {
        return std::nullopt;
    }

    const qreal lead = Defaults::EdgeZoneFraction;
    const qreal trail = 1.0 - Defaults::EdgeZoneFraction;

    if (fx < lead) {
        return DropPosition::Left;
    }
    if (fx >= trail) {
        return DropPosition::Right;
    }
    if (fy < lead) {
        return DropPosition::Top;
    }
    if (fy >= trail) {
        return DropPosition::Bottom;
    }
    return DropPosition::Center;
}

} // namespace Trellis
