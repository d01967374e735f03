// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trellis_export.h"
#include "types.h"
#include <QObject>
#include <QPointF>
#include <QPointer>
#include <QRectF>
#include <optional>

namespace Trellis {

class DragSession;

/**
 * @brief Five-zone drop target covering one pane
 *
 * The hosting widget shows the overlay while a drag is in flight and forwards
 * native drag events per zone. Zone geometry uses fixed proportions of the
 * pane rectangle:
 *
 *   +------+-------------+------+
 *   |      |     top     |      |   top/bottom: middle half of the width,
 *   |      +-------------+      |               a quarter of the height
 *   | left |   center    | right|
 *   |      +-------------+      |   left/right: a quarter of the width,
 *   |      |   bottom    |      |               full height
 *   +------+-------------+------+
 *
 * The five zones partition the pane. Highlight state is not stored here: the
 * overlay reads it from the shared DragSession by comparing pane ids.
 */
class TRELLIS_EXPORT DropZoneOverlay : public QObject
{
    Q_OBJECT

public:
    DropZoneOverlay(const QString& paneId, DragSession* session, QObject* parent = nullptr);
    ~DropZoneOverlay() override;

    QString paneId() const { return m_paneId; }

    /**
     * @brief true while a drag is in flight and the overlay should be shown
     */
    bool isActive() const;

    /**
     * @brief Zone of this pane currently previewed, if any
     */
    std::optional<DropPosition> hoveredZone() const;

    // ═══════════════════════════════════════════════════════════════════════════
    // Native drag event entry points
    // ═══════════════════════════════════════════════════════════════════════════

    void zoneDragEnter(DropPosition zone);

    /**
     * @brief The pointer left a zone
     * @param enteringSiblingZone true if it moved into another zone of this
     *        same overlay, in which case the preview is left to the next enter
     */
    void overlayDragLeave(bool enteringSiblingZone);

    /**
     * @brief Accept the drag over a zone
     */
    Qt::DropAction zoneDragOver(DropPosition zone) const;

    /**
     * @brief Drop on a zone
     * @return true if the session dispatched a layout mutation
     */
    bool zoneDrop(DropPosition zone, const QByteArray& wireData = QByteArray());

    // ═══════════════════════════════════════════════════════════════════════════
    // Geometry
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Rectangle of @p zone inside a pane occupying @p bounds
     */
    static QRectF zoneRect(DropPosition zone, const QRectF& bounds);

    /**
     * @brief Zone under @p point, or std::nullopt when outside @p bounds
     */
    static std::optional<DropPosition> zoneAt(const QPointF& point, const QRectF& bounds);

Q_SIGNALS:
    void hoveredZoneChanged();
    void activeChanged();

private:
    QString m_paneId;
    QPointer<DragSession> m_session;
    std::optional<DropPosition> m_lastHovered;
};

} // namespace Trellis
