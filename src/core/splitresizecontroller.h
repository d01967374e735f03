// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trellis_export.h"
#include <QObject>
#include <QPointer>
#include <QVector>

namespace Trellis {

class WorkspaceStore;

/**
 * @brief Buffers the sizes of one split while its divider is being dragged
 *
 * The resizable-panel widget reports sizes on every layout pass during a
 * divider drag. Committing each of them would trigger a store notification and
 * a persistence write per frame, so they are held here and written once when
 * the gesture ends.
 *
 * Destroying the controller mid-drag (the split was unmounted) discards the
 * buffer without writing it. A buffer whose split disappeared before the
 * gesture ended is dropped at flush.
 */
class TRELLIS_EXPORT SplitResizeController : public QObject
{
    Q_OBJECT

public:
    /**
     * @param store Store receiving the final sizes
     * @param splitId Split whose sizes are being edited
     * @param minimumSize Smallest size (percent) a child may be given
     */
    SplitResizeController(WorkspaceStore* store, const QString& splitId, qreal minimumSize,
                          QObject* parent = nullptr);
    ~SplitResizeController() override;

    QString splitId() const { return m_splitId; }
    qreal minimumSize() const { return m_minimumSize; }
    bool isDragging() const { return m_dragging; }
    bool hasPendingSizes() const { return !m_pendingSizes.isEmpty(); }
    QVector<qreal> pendingSizes() const { return m_pendingSizes; }

    /**
     * @brief Sizes reported by a layout pass; buffered, never committed directly
     */
    void onLayout(const QVector<qreal>& sizes);

    /**
     * @brief Divider drag started or ended; ending flushes the buffer
     */
    void setDragging(bool dragging);

    /**
     * @brief Raise sizes below @p minimumSize, taking the difference from the others
     *
     * Sizes are first rescaled to sum to 100. Children above the minimum give up
     * space in proportion to how far above it they are. Left untouched when the
     * minimum cannot be met for every child.
     */
    static QVector<qreal> clampToMinimum(const QVector<qreal>& sizes, qreal minimumSize);

Q_SIGNALS:
    void sizesCommitted(const QVector<qreal>& sizes);

private:
    void flush();

    QPointer<WorkspaceStore> m_store;
    QString m_splitId;
    qreal m_minimumSize;
    bool m_dragging = false;
    QVector<qreal> m_pendingSizes;
};

} // namespace Trellis
