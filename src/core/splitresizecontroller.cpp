// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "splitresizecontroller.h"
#include "constants.h"
#include "logging.h"
#include "workspacestore.h"

namespace Trellis {

SplitResizeController::SplitResizeController(WorkspaceStore* store, const QString& splitId, qreal minimumSize,
                                             QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_splitId(splitId)
    , m_minimumSize(minimumSize)
{
}

SplitResizeController::~SplitResizeController()
{
    if (hasPendingSizes()) {
        qCDebug(lcStore) << "Discarding unflushed sizes of split" << m_splitId;
    }
}

void SplitResizeController::onLayout(const QVector<qreal>& sizes)
{
    m_pendingSizes = sizes;
}

void SplitResizeController::setDragging(bool dragging)
{
    if (m_dragging == dragging) {
        return;
    }
    m_dragging = dragging;
    if (!dragging) {
        flush();
    }
}

void SplitResizeController::flush()
{
    if (m_pendingSizes.isEmpty()) {
        return;
    }
    const QVector<qreal> sizes = clampToMinimum(m_pendingSizes, m_minimumSize);
    m_pendingSizes.clear();

    if (!m_store) {
        return;
    }
    const PaneNodePtr split = PaneTree::findNode(m_store->root(), m_splitId);
    if (!split || !split->isSplit()) {
        qCDebug(lcStore) << "Dropping buffered sizes: split" << m_splitId << "no longer exists";
        return;
    }
    if (m_store->updatePaneSizes(m_splitId, sizes)) {
        Q_EMIT sizesCommitted(PaneTree::findNode(m_store->root(), m_splitId)->sizes());
    }
}

QVector<qreal> SplitResizeController::clampToMinimum(const QVector<qreal>& sizes, qreal minimumSize)
{
    const int count = sizes.size();
    if (!PaneTree::sizesValid(sizes, count) || minimumSize <= 0.0 || minimumSize * count > Defaults::TotalSize) {
        return sizes;
    }

    QVector<qreal> result = PaneTree::normalizedSizes(sizes, count);
    qreal deficit = 0.0;
    qreal slack = 0.0;
    for (qreal size : result) {
        if (size < minimumSize) {
            deficit += minimumSize - size;
        } else {
            slack += size - minimumSize;
        }
    }
    if (deficit <= 0.0) {
        return result;
    }

    for (qreal& size : result) {
        if (size < minimumSize) {
            size = minimumSize;
        } else {
            size -= (size - minimumSize) * deficit / slack;
        }
    }
    return result;
}

} // namespace Trellis
