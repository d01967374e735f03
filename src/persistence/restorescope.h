// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "workspacepersistence.h"

namespace Trellis {

/**
 * @brief RAII guard suppressing persistence writes while state is restored
 *
 * Scopes nest: writes resume only when the outermost scope ends.
 *
 * Usage:
 * @code
 * {
 *     RestoreScope scope(m_persistence);
 *     store->clearEditorTabs();
 *     store->replaceState(root, activePaneId);
 * } // writes resume here
 * @endcode
 */
class RestoreScope
{
public:
    /**
     * @param persistence Persistence to suppress (can be null)
     */
    explicit RestoreScope(WorkspacePersistence* persistence)
        : m_persistence(persistence)
    {
        if (m_persistence) {
            m_persistence->beginRestore();
        }
    }

    ~RestoreScope()
    {
        if (m_persistence) {
            m_persistence->endRestore();
        }
    }

    // Non-copyable, non-movable
    RestoreScope(const RestoreScope&) = delete;
    RestoreScope& operator=(const RestoreScope&) = delete;
    RestoreScope(RestoreScope&&) = delete;
    RestoreScope& operator=(RestoreScope&&) = delete;

private:
    WorkspacePersistence* m_persistence;
};

} // namespace Trellis
