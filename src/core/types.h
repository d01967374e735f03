// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trellis_export.h"
#include <QString>
#include <optional>

namespace Trellis {

// ═══════════════════════════════════════════════════════════════════════════════
// Shared Types - enums used across the pane tree, drag session and codec
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Axis along which a split lays out its children
 *
 * Horizontal: children side by side (left to right)
 * Vertical: children stacked (top to bottom)
 */
enum class SplitDirection {
    Horizontal = 0,
    Vertical = 1
};

/**
 * @brief One of the five drop zones of a pane
 */
enum class DropPosition {
    Left = 0,
    Right = 1,
    Top = 2,
    Bottom = 3,
    Center = 4
};

namespace DropPositions {

/**
 * @brief Axis implied by an edge position (left/right horizontal, top/bottom vertical)
 *
 * Center has no axis; callers must not split on it. Returns Horizontal for Center.
 */
TRELLIS_EXPORT SplitDirection axisOf(DropPosition position);

/**
 * @brief true if the new pane goes before the target (left/top)
 */
TRELLIS_EXPORT bool isLeadingEdge(DropPosition position);

TRELLIS_EXPORT bool isEdge(DropPosition position);

TRELLIS_EXPORT QString toString(DropPosition position);
TRELLIS_EXPORT std::optional<DropPosition> fromString(const QString& name);

} // namespace DropPositions

namespace SplitDirections {
TRELLIS_EXPORT QString toString(SplitDirection direction);
TRELLIS_EXPORT std::optional<SplitDirection> fromString(const QString& name);
} // namespace SplitDirections

} // namespace Trellis
