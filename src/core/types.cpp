// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "types.h"
#include "constants.h"

namespace Trellis {

namespace DropPositions {

SplitDirection axisOf(DropPosition position)
{
    switch (position) {
    case DropPosition::Top:
    case DropPosition::Bottom:
        return SplitDirection::Vertical;
    case DropPosition::Left:
    case DropPosition::Right:
    case DropPosition::Center:
        break;
    }
    return SplitDirection::Horizontal;
}

bool isLeadingEdge(DropPosition position)
{
    return position == DropPosition::Left || position == DropPosition::Top;
}

bool isEdge(DropPosition position)
{
    return position != DropPosition::Center;
}

QString toString(DropPosition position)
{
    switch (position) {
    case DropPosition::Left:
        return QStringLiteral("left");
    case DropPosition::Right:
        return QStringLiteral("right");
    case DropPosition::Top:
        return QStringLiteral("top");
    case DropPosition::Bottom:
        return QStringLiteral("bottom");
    case DropPosition::Center:
        break;
    }
    return QStringLiteral("center");
}

std::optional<DropPosition> fromString(const QString& name)
{
    if (name == QLatin1String("left")) {
        return DropPosition::Left;
    }
    if (name == QLatin1String("right")) {
        return DropPosition::Right;
    }
    if (name == QLatin1String("top")) {
        return DropPosition::Top;
    }
    if (name == QLatin1String("bottom")) {
        return DropPosition::Bottom;
    }
    if (name == QLatin1String("center")) {
        return DropPosition::Center;
    }
    return std::nullopt;
}

} // namespace DropPositions

namespace SplitDirections {

QString toString(SplitDirection direction)
{
    return direction == SplitDirection::Vertical ? QString(JsonValues::Vertical) : QString(JsonValues::Horizontal);
}

std::optional<SplitDirection> fromString(const QString& name)
{
    if (name == JsonValues::Horizontal) {
        return SplitDirection::Horizontal;
    }
    if (name == JsonValues::Vertical) {
        return SplitDirection::Vertical;
    }
    return std::nullopt;
}

} // namespace SplitDirections

} // namespace Trellis
