// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>

namespace Trellis {

/**
 * @brief Structural constants of the pane layout engine
 *
 * User-configurable values (debounce delay, minimum pane size) live in
 * trellis.kcfg and are exposed through ConfigDefaults/Settings.
 */
namespace Defaults {
// Split sizes are percentages of the parent's extent
constexpr qreal TotalSize = 100.0;
constexpr qreal SizeTolerance = 0.001;

// Drop zone proportions: edge strips take a quarter of the pane,
// top/bottom strips span the middle half of the width
constexpr qreal EdgeZoneFraction = 0.25;

// Persistence write coalescing
constexpr int PersistDebounceMs = 500;
}

/**
 * @brief Prefixes used to derive stable identifiers
 */
namespace IdPrefix {
inline constexpr QLatin1String TerminalTab{"term-"};
inline constexpr QLatin1String EditorTab{"edit-"};
inline constexpr QLatin1String Leaf{"pane-"};
inline constexpr QLatin1String Split{"split-"};
}

/**
 * @brief JSON keys for serialization
 */
namespace JsonKeys {
// Node keys
inline constexpr QLatin1String Type{"type"};
inline constexpr QLatin1String Id{"id"};
inline constexpr QLatin1String Tabs{"tabs"};
inline constexpr QLatin1String ActiveTabId{"activeTabId"};
inline constexpr QLatin1String Direction{"direction"};
inline constexpr QLatin1String Children{"children"};
inline constexpr QLatin1String Sizes{"sizes"};
inline constexpr QLatin1String EditorFilePaths{"editorFilePaths"}; // Legacy, leaves before per-pane tabs

// Tab keys
inline constexpr QLatin1String TerminalId{"terminalId"};
inline constexpr QLatin1String FilePath{"filePath"};

// Drag payload keys
inline constexpr QLatin1String TabId{"tabId"};
inline constexpr QLatin1String SourcePaneId{"sourcePaneId"};

// Persisted editor state keys
inline constexpr QLatin1String PaneLayout{"paneLayout"};
inline constexpr QLatin1String ActivePaneId{"activePaneId"};
inline constexpr QLatin1String OpenFiles{"openFiles"};
inline constexpr QLatin1String ActiveFilePath{"activeFilePath"};
inline constexpr QLatin1String ExpandedDirs{"expandedDirs"};
inline constexpr QLatin1String FileExplorerVisible{"fileExplorerVisible"};
}

/**
 * @brief JSON values for discriminated fields
 */
namespace JsonValues {
inline constexpr QLatin1String Leaf{"leaf"};
inline constexpr QLatin1String Split{"split"};
inline constexpr QLatin1String Terminal{"terminal"};
inline constexpr QLatin1String Editor{"editor"};
inline constexpr QLatin1String Tab{"tab"};
inline constexpr QLatin1String File{"file"};
inline constexpr QLatin1String Horizontal{"horizontal"};
inline constexpr QLatin1String Vertical{"vertical"};
}

/**
 * @brief Key-value storage constants
 */
namespace Storage {
inline constexpr QLatin1String EditorStatePrefix{"editor-state/"};
inline constexpr QLatin1String FileSuffix{".json"};
inline constexpr QLatin1String BackupSuffix{".backup"};
}

/**
 * @brief Drag-and-drop constants
 */
namespace DragAndDrop {
inline constexpr QLatin1String MimeType{"application/json"};
}

} // namespace Trellis
