// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trellis_export.h"
#include "../core/panenode.h"
#include <QJsonObject>
#include <functional>
#include <optional>

namespace Trellis {

/**
 * @brief Pane tree ⇄ JSON conversion for the persisted editor state
 *
 * Node format:
 *   {"type":"leaf","id":"pane-…","tabs":[{"type":"terminal","terminalId":"…"},
 *                                         {"type":"editor","filePath":"…"}],
 *    "activeTabId":"…"}
 *   {"type":"split","id":"split-…","direction":"horizontal|vertical",
 *    "sizes":[50,50],"children":[…]}
 *
 * Tab ids are not stored; they are derived again from the tab references.
 *
 * Reading is tolerant. Leaves written before per-pane tabs carried an
 * "editorFilePaths" array instead; those become editor tabs in order.
 * Unknown node types and malformed tabs are skipped, missing ids regenerated,
 * an unknown direction reads as horizontal and a tab id seen earlier in the
 * tree is dropped.
 */
namespace PaneLayoutSerialization {

/**
 * @brief A tree read back from storage, ready for WorkspaceStore::replaceState()
 */
struct TRELLIS_EXPORT RestoredLayout
{
    PaneNodePtr root;
    QString activePaneId;
};

TRELLIS_EXPORT QJsonObject serializeNode(const PaneNodePtr& node);

/**
 * @brief Decode a node and its subtree
 * @return The node, or nullptr if @p json does not describe a leaf or split
 *
 * The result is not normalized.
 */
TRELLIS_EXPORT PaneNodePtr deserializeNode(const QJsonObject& json);

/**
 * @brief Write the layout fields of the persisted state into @p state
 *
 * Sets "paneLayout" and "activePaneId", leaving every other field alone.
 */
TRELLIS_EXPORT void writeLayout(QJsonObject& state, const PaneNodePtr& root, const QString& activePaneId);

/**
 * @brief Rebuild the layout stored in a persisted state object
 *
 * Decodes "paneLayout", keeps only editor tabs accepted by @p isFileAvailable
 * (all of them when it is empty), normalizes the tree and resolves the active
 * pane, falling back to the first leaf.
 *
 * @return std::nullopt if @p state holds no layout
 */
TRELLIS_EXPORT std::optional<RestoredLayout>
restoreLayout(const QJsonObject& state, const std::function<bool(const QString&)>& isFileAvailable = {});

/**
 * @brief Rewrite a persisted state in the current schema
 *
 * The layout is decoded (legacy leaves migrated) and encoded again; all other
 * fields are copied unchanged.
 * @return The migrated state, or std::nullopt if it holds no layout
 */
TRELLIS_EXPORT std::optional<QJsonObject> migrateState(const QJsonObject& state);

} // namespace PaneLayoutSerialization

} // namespace Trellis
