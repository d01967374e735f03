// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trellis_export.h"
#include <QJsonObject>
#include <QString>
#include <optional>

namespace Trellis {

/**
 * @brief A tab shown inside a pane: either a terminal session or an open file
 *
 * The tab id is derived from the kind and the foreign key ("term-<terminalId>",
 * "edit-<filePath>"), so the same terminal or file always maps to the same id.
 * Terminal ids point into the terminal registry and file paths into the
 * open-files registry; both registries are owned outside the layout engine.
 */
struct TRELLIS_EXPORT WorkspaceTab
{
    enum class Kind {
        Terminal,
        Editor
    };

    Kind kind = Kind::Terminal;
    QString id;
    QString terminalId; ///< Set for terminal tabs
    QString filePath;   ///< Set for editor tabs

    bool isTerminal() const
    {
        return kind == Kind::Terminal;
    }
    bool isEditor() const
    {
        return kind == Kind::Editor;
    }

    /**
     * @brief Foreign key of the tab (terminal id or file path)
     */
    QString resourceKey() const
    {
        return isTerminal() ? terminalId : filePath;
    }

    bool operator==(const WorkspaceTab&) const = default;

    static WorkspaceTab terminal(const QString& terminalId);
    static WorkspaceTab editor(const QString& filePath);

    static QString terminalTabId(const QString& terminalId);
    static QString editorTabId(const QString& filePath);

    /**
     * @brief Persisted reference form: {type, terminalId} or {type, filePath}
     *
     * The tab id is not written; it is regenerated on load.
     */
    QJsonObject toReference() const;

    /**
     * @brief Rebuild a tab from its persisted reference
     * @return The tab, or std::nullopt when the entry is malformed
     */
    static std::optional<WorkspaceTab> fromReference(const QJsonObject& reference);
};

} // namespace Trellis
