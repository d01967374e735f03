// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "workspacetab.h"
#include "constants.h"

namespace Trellis {

using namespace JsonKeys;

QString WorkspaceTab::terminalTabId(const QString& terminalId)
{
    return QString(IdPrefix::TerminalTab) + terminalId;
}

QString WorkspaceTab::editorTabId(const QString& filePath)
{
    return QString(IdPrefix::EditorTab) + filePath;
}

WorkspaceTab WorkspaceTab::terminal(const QString& terminalId)
{
    WorkspaceTab tab;
    tab.kind = Kind::Terminal;
    tab.id = terminalTabId(terminalId);
    tab.terminalId = terminalId;
    return tab;
}

WorkspaceTab WorkspaceTab::editor(const QString& filePath)
{
    WorkspaceTab tab;
    tab.kind = Kind::Editor;
    tab.id = editorTabId(filePath);
    tab.filePath = filePath;
    return tab;
}

QJsonObject WorkspaceTab::toReference() const
{
    QJsonObject json;
    if (isTerminal()) {
        json[Type] = JsonValues::Terminal;
        json[TerminalId] = terminalId;
    } else {
        json[Type] = JsonValues::Editor;
        json[FilePath] = filePath;
    }
    return json;
}

std::optional<WorkspaceTab> WorkspaceTab::fromReference(const QJsonObject& reference)
{
    const QString type = reference[Type].toString();

    if (type == JsonValues::Terminal) {
        const QString terminalId = reference[TerminalId].toString();
        if (terminalId.isEmpty()) {
            return std::nullopt;
        }
        return terminal(terminalId);
    }

    if (type == JsonValues::Editor) {
        const QString filePath = reference[FilePath].toString();
        if (filePath.isEmpty()) {
            return std::nullopt;
        }
        return editor(filePath);
    }

    return std::nullopt;
}

} // namespace Trellis
