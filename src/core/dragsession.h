// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trellis_export.h"
#include "types.h"
#include <QByteArray>
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <optional>

class QMimeData;

namespace Trellis {

class IEditorFiles;
class IWorkspaceActions;

/**
 * @brief What is being dragged: a tab out of a pane, or a file from the explorer
 *
 * Wire format (mime type application/json):
 *   {"type":"tab","tabId":"...","sourcePaneId":"..."}
 *   {"type":"file","filePath":"..."}
 */
struct TRELLIS_EXPORT DragPayload
{
    enum class Kind {
        Tab,
        File
    };

    Kind kind = Kind::Tab;
    QString tabId;        ///< Tab payloads
    QString sourcePaneId; ///< Tab payloads
    QString filePath;     ///< File payloads

    bool isTab() const { return kind == Kind::Tab; }
    bool isFile() const { return kind == Kind::File; }

    bool operator==(const DragPayload&) const = default;

    static DragPayload tab(const QString& tabId, const QString& sourcePaneId);
    static DragPayload file(const QString& filePath);

    QJsonObject toJson() const;
    QByteArray toWire() const;

    /**
     * @brief Validate and decode a payload
     * @return std::nullopt for anything but a well-formed tab or file payload
     */
    static std::optional<DragPayload> fromJson(const QJsonObject& json);
    static std::optional<DragPayload> fromWire(const QByteArray& data);

    /**
     * @brief Package the payload for QDrag under DragAndDrop::MimeType
     *
     * The caller owns the returned object (QDrag::setMimeData takes it over).
     */
    QMimeData* toMimeData() const;
    static std::optional<DragPayload> fromMimeData(const QMimeData* mimeData);
};

/**
 * @brief Pane and zone currently highlighted as the drop target
 */
struct TRELLIS_EXPORT DropPreview
{
    QString paneId;
    DropPosition position = DropPosition::Center;

    bool operator==(const DropPreview&) const = default;
};

/**
 * @brief Single-flight drag-and-drop state for one window
 *
 * States:
 * - Idle: no drag in progress
 * - Dragging: a payload is in flight, optionally with a preview target
 *
 * Each pane's DropZoneOverlay reports zone enter/leave/drop here and compares
 * its own pane id against previewTarget() to decide what to highlight. The
 * session is injected into the overlays; there is one per window.
 *
 * Drops are dispatched to the IWorkspaceActions exactly once:
 * - tab on center:  moveTabToPane
 * - tab on edge:    moveTabToNewSplit
 * - file on center: open the file, then addTabToPane
 * - file on edge:   open the file, then splitPane
 */
class TRELLIS_EXPORT DragSession : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Dragging
    };
    Q_ENUM(State)

    DragSession(IWorkspaceActions* actions, IEditorFiles* editorFiles, QObject* parent = nullptr);
    ~DragSession() override;

    // State queries
    State state() const { return m_payload ? State::Dragging : State::Idle; }
    bool isDragging() const { return m_payload.has_value(); }
    std::optional<DragPayload> payload() const { return m_payload; }
    std::optional<DropPreview> previewTarget() const { return m_preview; }

    /**
     * @brief A tab header was grabbed
     * @return Wire data to place on the native drag channel
     */
    QByteArray startTabDrag(const QString& tabId, const QString& sourcePaneId);

    /**
     * @brief A file drag entered the workspace
     * @return Wire data to place on the native drag channel
     */
    QByteArray startFileDrag(const QString& filePath);

    /**
     * @brief Pointer entered zone @p position of pane @p paneId
     */
    void setPreviewTarget(const QString& paneId, DropPosition position);

    /**
     * @brief Pointer left the overlay of @p paneId; other panes' previews are kept
     */
    void clearPreviewTarget(const QString& paneId);

    /**
     * @brief Drop on zone @p position of pane @p paneId
     *
     * Uses the in-flight payload if there is one, otherwise decodes
     * @p wireData (drags that started outside this window). Afterwards the
     * preview of @p paneId is cleared and the session returns to Idle.
     *
     * @return true if a mutation was dispatched
     */
    bool handleDrop(const QString& paneId, DropPosition position, const QByteArray& wireData = QByteArray());

    /**
     * @brief The native drag ended (dropped elsewhere or cancelled)
     */
    void endDrag();

Q_SIGNALS:
    void stateChanged(Trellis::DragSession::State state);
    void previewTargetChanged();

private:
    void start(const DragPayload& payload);
    void finish();
    bool dispatch(const DragPayload& payload, const QString& paneId, DropPosition position);

    IWorkspaceActions* m_actions;
    IEditorFiles* m_editorFiles;
    std::optional<DragPayload> m_payload;
    std::optional<DropPreview> m_preview;
};

} // namespace Trellis
