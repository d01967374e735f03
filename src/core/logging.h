// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trellis_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for Trellis
 *
 * Use these categories instead of plain qDebug/qWarning:
 *   qCDebug(lcPaneTree) << "Split rejected for" << paneId;
 *   qCWarning(lcPersistence) << "Invalid JSON in" << key;
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="trellis.*=true"                  # Enable all
 *   QT_LOGGING_RULES="trellis.*.debug=false"           # Disable debug only
 *   QT_LOGGING_RULES="trellis.core.drag.debug=true"    # Drag session tracing only
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing (rejected no-op mutations, drag transitions)
 *   qCInfo     - Significant operational events (project switch, layout restored)
 *   qCWarning  - Recoverable errors, invalid input, unreadable persisted state
 *   qCCritical - Failures preventing normal operation
 */

namespace Trellis {

// Core module - pane tree, store, drag and drop
TRELLIS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
TRELLIS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcPaneTree)
TRELLIS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcStore)
TRELLIS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDrag)

// Persistence module - codec, key-value storage, project switching
TRELLIS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcPersistence)

// Configuration module - settings loading/saving
TRELLIS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

// Command line tool
TRELLIS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcTool)

} // namespace Trellis
