// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace Trellis {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "trellis.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPaneTree, "trellis.core.panetree", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStore, "trellis.core.store", QtInfoMsg)
Q_LOGGING_CATEGORY(lcDrag, "trellis.core.drag", QtInfoMsg)

// Persistence module categories
Q_LOGGING_CATEGORY(lcPersistence, "trellis.persistence", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "trellis.config", QtInfoMsg)

// Tool categories
Q_LOGGING_CATEGORY(lcTool, "trellis.tool", QtInfoMsg)

} // namespace Trellis
