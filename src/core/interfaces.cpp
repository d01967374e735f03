// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interfaces.h"

namespace Trellis {

// Key functions for interface classes to anchor vtables to this translation unit
// This prevents ODR violations when interfaces are used across shared library boundaries

IWorkspaceActions::~IWorkspaceActions() = default;

IEditorFiles::~IEditorFiles() = default;

IFileExplorer::~IFileExplorer() = default;

IKeyValueStore::~IKeyValueStore() = default;

QString storageErrorName(StorageError error)
{
    switch (error) {
    case StorageError::None:
        return QStringLiteral("None");
    case StorageError::FileNotFound:
        return QStringLiteral("FileNotFound");
    case StorageError::ParseError:
        return QStringLiteral("ParseError");
    case StorageError::WriteError:
        return QStringLiteral("WriteError");
    case StorageError::DeleteError:
        return QStringLiteral("DeleteError");
    case StorageError::InvalidKey:
        return QStringLiteral("InvalidKey");
    }
    return QStringLiteral("Unknown");
}

} // namespace Trellis
