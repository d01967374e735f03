// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trellisconfig.h" // Generated from trellis.kcfg via KConfigXT

#include <QString>

namespace Trellis {

/**
 * @brief Provides static access to default configuration values
 *
 * This class wraps the KConfigXT-generated TrellisConfig class. The .kcfg file
 * is the single source of truth for all defaults; this class only exposes the
 * generated defaults and the bounds Settings clamps to.
 *
 * Usage:
 *   int delay = ConfigDefaults::debounceMs();       // 500 (from .kcfg)
 *   int minimum = ConfigDefaults::minimumPaneSize(); // 10 (from .kcfg)
 */
class ConfigDefaults
{
public:
    // ═══════════════════════════════════════════════════════════════════════════
    // Persistence
    // ═══════════════════════════════════════════════════════════════════════════

    static int debounceMs() { return instance().defaultDebounceMsValue(); }
    static int debounceMsMin() { return 0; }
    static int debounceMsMax() { return 10000; }
    static QString storageDirectory() { return instance().defaultStorageDirectoryValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Layout
    // ═══════════════════════════════════════════════════════════════════════════

    static int minimumPaneSize() { return instance().defaultMinimumPaneSizeValue(); }
    static int minimumPaneSizeMin() { return 1; }
    static int minimumPaneSizeMax() { return 45; }

private:
    // Lazily-initialized singleton instance
    static TrellisConfig& instance()
    {
        static TrellisConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace Trellis
