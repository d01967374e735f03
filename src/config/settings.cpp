// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/logging.h"
#include <KConfigGroup>
#include <KSharedConfig>
#include <QStandardPaths>

namespace Trellis {

// ═══════════════════════════════════════════════════════════════════════════════
// Macros for setter patterns
// ═══════════════════════════════════════════════════════════════════════════════

// Simple setter: if changed, update member, emit specific signal, emit settingsChanged
#define SETTINGS_SETTER(Type, name, member, signal) \
    void Settings::set##name(Type value) \
    { \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

// Clamped int setter: clamp value, then apply if changed
#define SETTINGS_SETTER_CLAMPED(name, member, signal, minVal, maxVal) \
    void Settings::set##name(int value) \
    { \
        value = qBound(minVal, value, maxVal); \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

namespace {
const QString ConfigName = QStringLiteral("trellisrc");
const QString PersistenceGroup = QStringLiteral("Persistence");
const QString LayoutGroup = QStringLiteral("Layout");
}

Settings::Settings(QObject* parent)
    : QObject(parent)
    , m_debounceMs(ConfigDefaults::debounceMs())
    , m_storageDirectory(ConfigDefaults::storageDirectory())
    , m_minimumPaneSize(ConfigDefaults::minimumPaneSize())
{
    load();
}

Settings::~Settings() = default;

SETTINGS_SETTER_CLAMPED(DebounceMs, m_debounceMs, debounceMsChanged, ConfigDefaults::debounceMsMin(),
                        ConfigDefaults::debounceMsMax())
SETTINGS_SETTER(const QString&, StorageDirectory, m_storageDirectory, storageDirectoryChanged)
SETTINGS_SETTER_CLAMPED(MinimumPaneSize, m_minimumPaneSize, minimumPaneSizeChanged,
                        ConfigDefaults::minimumPaneSizeMin(), ConfigDefaults::minimumPaneSizeMax())

QString Settings::effectiveStorageDirectory() const
{
    if (!m_storageDirectory.isEmpty()) {
        return m_storageDirectory;
    }
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

void Settings::load()
{
    auto config = KSharedConfig::openConfig(ConfigName);

    // KSharedConfig caches in memory; pick up edits made by other processes
    config->reparseConfiguration();

    KConfigGroup persistence = config->group(PersistenceGroup);
    KConfigGroup layout = config->group(LayoutGroup);

    const int debounceMs = persistence.readEntry(QLatin1String("DebounceMs"), ConfigDefaults::debounceMs());
    m_debounceMs = qBound(ConfigDefaults::debounceMsMin(), debounceMs, ConfigDefaults::debounceMsMax());
    if (m_debounceMs != debounceMs) {
        qCWarning(lcConfig) << "DebounceMs" << debounceMs << "out of range, using" << m_debounceMs;
    }

    m_storageDirectory =
        persistence.readEntry(QLatin1String("StorageDirectory"), ConfigDefaults::storageDirectory());

    const int minimumPaneSize =
        layout.readEntry(QLatin1String("MinimumPaneSize"), ConfigDefaults::minimumPaneSize());
    m_minimumPaneSize =
        qBound(ConfigDefaults::minimumPaneSizeMin(), minimumPaneSize, ConfigDefaults::minimumPaneSizeMax());
    if (m_minimumPaneSize != minimumPaneSize) {
        qCWarning(lcConfig) << "MinimumPaneSize" << minimumPaneSize << "out of range, using" << m_minimumPaneSize;
    }

    qCDebug(lcConfig) << "Loaded DebounceMs=" << m_debounceMs << "StorageDirectory=" << m_storageDirectory
                      << "MinimumPaneSize=" << m_minimumPaneSize;

    Q_EMIT settingsChanged();
}

void Settings::save()
{
    auto config = KSharedConfig::openConfig(ConfigName);
    KConfigGroup persistence = config->group(PersistenceGroup);
    KConfigGroup layout = config->group(LayoutGroup);

    persistence.writeEntry(QLatin1String("DebounceMs"), m_debounceMs);
    persistence.writeEntry(QLatin1String("StorageDirectory"), m_storageDirectory);
    layout.writeEntry(QLatin1String("MinimumPaneSize"), m_minimumPaneSize);

    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to write" << ConfigName;
    }
}

void Settings::reset()
{
    // Drop the groups; load() falls back to the .kcfg defaults for missing keys
    auto config = KSharedConfig::openConfig(ConfigName);
    config->deleteGroup(PersistenceGroup);
    config->deleteGroup(LayoutGroup);
    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to write" << ConfigName;
    }

    const int oldDebounce = m_debounceMs;
    const QString oldDirectory = m_storageDirectory;
    const int oldMinimum = m_minimumPaneSize;

    load();

    if (oldDebounce != m_debounceMs) {
        Q_EMIT debounceMsChanged();
    }
    if (oldDirectory != m_storageDirectory) {
        Q_EMIT storageDirectoryChanged();
    }
    if (oldMinimum != m_minimumPaneSize) {
        Q_EMIT minimumPaneSizeChanged();
    }
    qCInfo(lcConfig) << "Settings reset to defaults";
}

} // namespace Trellis
