// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "jsonfilestore.h"
#include "../core/constants.h"
#include "../core/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QRegularExpression>
#include <QSaveFile>
#include <QStandardPaths>
#include <QTimer>

namespace Trellis {

JsonFileStore::JsonFileStore(const QString& storageDirectory, QObject* parent)
    : QObject(parent)
    , m_storageDirectory(storageDirectory.isEmpty() ? defaultStorageDirectory() : storageDirectory)
    , m_debounceInterval(Defaults::PersistDebounceMs)
{
}

JsonFileStore::~JsonFileStore()
{
    flushPendingWrites();
}

void JsonFileStore::setDebounceInterval(int milliseconds)
{
    m_debounceInterval = qMax(0, milliseconds);
    for (QTimer* timer : std::as_const(m_debounceTimers)) {
        timer->setInterval(m_debounceInterval);
    }
}

QString JsonFileStore::defaultStorageDirectory()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

bool JsonFileStore::isValidKey(const QString& key)
{
    static const QRegularExpression allowed(QStringLiteral("^[A-Za-z0-9/_-]+$"));
    if (key.isEmpty() || key.contains(QLatin1String(".."))) {
        return false;
    }
    return allowed.match(key).hasMatch();
}

QString JsonFileStore::filePath(const QString& key) const
{
    if (!isValidKey(key)) {
        return QString();
    }
    return QDir(m_storageDirectory).filePath(key + QString(Storage::FileSuffix));
}

QString JsonFileStore::backupPath(const QString& filePath)
{
    return filePath + QString(Storage::BackupSuffix);
}

bool JsonFileStore::fail(const QString& key, StorageError error, const QString& detail)
{
    m_lastError = error;
    qCWarning(lcPersistence) << "Storage error" << storageErrorName(error) << "for key" << key << ":" << detail;
    Q_EMIT writeFailed(key, error);
    return false;
}

// ═══════════════════════════════════════════════════════════════════════════════
// IKeyValueStore
// ═══════════════════════════════════════════════════════════════════════════════

ReadResult JsonFileStore::read(const QString& key) const
{
    ReadResult result;

    const QString path = filePath(key);
    if (path.isEmpty()) {
        result.error = StorageError::InvalidKey;
        result.errorString = QStringLiteral("Invalid storage key: %1").arg(key);
        return result;
    }

    QFile file(path);
    if (!file.exists()) {
        result.error = StorageError::FileNotFound;
        result.errorString = QStringLiteral("File not found: %1").arg(key);
        return result;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        result.error = StorageError::ParseError;
        result.errorString = file.errorString();
        qCWarning(lcPersistence) << "Failed to open" << path << "Error:" << file.errorString();
        return result;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        result.error = StorageError::ParseError;
        result.errorString = QStringLiteral("Invalid JSON in %1: %2").arg(key, parseError.errorString());
        qCWarning(lcPersistence) << "Failed to parse" << path << "Error:" << parseError.errorString() << "at offset"
                                 << parseError.offset;
        return result;
    }

    result.success = true;
    result.data = doc.object();
    return result;
}

bool JsonFileStore::write(const QString& key, const QJsonObject& data)
{
    const QString path = filePath(key);
    if (path.isEmpty()) {
        return fail(key, StorageError::InvalidKey, QStringLiteral("invalid key"));
    }

    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return fail(key, StorageError::WriteError, QStringLiteral("cannot create directory for %1").arg(path));
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return fail(key, StorageError::WriteError, file.errorString());
    }

    const QByteArray bytes = QJsonDocument(data).toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size()) {
        file.cancelWriting();
        return fail(key, StorageError::WriteError, file.errorString());
    }

    // Keep the version being replaced; a failed backup does not block the write
    if (QFile::exists(path)) {
        const QString backup = backupPath(path);
        if (QFile::exists(backup) && !QFile::remove(backup)) {
            qCWarning(lcPersistence) << "Could not remove old backup" << backup;
        } else if (!QFile::copy(path, backup)) {
            qCWarning(lcPersistence) << "Could not back up" << path;
        }
    }

    if (!file.commit()) {
        return fail(key, StorageError::WriteError, file.errorString());
    }

    m_lastError = StorageError::None;
    Q_EMIT written(key);
    return true;
}

void JsonFileStore::writeDebounced(const QString& key, const QJsonObject& data)
{
    if (!isValidKey(key)) {
        fail(key, StorageError::InvalidKey, QStringLiteral("invalid key"));
        return;
    }

    m_pendingWrites.insert(key, data);

    QTimer* timer = m_debounceTimers.value(key);
    if (!timer) {
        timer = new QTimer(this);
        timer->setSingleShot(true);
        timer->setInterval(m_debounceInterval);
        connect(timer, &QTimer::timeout, this, [this, key]() {
            writePending(key);
        });
        m_debounceTimers.insert(key, timer);
    }
    timer->start();
}

void JsonFileStore::releaseTimer(const QString& key)
{
    // deleteLater: this may run inside the timer's own timeout
    if (QTimer* timer = m_debounceTimers.take(key)) {
        timer->stop();
        timer->deleteLater();
    }
}

void JsonFileStore::writePending(const QString& key)
{
    releaseTimer(key);
    if (!m_pendingWrites.contains(key)) {
        return;
    }
    const QJsonObject data = m_pendingWrites.take(key);
    if (!write(key, data)) {
        qCWarning(lcPersistence) << "Debounced write failed for" << key;
    }
}

void JsonFileStore::flushPendingWrites()
{
    const QStringList keys = m_pendingWrites.keys();
    for (const QString& key : keys) {
        writePending(key);
    }
}

void JsonFileStore::clearPendingWrites()
{
    const QStringList keys = m_debounceTimers.keys();
    for (const QString& key : keys) {
        releaseTimer(key);
    }
    m_pendingWrites.clear();
}

bool JsonFileStore::remove(const QString& key)
{
    const QString path = filePath(key);
    if (path.isEmpty()) {
        return fail(key, StorageError::InvalidKey, QStringLiteral("invalid key"));
    }

    // A pending write would resurrect the file
    m_pendingWrites.remove(key);
    releaseTimer(key);

    QFile file(path);
    if (!file.exists()) {
        return true;
    }
    if (!file.remove()) {
        return fail(key, StorageError::DeleteError, file.errorString());
    }
    return true;
}

} // namespace Trellis
