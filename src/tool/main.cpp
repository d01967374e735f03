// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#define TRANSLATION_DOMAIN "trellis-layout"

#include "../config/settings.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include "../core/panetree.h"
#include "../persistence/jsonfilestore.h"
#include "../persistence/panelayoutserialization.h"
#include "../persistence/workspacepersistence.h"
#include "version.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QJsonObject>
#include <QTextStream>

#include <KAboutData>
#include <KLocalizedString>

using namespace Trellis;

namespace {

int dumpLayout(const QJsonObject& state, bool existingFilesOnly, QTextStream& out)
{
    std::function<bool(const QString&)> isFileAvailable;
    if (existingFilesOnly) {
        isFileAvailable = [](const QString& filePath) {
            return QFileInfo::exists(filePath);
        };
    }

    const std::optional<PaneLayoutSerialization::RestoredLayout> layout =
        PaneLayoutSerialization::restoreLayout(state, isFileAvailable);
    if (!layout) {
        out << i18n("No pane layout stored") << Qt::endl;
        return 1;
    }

    out << PaneTree::describe(layout->root);
    out << i18n("Active pane: %1", layout->activePaneId) << Qt::endl;
    return 0;
}

int validateLayout(const QJsonObject& state, QTextStream& out)
{
    const QJsonValue layoutValue = state.value(JsonKeys::PaneLayout);
    if (!layoutValue.isObject()) {
        out << i18n("No pane layout stored") << Qt::endl;
        return 1;
    }

    // Checked as stored, before any normalization repairs it
    const PaneNodePtr root = PaneLayoutSerialization::deserializeNode(layoutValue.toObject());
    if (!root) {
        out << i18n("Pane layout is not a leaf or split node") << Qt::endl;
        return 1;
    }

    QStringList violations = PaneTree::validate(root);
    const QString activePaneId = state.value(JsonKeys::ActivePaneId).toString();
    if (!activePaneId.isEmpty() && !PaneTree::findLeaf(root, activePaneId)) {
        violations.append(i18n("Active pane %1 is not a leaf of the layout", activePaneId));
    }

    if (violations.isEmpty()) {
        out << i18n("Layout is valid (%1 pane(s))", PaneTree::leafCount(root)) << Qt::endl;
        return 0;
    }
    for (const QString& violation : std::as_const(violations)) {
        out << violation << Qt::endl;
    }
    return 1;
}

int migrateLayout(JsonFileStore& storage, const QString& key, const QJsonObject& state, QTextStream& out)
{
    const std::optional<QJsonObject> migrated = PaneLayoutSerialization::migrateState(state);
    if (!migrated) {
        out << i18n("No pane layout stored") << Qt::endl;
        return 1;
    }
    if (*migrated == state) {
        out << i18n("Layout is already current") << Qt::endl;
        return 0;
    }
    if (!storage.write(key, *migrated)) {
        qCCritical(lcTool) << "Could not write migrated state for" << key << ":"
                           << storageErrorName(storage.lastError());
        return 1;
    }
    out << i18n("Migrated %1", storage.filePath(key)) << Qt::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("trellis-layout");

    KAboutData aboutData(QStringLiteral("trellis-layout"), i18n("Trellis Layout Tool"), Trellis::VERSION_STRING,
                         i18n("Inspect, validate and migrate stored workspace pane layouts"), KAboutLicense::GPL_V3,
                         i18n("(c) 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption projectOption(QStringList{QStringLiteral("p"), QStringLiteral("project")},
                                     i18n("Project whose stored state is used"), QStringLiteral("id"));
    QCommandLineOption storageOption(QStringList{QStringLiteral("s"), QStringLiteral("storage")},
                                     i18n("Storage directory (default: configured directory)"),
                                     QStringLiteral("directory"));
    QCommandLineOption dumpOption(QStringLiteral("dump"), i18n("Print the restored pane tree (default)"));
    QCommandLineOption existingOption(QStringLiteral("existing-files-only"),
                                      i18n("With --dump, drop editor tabs whose file no longer exists"));
    QCommandLineOption validateOption(QStringLiteral("validate"), i18n("Check the stored pane tree as written"));
    QCommandLineOption migrateOption(QStringLiteral("migrate"), i18n("Rewrite the stored state in the current format"));

    parser.addOptions({projectOption, storageOption, dumpOption, existingOption, validateOption, migrateOption});
    parser.process(app);
    aboutData.processCommandLine(&parser);

    QTextStream out(stdout);

    if (!parser.isSet(projectOption) || parser.value(projectOption).isEmpty()) {
        out << i18n("A project is required (--project <id>)") << Qt::endl;
        return 2;
    }

    const int modeCount = int(parser.isSet(dumpOption)) + int(parser.isSet(validateOption))
        + int(parser.isSet(migrateOption));
    if (modeCount > 1) {
        out << i18n("--dump, --validate and --migrate are mutually exclusive") << Qt::endl;
        return 2;
    }
    if (parser.isSet(existingOption) && (parser.isSet(validateOption) || parser.isSet(migrateOption))) {
        qCWarning(lcTool) << "--existing-files-only only applies to --dump; ignoring it";
    }

    QString storageDirectory;
    if (parser.isSet(storageOption)) {
        storageDirectory = parser.value(storageOption);
    } else {
        Settings settings;
        storageDirectory = settings.effectiveStorageDirectory();
    }

    JsonFileStore storage(storageDirectory);
    const QString key = WorkspacePersistence::storageKey(parser.value(projectOption));
    qCDebug(lcTool) << "Reading" << key << "from" << storage.storageDirectory();

    const ReadResult result = storage.read(key);
    if (!result.success) {
        out << i18n("Could not read %1: %2", key, storageErrorName(result.error)) << Qt::endl;
        if (!result.errorString.isEmpty()) {
            qCWarning(lcTool) << result.errorString;
        }
        return 1;
    }

    if (parser.isSet(validateOption)) {
        return validateLayout(result.data, out);
    }
    if (parser.isSet(migrateOption)) {
        return migrateLayout(storage, key, result.data, out);
    }
    return dumpLayout(result.data, parser.isSet(existingOption), out);
}
