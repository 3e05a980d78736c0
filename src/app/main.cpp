// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>
#include <QtCore/QLoggingCategory>
#include <QtCore/QStringList>

#include <QtWidgets/QApplication>
#include <QtWidgets/QStyleFactory>

#include <cstdlib>

#include "checklisteditor/MainWindow.hpp"
#include "checklistmodel/library/ChecklistLibrary.hpp"
#include "checklistmodel/settings/AppPaths.hpp"

#include "utils/Result.hpp"

Q_LOGGING_CATEGORY(checklistapplog, "checklist.app")

using namespace ChecklistModel;

static constexpr char dataDirOptionC[] = "data-dir";

static void printErrorsAndFail(const QString& header, const QStringList& errors)
{
	qCritical().noquote() << header;
	for (const QString& e : errors)
		qCritical().noquote() << "  " << e;
}

static bool prepareDataDir(const AppPaths& paths)
{
	const ChecklistLibrary library(paths.dataDir);

	const QString defaults = AppPaths::bundledDefaultsDir(QCoreApplication::applicationDirPath());
	if (!defaults.isEmpty()) {
		bool seeded = false;
		const Utils::Result r = library.seedDefaults(defaults, &seeded);
		if (!r)
			qCWarning(checklistapplog).noquote() << "Could not seed defaults:" << r.errorString();
		else if (seeded)
			qCInfo(checklistapplog).noquote() << "Seeded" << paths.dataDir << "from" << defaults;
	}

	const Utils::Result dir = library.ensureDirectory();
	if (!dir) {
		printErrorsAndFail(QStringLiteral("Data directory is not usable: %1").arg(paths.dataDir), dir.errors);
		return false;
	}
	return true;
}

int main(int argc, char** argv)
{
	QApplication app(argc, argv);
	QCoreApplication::setOrganizationName(AppPaths::applicationName());
	QCoreApplication::setApplicationName(AppPaths::applicationName());
	QApplication::setStyle(QStyleFactory::create(QStringLiteral("Fusion")));

	QCommandLineParser parser;
	parser.setApplicationDescription(QStringLiteral("Hierarchical checklist manager"));
	parser.addHelpOption();
	parser.addOption(QCommandLineOption(QStringList{ QString::fromLatin1(dataDirOptionC) },
	                                    QStringLiteral("Directory holding the checklists and config.json."),
	                                    QStringLiteral("path")));
	parser.process(app);

	const AppPaths paths = AppPaths::resolve(parser.value(QString::fromLatin1(dataDirOptionC)));
	if (paths.dataDir.isEmpty()) {
		printErrorsAndFail(QStringLiteral("No data directory could be resolved."), {});
		return EXIT_FAILURE;
	}
	if (!prepareDataDir(paths))
		return EXIT_FAILURE;

	qCInfo(checklistapplog).noquote() << "Using data directory" << paths.dataDir;

	ChecklistEditor::MainWindow window(paths);
	window.show();
	return app.exec();
}
