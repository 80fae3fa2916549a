#include "app-context.hpp"
#include "animation-set-manager.hpp"
#include "animation-store.hpp"
#include "pet-logging.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QStandardPaths>

#include <algorithm>
#include <iterator>

const int kPetSizes[4] = {50, 100, 150, 200};
const int kAutoSwitchIntervals[4] = {30, 60, 120, 300};
const int kMaxAutoSwitchSeconds = 24 * 60 * 60;

bool IsPetSize(int size)
{
	return std::find(std::begin(kPetSizes), std::end(kPetSizes), size) != std::end(kPetSizes);
}

QString PetOptions::BuiltInAnimationDir() const
{
	return QDir(resourcesDir).filePath(QStringLiteral("gifs"));
}

QString PetOptions::UserAnimationDir() const
{
	return QDir(dataDir).filePath(QStringLiteral("gifs"));
}

QString PetOptions::ConfigPath() const
{
	return QDir(dataDir).filePath(QStringLiteral("config.json"));
}

QString PetOptions::IconsDir() const
{
	return QDir(resourcesDir).filePath(QStringLiteral("icons"));
}

PetOptions DefaultPetOptions()
{
	PetOptions options;
	options.resourcesDir = QDir(QCoreApplication::applicationDirPath()).filePath(QStringLiteral("resources"));
	options.dataDir = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
	return options;
}

OptionsResult ParsePetOptions(QCommandLineParser &parser, const QStringList &arguments,
	PetOptions &options, QString &errorMessage)
{
	parser.setApplicationDescription(QStringLiteral("Animated desktop pet"));
	const QCommandLineOption helpOption = parser.addHelpOption();
	const QCommandLineOption versionOption = parser.addVersionOption();

	const QCommandLineOption resourcesOption(QStringLiteral("resources-dir"),
		QStringLiteral("Directory holding the built-in gifs/ and icons/."), QStringLiteral("dir"));
	const QCommandLineOption dataOption(QStringLiteral("data-dir"),
		QStringLiteral("Directory for imported animations and config.json."), QStringLiteral("dir"));
	const QCommandLineOption trayIconOption(QStringLiteral("tray-icon"),
		QStringLiteral("Preferred tray icon file name inside the icons directory."), QStringLiteral("file"));
	const QCommandLineOption sizeOption(QStringLiteral("size"),
		QStringLiteral("Pet size in pixels: 50, 100, 150 or 200."), QStringLiteral("px"));
	const QCommandLineOption autoSwitchOption(QStringLiteral("auto-switch"),
		QStringLiteral("Switch to the next animation every <seconds>."), QStringLiteral("seconds"));
	const QCommandLineOption verboseOption(QStringLiteral("verbose"),
		QStringLiteral("Enable debug logging."));

	parser.addOptions({resourcesOption, dataOption, trayIconOption, sizeOption, autoSwitchOption, verboseOption});

	if (!parser.parse(arguments)) {
		errorMessage = parser.errorText();
		return OptionsResult::Error;
	}

	if (parser.isSet(helpOption))
		return OptionsResult::HelpRequested;
	if (parser.isSet(versionOption))
		return OptionsResult::VersionRequested;

	if (parser.isSet(resourcesOption))
		options.resourcesDir = parser.value(resourcesOption);
	if (parser.isSet(dataOption))
		options.dataDir = parser.value(dataOption);
	if (parser.isSet(trayIconOption))
		options.trayIconName = parser.value(trayIconOption);

	if (parser.isSet(sizeOption)) {
		bool ok = false;
		const int size = parser.value(sizeOption).toInt(&ok);
		if (ok && IsPetSize(size)) {
			options.petSize = size;
		} else {
			qCWarning(lcUi, "Ignoring invalid --size %s, keeping %d",
				qUtf8Printable(parser.value(sizeOption)), options.petSize);
		}
	}

	if (parser.isSet(autoSwitchOption)) {
		bool ok = false;
		const int seconds = parser.value(autoSwitchOption).toInt(&ok);
		if (ok && seconds > 0 && seconds <= kMaxAutoSwitchSeconds) {
			options.autoSwitch = true;
			options.autoSwitchSeconds = seconds;
		} else {
			qCWarning(lcUi, "Ignoring invalid --auto-switch %s",
				qUtf8Printable(parser.value(autoSwitchOption)));
		}
	}

	options.verbose = parser.isSet(verboseOption);
	return OptionsResult::Ok;
}

AppContext::AppContext(const PetOptions &options_)
	: options(options_),
	  store(new AnimationStore()),
	  manager(new AnimationSetManager(store))
{
	store->Initialize(options.BuiltInAnimationDir(), options.UserAnimationDir(), options.ConfigPath());

	qCInfo(lcUi, "Animations from %s and %s", qUtf8Printable(store->GetBuiltInRoot()),
		qUtf8Printable(store->GetUserRoot()));
}

AppContext::~AppContext()
{
	delete manager;
	delete store;
}
