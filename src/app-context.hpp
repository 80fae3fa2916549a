#pragma once

#include <QString>
#include <QStringList>
#include <QtGlobal>

class QCommandLineParser;
class AnimationStore;
class AnimationSetManager;

struct PetOptions {
	QString resourcesDir;
	QString dataDir;
	QString trayIconName = QStringLiteral("tray-icon.jpg");
	int petSize = 150;
	bool autoSwitch = false;
	int autoSwitchSeconds = 120;
	bool verbose = false;

	QString BuiltInAnimationDir() const;
	QString UserAnimationDir() const;
	QString ConfigPath() const;
	QString IconsDir() const;
};

// Window sizes and auto switch intervals offered in the context menu
extern const int kPetSizes[4];
extern const int kAutoSwitchIntervals[4];

// Longest accepted auto switch interval, one day
extern const int kMaxAutoSwitchSeconds;

bool IsPetSize(int size);

// Resources next to the executable, data in the per-user app data location.
// Needs a QCoreApplication.
PetOptions DefaultPetOptions();

enum class OptionsResult {
	Ok,
	Error,
	HelpRequested,
	VersionRequested,
};

// Overrides fields of options from the command line. Out of range values
// are reported through warnings and leave the existing value in place.
OptionsResult ParsePetOptions(QCommandLineParser &parser, const QStringList &arguments,
	PetOptions &options, QString &errorMessage);

// Built once at startup and handed to the pet window and the tray.
class AppContext {
public:
	explicit AppContext(const PetOptions &options);
	~AppContext();

	const PetOptions &Options() const { return options; }
	AnimationStore *Store() const { return store; }
	AnimationSetManager *Manager() const { return manager; }

private:
	Q_DISABLE_COPY(AppContext)

	PetOptions options;
	AnimationStore *store = nullptr;
	AnimationSetManager *manager = nullptr;
};
