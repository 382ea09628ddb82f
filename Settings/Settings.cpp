
#include "Settings.h"

#include <QSettings>
#include <QStandardPaths>
#include <QtDebug>

namespace Settings {

namespace {

constexpr bool DefaultHighlightSyntax = true;
constexpr int DefaultReparseChunkSize = 80;
constexpr int MaxReparseChunkSize     = 1 << 20;
const auto DefaultForeground          = QLatin1String("#d4d4d4");

bool settingsLoaded_ = false;
QString configFileOverride_;

}

bool highlightSyntax;
int reparseChunkSize;
QString defaultForeground;
QStringList definitionPaths;

/**
 * @brief Gets the configuration directory. If the environment variable
 * `HILITE_HOME` is set, it is used instead of the platform location.
 *
 * @return The path to the configuration directory.
 */
QString ConfigDirectory() {
	const QString home = qEnvironmentVariable("HILITE_HOME");
	if (!home.isEmpty()) {
		return home;
	}

	const QString configDir = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
	return QStringLiteral("%1/hilite").arg(configDir);
}

/**
 * @brief Gets the path of the configuration file, honoring an override set
 * with SetConfigFile.
 *
 * @return The path to the configuration file.
 */
QString ConfigFile() {
	if (!configFileOverride_.isEmpty()) {
		return configFileOverride_;
	}

	return QStringLiteral("%1/config.ini").arg(ConfigDirectory());
}

/**
 * @brief Gets the directory searched for user language definitions when the
 * configuration names none.
 *
 * @return The path to the user definition directory.
 */
QString DefinitionDirectory() {
	return QStringLiteral("%1/highlight").arg(ConfigDirectory());
}

/**
 * @brief Uses `filename` as the configuration file from now on. Any settings
 * already loaded are discarded so that the next Load() reads the new file.
 *
 * @param filename The configuration file to use, or an empty string to go
 * back to the default location.
 */
void SetConfigFile(const QString &filename) {
	configFileOverride_ = filename;
	settingsLoaded_     = false;
}

/**
 * @brief Restores every setting to its default value.
 */
void Reset() {
	highlightSyntax   = DefaultHighlightSyntax;
	reparseChunkSize  = DefaultReparseChunkSize;
	defaultForeground = DefaultForeground;
	definitionPaths   = QStringList{DefinitionDirectory()};
}

/**
 * @brief Loads the settings from the configuration file. A missing file
 * leaves every setting at its default.
 */
void Load() {

	if (settingsLoaded_) {
		return;
	}

	Reset();

	const QString filename = ConfigFile();
	QSettings settings(filename, QSettings::IniFormat);

	highlightSyntax   = settings.value(QLatin1String("hilite.highlightSyntax"), DefaultHighlightSyntax).toBool();
	reparseChunkSize  = settings.value(QLatin1String("hilite.reparseChunkSize"), DefaultReparseChunkSize).toInt();
	defaultForeground = settings.value(QLatin1String("hilite.defaultForeground"), DefaultForeground).toString();
	definitionPaths   = settings.value(QLatin1String("hilite.definitionPaths"), definitionPaths).toStringList();

	if (reparseChunkSize <= 0 || reparseChunkSize > MaxReparseChunkSize) {
		qWarning("hilite: ignoring invalid reparseChunkSize %d in %s", reparseChunkSize, qPrintable(filename));
		reparseChunkSize = DefaultReparseChunkSize;
	}

	if (settings.status() != QSettings::NoError) {
		qWarning("hilite: could not read %s, using defaults", qPrintable(filename));
	}

	settingsLoaded_ = true;
}

/**
 * @brief Saves the settings to the configuration file.
 *
 * @return `true` if the settings were written successfully, `false` otherwise.
 */
bool Save() {

	const QString filename = ConfigFile();
	QSettings settings(filename, QSettings::IniFormat);

	settings.setValue(QLatin1String("hilite.highlightSyntax"), highlightSyntax);
	settings.setValue(QLatin1String("hilite.reparseChunkSize"), reparseChunkSize);
	settings.setValue(QLatin1String("hilite.defaultForeground"), defaultForeground);
	settings.setValue(QLatin1String("hilite.definitionPaths"), definitionPaths);

	settings.sync();
	return settings.status() == QSettings::NoError;
}

}
