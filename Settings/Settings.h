
#ifndef SETTINGS_H_
#define SETTINGS_H_

#include "Util/QtHelper.h"

#include <QString>
#include <QStringList>

namespace Settings {
Q_DECLARE_NAMESPACE_TR(Settings)

void Load();
bool Save();
void Reset();

// Paths
QString ConfigDirectory();
QString ConfigFile();
QString DefinitionDirectory();
void SetConfigFile(const QString &filename);

extern bool highlightSyntax;
extern int reparseChunkSize;
extern QString defaultForeground;
extern QStringList definitionPaths;

}

#endif
