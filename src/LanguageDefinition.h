
#ifndef LANGUAGE_DEFINITION_H_
#define LANGUAGE_DEFINITION_H_

#include "HighlightData.h"

#include <QColor>
#include <QHash>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

// The rules of one language. Built once by the definition reader and
// shared read-only afterwards.
class LanguageDefinition {
public:
	std::optional<HighlightStyle> resolveStyle(const QString &role, int flags) const;
	bool handlesExtension(const QString &extension) const;

public:
	QString name;
	QString origin;
	QStringList extensions;
	QHash<QString, QColor> palette;
	std::vector<CompiledRule> rules;
	std::vector<CompiledRegion> regions;
};

QString NormalizeExtension(const QString &extension);

#endif
