
#ifndef LANGUAGE_REGISTRY_H_
#define LANGUAGE_REGISTRY_H_

#include "LanguageDefinition.h"
#include "LoadDiagnostic.h"

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QStringList>

#include <memory>
#include <vector>

// The loaded language definitions, looked up by name or by file extension.
// Lookups that find nothing return nullptr, which callers treat as plain
// text.
class LanguageRegistry {
public:
	LanguageRegistry()                                    = default;
	LanguageRegistry(const LanguageRegistry &)            = delete;
	LanguageRegistry &operator=(const LanguageRegistry &) = delete;
	~LanguageRegistry()                                   = default;

public:
	int loadDefaults();
	int loadDirectory(const QString &path);
	bool loadFile(const QString &fileName);
	bool loadSource(const QByteArray &source, const QString &origin);
	void addDefinition(LanguageDefinition definition);
	void checkNestedReferences();
	void clear();

public:
	std::shared_ptr<const LanguageDefinition> definitionForName(const QString &name) const;
	std::shared_ptr<const LanguageDefinition> definitionForExtension(const QString &extension) const;
	std::shared_ptr<const LanguageDefinition> definitionForFile(const QString &fileName) const;
	QStringList languageNames() const;
	QStringList supportedExtensions() const;
	const std::vector<LoadDiagnostic> &diagnostics() const;

private:
	void report(DiagnosticKind kind, const QString &origin, const QString &rule, const QString &message);

private:
	QHash<QString, std::shared_ptr<const LanguageDefinition>> byName_;
	QHash<QString, std::shared_ptr<const LanguageDefinition>> byExtension_;
	std::vector<LoadDiagnostic> diagnostics_;
};

namespace Highlight {
LanguageRegistry &Registry();
}

#endif
