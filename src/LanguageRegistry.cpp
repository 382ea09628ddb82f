
#include "LanguageRegistry.h"
#include "DefinitionReader.h"
#include "Highlight.h"
#include "Util/Resource.h"

#include <QDir>
#include <QFileInfo>
#include <QtDebug>

#include <algorithm>

// Q_INIT_RESOURCE can't be used from inside a namespace
static void InitDefinitionResources() {
	Q_INIT_RESOURCE(definitions);
}

namespace {

const auto DefinitionFilter = QStringLiteral("*.json");

QString NameKey(const QString &name) {
	return name.trimmed().toLower();
}

}

/**
 * @brief Loads the definitions compiled into the library.
 *
 * @return The number of definitions loaded.
 */
int LanguageRegistry::loadDefaults() {

	InitDefinitionResources();

	int count = 0;
	for (const QString &resource : ListResources(QStringLiteral(":/highlight"), {DefinitionFilter})) {
		if (std::optional<QByteArray> source = LoadResource(resource)) {
			if (loadSource(*source, resource)) {
				++count;
			}
		} else {
			report(DiagnosticKind::DefinitionLoad, resource, QString(), Highlight::tr("could not read resource"));
		}
	}

	checkNestedReferences();
	return count;
}

/**
 * @brief Loads every definition file of a directory, in file name order. A
 * definition whose name is already registered replaces the earlier one.
 *
 * @param path The directory to read.
 * @return The number of definitions loaded.
 */
int LanguageRegistry::loadDirectory(const QString &path) {

	const QDir dir(path);
	if (!dir.exists()) {
		qDebug("hilite: definition directory %s does not exist", qPrintable(path));
		return 0;
	}

	int count = 0;
	for (const QFileInfo &info : dir.entryInfoList({DefinitionFilter}, QDir::Files | QDir::Readable, QDir::Name)) {
		if (loadFile(info.absoluteFilePath())) {
			++count;
		}
	}

	checkNestedReferences();
	return count;
}

/**
 * @brief Loads a single definition file.
 *
 * @param fileName The file to read.
 * @return `true` if a definition was registered.
 */
bool LanguageRegistry::loadFile(const QString &fileName) {

	std::optional<LanguageDefinition> definition = Highlight::LoadDefinitionFile(fileName, &diagnostics_);
	if (!definition) {
		return false;
	}

	addDefinition(std::move(*definition));
	return true;
}

/**
 * @brief Loads a definition from memory.
 *
 * @param source The JSON text of the definition.
 * @param origin Where the text came from, used in diagnostics.
 * @return `true` if a definition was registered.
 */
bool LanguageRegistry::loadSource(const QByteArray &source, const QString &origin) {

	std::optional<LanguageDefinition> definition = Highlight::LoadDefinition(source, origin, &diagnostics_);
	if (!definition) {
		return false;
	}

	addDefinition(std::move(*definition));
	return true;
}

/**
 * @brief Registers a definition under its name and extensions. A definition
 * with the same name (compared without case) is replaced, extensions and
 * all. An extension that already belongs to another language stays with
 * that language; the collision is reported.
 *
 * @param definition The definition to register.
 */
void LanguageRegistry::addDefinition(LanguageDefinition definition) {

	const QString key = NameKey(definition.name);

	auto it = byName_.find(key);
	if (it != byName_.end()) {
		qDebug("hilite: %s replaces the definition of %s from %s",
			   qPrintable(definition.origin),
			   qPrintable((*it)->name),
			   qPrintable((*it)->origin));

		for (auto ext = byExtension_.begin(); ext != byExtension_.end();) {
			if (*ext == *it) {
				ext = byExtension_.erase(ext);
			} else {
				++ext;
			}
		}
	}

	auto shared = std::make_shared<const LanguageDefinition>(std::move(definition));
	byName_.insert(key, shared);

	for (const QString &extension : shared->extensions) {
		auto owner = byExtension_.find(extension);
		if (owner != byExtension_.end()) {
			report(DiagnosticKind::ExtensionCollision,
				   shared->origin,
				   QString(),
				   Highlight::tr("extension %1 is already used by %2").arg(extension, (*owner)->name));
			continue;
		}

		byExtension_.insert(extension, shared);
	}
}

/**
 * @brief Reports every region whose nested language isn't registered. Those
 * regions still work; their interior is styled flatly.
 */
void LanguageRegistry::checkNestedReferences() {

	diagnostics_.erase(std::remove_if(diagnostics_.begin(), diagnostics_.end(), [](const LoadDiagnostic &diagnostic) {
						   return diagnostic.kind == DiagnosticKind::NestedLanguageMissing;
					   }),
					   diagnostics_.end());

	for (const std::shared_ptr<const LanguageDefinition> &language : byName_) {
		for (const CompiledRegion &region : language->regions) {
			if (!region.nestedLanguage.isEmpty() && !definitionForName(region.nestedLanguage)) {
				report(DiagnosticKind::NestedLanguageMissing,
					   language->origin,
					   region.name,
					   Highlight::tr("nested language %1 is not loaded").arg(region.nestedLanguage));
			}
		}
	}
}

/**
 * @brief Forgets every definition and diagnostic.
 */
void LanguageRegistry::clear() {
	byName_.clear();
	byExtension_.clear();
	diagnostics_.clear();
}

/**
 * @brief Looks a language up by name, ignoring case.
 *
 * @param name The language name, for example "Python".
 * @return The definition, or `nullptr` if no such language is loaded.
 */
std::shared_ptr<const LanguageDefinition> LanguageRegistry::definitionForName(const QString &name) const {
	return byName_.value(NameKey(name));
}

/**
 * @brief Looks a language up by file extension, ignoring case.
 *
 * @param extension The suffix, with or without its leading dot.
 * @return The definition, or `nullptr` if the extension is unknown.
 */
std::shared_ptr<const LanguageDefinition> LanguageRegistry::definitionForExtension(const QString &extension) const {
	return byExtension_.value(NormalizeExtension(extension));
}

/**
 * @brief Looks a language up by the suffix of a file name. Compound suffixes
 * are tried longest first, so "a.dex.txt" matches ".dex.txt" before ".txt".
 *
 * @param fileName The file name or path.
 * @return The definition, or `nullptr` if the file has no known suffix.
 */
std::shared_ptr<const LanguageDefinition> LanguageRegistry::definitionForFile(const QString &fileName) const {

	const QString name = QFileInfo(fileName).fileName();

	auto dot = name.indexOf(QLatin1Char('.'));
	while (dot != -1) {
		if (std::shared_ptr<const LanguageDefinition> language = definitionForExtension(name.mid(dot))) {
			return language;
		}

		dot = name.indexOf(QLatin1Char('.'), dot + 1);
	}

	return nullptr;
}

QStringList LanguageRegistry::languageNames() const {

	QStringList names;
	for (const std::shared_ptr<const LanguageDefinition> &language : byName_) {
		names.append(language->name);
	}

	names.sort(Qt::CaseInsensitive);
	return names;
}

QStringList LanguageRegistry::supportedExtensions() const {
	QStringList extensions = byExtension_.keys();
	extensions.sort();
	return extensions;
}

const std::vector<LoadDiagnostic> &LanguageRegistry::diagnostics() const {
	return diagnostics_;
}

void LanguageRegistry::report(DiagnosticKind kind, const QString &origin, const QString &rule, const QString &message) {
	qWarning("hilite: %s: %s", qPrintable(origin), qPrintable(message));
	diagnostics_.push_back(LoadDiagnostic{kind, origin, rule, message});
}

namespace Highlight {

/**
 * @brief The registry shared by the whole process. It starts out empty;
 * the application loads it once at startup.
 *
 * @return The registry.
 */
LanguageRegistry &Registry() {
	static LanguageRegistry registry;
	return registry;
}

}
