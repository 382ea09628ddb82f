
#include "DefinitionReader.h"
#include "Highlight.h"
#include "HighlightErrors.h"
#include "HighlightRule.h"
#include "Util/Raise.h"
#include "Yaml.h"

#include <QFile>
#include <QtDebug>

#include <algorithm>

#include <yaml-cpp/yaml.h>

namespace Highlight {

namespace {

/**
 * @brief Logs a load problem and records it, if the caller collects them.
 *
 * @param diagnostics Where to record the problem, may be `nullptr`.
 * @param kind What kind of problem it is.
 * @param origin The definition source the problem was found in.
 * @param rule The rule the problem is scoped to, or an empty string.
 * @param message The description of the problem.
 */
void Report(std::vector<LoadDiagnostic> *diagnostics, DiagnosticKind kind, const QString &origin, const QString &rule, const QString &message) {

	if (rule.isEmpty()) {
		qWarning("hilite: %s: %s", qPrintable(origin), qPrintable(message));
	} else {
		qWarning("hilite: %s: dropped rule '%s': %s", qPrintable(origin), qPrintable(rule), qPrintable(message));
	}

	if (diagnostics) {
		diagnostics->push_back(LoadDiagnostic{kind, origin, rule, message});
	}
}

/**
 * @brief Reads one of the boolean fields of a rule.
 *
 * @param value The YAML node holding the field.
 * @param flag The flag to return if the field is `true`.
 * @return `flag` if the field is set, 0 otherwise.
 */
int ReadFlag(const YAML::Node &value, int flag) {
	return value.as<bool>() ? flag : 0;
}

/**
 * @brief Read a single-line rule from a YAML node.
 *
 * @param entry The YAML node containing the rule.
 * @return The HighlightRule read from the node.
 */
HighlightRule ReadRuleYaml(const YAML::Node &entry) {

	if (!entry.IsMap()) {
		Raise<MalformedRuleError>(QString(), tr("rule must be an object"));
	}

	HighlightRule rule;

	for (auto it = entry.begin(); it != entry.end(); ++it) {

		const std::string key  = it->first.as<std::string>();
		const YAML::Node value = it->second;

		if (key == "name") {
			rule.name = value.as<QString>();
		} else if (key == "pattern") {
			rule.pattern = value.as<QString>();
		} else if (key == "color") {
			rule.color = value.as<QString>();
		} else if (key == "group") {
			rule.group = value.as<int>();
		} else if (key == "priority") {
			rule.priority = value.as<int>();
		} else if (key == "bold") {
			rule.flags |= ReadFlag(value, BOLD_FONT);
		} else if (key == "italic") {
			rule.flags |= ReadFlag(value, ITALIC_FONT);
		} else if (key == "underline") {
			rule.flags |= ReadFlag(value, UNDERLINE_FONT);
		} else if (key == "case_insensitive") {
			rule.flags |= ReadFlag(value, CASE_INSENSITIVE);
		}
	}

	return rule;
}

/**
 * @brief Read a region rule from a YAML node.
 *
 * @param entry The YAML node containing the rule.
 * @return The RegionRule read from the node.
 */
RegionRule ReadRegionYaml(const YAML::Node &entry) {

	if (!entry.IsMap()) {
		Raise<MalformedRuleError>(QString(), tr("multiline rule must be an object"));
	}

	RegionRule rule;

	for (auto it = entry.begin(); it != entry.end(); ++it) {

		const std::string key  = it->first.as<std::string>();
		const YAML::Node value = it->second;

		if (key == "name") {
			rule.name = value.as<QString>();
		} else if (key == "start") {
			rule.start = value.as<QString>();
		} else if (key == "end") {
			rule.end = value.as<QString>();
		} else if (key == "color") {
			rule.color = value.as<QString>();
		} else if (key == "nested_language") {
			rule.nestedLanguage = value.as<QString>().trimmed();
		} else if (key == "bold") {
			rule.flags |= ReadFlag(value, BOLD_FONT);
		} else if (key == "italic") {
			rule.flags |= ReadFlag(value, ITALIC_FONT);
		} else if (key == "underline") {
			rule.flags |= ReadFlag(value, UNDERLINE_FONT);
		} else if (key == "case_insensitive") {
			rule.flags |= ReadFlag(value, CASE_INSENSITIVE);
		}
	}

	return rule;
}

/**
 * @brief Compiles every entry of a rule list, dropping (and reporting) the
 * entries that fail. Failures never affect the other rules.
 *
 * @param entries The YAML sequence holding the rules.
 * @param language The definition the rules are added to.
 * @param diagnostics Where to record dropped rules, may be `nullptr`.
 * @param read The function reading one entry.
 * @param compile The function compiling what `read` returned.
 * @param out The list receiving the compiled rules.
 */
template <class Read, class Compile, class Out>
void ReadRuleList(const YAML::Node &entries, const LanguageDefinition &language, std::vector<LoadDiagnostic> *diagnostics, Read read, Compile compile, Out *out) {

	int index = 0;
	for (const YAML::Node &entry : entries) {

		QString ruleName = QStringLiteral("#%1").arg(index++);
		if (entry.IsMap()) {
			const YAML::Node name = entry["name"];
			if (name && name.IsScalar() && !name.Scalar().empty()) {
				ruleName = name.as<QString>();
			}
		}

		try {
			auto rule = read(entry);
			if (rule.name.isEmpty()) {
				rule.name = ruleName;
			}

			out->push_back(compile(rule, language));
		} catch (const PatternCompileError &ex) {
			if (ex.offset >= 0) {
				Report(diagnostics, DiagnosticKind::PatternCompile, language.origin, ruleName, tr("%1 (at offset %2)").arg(ex.message).arg(ex.offset));
			} else {
				Report(diagnostics, DiagnosticKind::PatternCompile, language.origin, ruleName, ex.message);
			}
		} catch (const PaletteResolutionError &ex) {
			Report(diagnostics, DiagnosticKind::PaletteResolution, language.origin, ruleName, tr("unknown color role '%1'").arg(ex.role));
		} catch (const MalformedRuleError &ex) {
			Report(diagnostics, DiagnosticKind::MalformedRule, language.origin, ruleName, ex.message);
		} catch (const YAML::Exception &ex) {
			Report(diagnostics, DiagnosticKind::MalformedRule, language.origin, ruleName, QString::fromStdString(ex.msg));
		}
	}
}

/**
 * @brief Builds a language definition from a parsed document.
 *
 * @param root The root node of the document.
 * @param origin Where the document came from.
 * @param diagnostics Where to record dropped rules and colors, may be `nullptr`.
 * @return The definition.
 *
 * @note Raises DefinitionLoadError if the document is not usable at all.
 */
LanguageDefinition ReadDefinitionYaml(const YAML::Node &root, const QString &origin, std::vector<LoadDiagnostic> *diagnostics) {

	if (!root.IsMap()) {
		Raise<DefinitionLoadError>(tr("definition must be a JSON object"));
	}

	LanguageDefinition language;
	language.origin = origin;

	const YAML::Node name = root["name"];
	if (!name || !name.IsScalar() || name.as<QString>().trimmed().isEmpty()) {
		Raise<DefinitionLoadError>(tr("name field required"));
	}

	language.name = name.as<QString>().trimmed();

	QStringList extensions;
	const YAML::Node extensionList = root["extensions"];
	if (!extensionList || !YAML::convert<QStringList>::decode(extensionList, extensions)) {
		Raise<DefinitionLoadError>(tr("extensions field must be a list of file suffixes"));
	}

	for (const QString &extension : extensions) {
		const QString ext = NormalizeExtension(extension);
		if (!ext.isEmpty() && !language.extensions.contains(ext)) {
			language.extensions.append(ext);
		}
	}

	if (language.extensions.isEmpty()) {
		Raise<DefinitionLoadError>(tr("extensions field required"));
	}

	if (const YAML::Node colors = root["colors"]) {
		if (!colors.IsMap()) {
			Raise<DefinitionLoadError>(tr("colors field must be an object"));
		}

		for (auto it = colors.begin(); it != colors.end(); ++it) {
			const auto role = it->first.as<QString>();

			QColor color;
			if (!YAML::convert<QColor>::decode(it->second, color)) {
				const QString value = it->second.IsScalar() ? QString::fromStdString(it->second.Scalar()) : QStringLiteral("?");
				Report(diagnostics, DiagnosticKind::InvalidColor, origin, QString(), tr("color role '%1' has an invalid color '%2'").arg(role, value));
				continue;
			}

			language.palette.insert(role, color);
		}
	}

	if (const YAML::Node rules = root["rules"]) {
		if (!rules.IsSequence()) {
			Raise<DefinitionLoadError>(tr("rules field must be a list"));
		}

		ReadRuleList(rules, language, diagnostics, ReadRuleYaml, CompileRule, &language.rules);

		// higher priority first, declaration order otherwise
		std::stable_sort(language.rules.begin(), language.rules.end(), [](const CompiledRule &lhs, const CompiledRule &rhs) {
			return lhs.priority > rhs.priority;
		});
	}

	if (const YAML::Node regions = root["multiline_rules"]) {
		if (!regions.IsSequence()) {
			Raise<DefinitionLoadError>(tr("multiline_rules field must be a list"));
		}

		ReadRuleList(regions, language, diagnostics, ReadRegionYaml, CompileRegion, &language.regions);
	}

	return language;
}

}

/**
 * @brief Compiles a single-line rule against the palette of its language.
 *
 * @param rule The rule as read from the definition.
 * @param language The definition providing the palette.
 * @return The compiled rule.
 *
 * @note Raises PaletteResolutionError if the rule's color role is not in the
 * palette, and PatternCompileError if its pattern is malformed.
 */
CompiledRule CompileRule(const HighlightRule &rule, const LanguageDefinition &language) {

	std::optional<HighlightStyle> style = language.resolveStyle(rule.color, rule.flags);
	if (!style) {
		Raise<PaletteResolutionError>(rule.name, rule.color);
	}

	CompiledRule compiled;
	compiled.name     = rule.name;
	compiled.matcher  = Matcher::compile(rule.name, rule.pattern, rule.group, (rule.flags & CASE_INSENSITIVE) != 0);
	compiled.style    = *style;
	compiled.priority = rule.priority;
	return compiled;
}

/**
 * @brief Compiles a region rule against the palette of its language. A region
 * that delegates its interior to a nested language may use a color role its
 * own palette lacks; its delimiters are then left unstyled.
 *
 * @param rule The rule as read from the definition.
 * @param language The definition providing the palette.
 * @return The compiled region.
 *
 * @note Raises PaletteResolutionError or PatternCompileError like
 * CompileRule, and PatternCompileError if the start pattern can match
 * the empty string.
 */
CompiledRegion CompileRegion(const RegionRule &rule, const LanguageDefinition &language) {

	const bool caseInsensitive = (rule.flags & CASE_INSENSITIVE) != 0;

	CompiledRegion compiled;
	compiled.name           = rule.name;
	compiled.nestedLanguage = rule.nestedLanguage;
	compiled.style          = language.resolveStyle(rule.color, rule.flags);

	if (!compiled.style && rule.nestedLanguage.isEmpty()) {
		Raise<PaletteResolutionError>(rule.name, rule.color);
	}

	compiled.startRE = Matcher::compile(rule.name, rule.start, 0, caseInsensitive);
	if (compiled.startRE.matchesEmptyString()) {
		Raise<PatternCompileError>(rule.name, tr("start pattern matches the empty string"), -1);
	}

	compiled.endRE = Matcher::compile(rule.name, rule.end, 0, caseInsensitive);
	return compiled;
}

/**
 * @brief Parses a language definition. Rules that fail to compile or refer
 * to unknown colors are dropped and reported; the definition is still
 * produced with the remaining rules.
 *
 * @param source The JSON text of the definition.
 * @param origin Where the text came from, used in diagnostics.
 * @param diagnostics Where to record problems, may be `nullptr`.
 * @return The definition, or an empty optional if the document is malformed
 * or lacks its name or extensions.
 */
std::optional<LanguageDefinition> LoadDefinition(const QByteArray &source, const QString &origin, std::vector<LoadDiagnostic> *diagnostics) {

	try {
		const YAML::Node root         = YAML::Load(source.toStdString());
		LanguageDefinition language = ReadDefinitionYaml(root, origin, diagnostics);

		qDebug("hilite: loaded %s from %s (%d rules, %d regions)",
			   qPrintable(language.name),
			   qPrintable(origin),
			   static_cast<int>(language.rules.size()),
			   static_cast<int>(language.regions.size()));

		return language;
	} catch (const YAML::Exception &ex) {
		Report(diagnostics, DiagnosticKind::DefinitionLoad, origin, QString(), tr("invalid JSON: %1").arg(QString::fromStdString(ex.what())));
	} catch (const DefinitionLoadError &ex) {
		Report(diagnostics, DiagnosticKind::DefinitionLoad, origin, QString(), ex.message);
	}

	return {};
}

/**
 * @brief Reads and parses a language definition file.
 *
 * @param fileName The file to read.
 * @param diagnostics Where to record problems, may be `nullptr`.
 * @return The definition, or an empty optional if the file can't be read or
 * is malformed.
 */
std::optional<LanguageDefinition> LoadDefinitionFile(const QString &fileName, std::vector<LoadDiagnostic> *diagnostics) {

	QFile file(fileName);
	if (!file.open(QIODevice::ReadOnly)) {
		Report(diagnostics, DiagnosticKind::DefinitionLoad, fileName, QString(), tr("could not read file: %1").arg(file.errorString()));
		return {};
	}

	return LoadDefinition(file.readAll(), fileName, diagnostics);
}

}
