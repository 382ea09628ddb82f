
#include "LanguageDefinition.h"
#include "HighlightRule.h"

/**
 * @brief Resolve a palette role into a drawable style.
 *
 * @param role The palette role a rule refers to.
 * @param flags The rule's flags, which carry its emphasis.
 * @return The style, or an empty optional if the palette has no such role.
 */
std::optional<HighlightStyle> LanguageDefinition::resolveStyle(const QString &role, int flags) const {

	auto it = palette.find(role);
	if (it == palette.end()) {
		return {};
	}

	HighlightStyle style;
	style.name         = role;
	style.color        = *it;
	style.isBold       = (flags & BOLD_FONT) != 0;
	style.isItalic     = (flags & ITALIC_FONT) != 0;
	style.isUnderlined = (flags & UNDERLINE_FONT) != 0;
	return style;
}

/**
 * @brief Check if files with the given suffix belong to this language.
 *
 * @param extension The suffix, with or without its leading dot.
 * @return `true` if the suffix is one of the definition's extensions.
 */
bool LanguageDefinition::handlesExtension(const QString &extension) const {
	return extensions.contains(NormalizeExtension(extension));
}

/**
 * @brief Brings a file suffix to the form extensions are registered under:
 * lower case, with a leading dot.
 *
 * @param extension The suffix, for example "PY", ".py" or " .Py ".
 * @return The normalized suffix, or an empty string for an empty input.
 */
QString NormalizeExtension(const QString &extension) {

	QString ext = extension.trimmed().toLower();
	if (ext.isEmpty() || ext == QLatin1String(".")) {
		return QString();
	}

	if (!ext.startsWith(QLatin1Char('.'))) {
		ext.prepend(QLatin1Char('.'));
	}

	return ext;
}
