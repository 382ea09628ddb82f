
#ifndef HIGHLIGHT_DATA_H_
#define HIGHLIGHT_DATA_H_

#include "HighlightStyle.h"
#include "Matcher.h"

#include <QString>

#include <optional>

// "Compiled" version of a single-line rule
struct CompiledRule {
	QString name;
	Matcher matcher;
	HighlightStyle style;
	int priority = 0;
};

// "Compiled" version of a region rule. The style is only left unresolved for
// regions that delegate their interior to a nested language.
struct CompiledRegion {
	QString name;
	Matcher startRE;
	Matcher endRE;
	std::optional<HighlightStyle> style;
	QString nestedLanguage;
};

#endif
