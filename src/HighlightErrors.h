
#ifndef HIGHLIGHT_ERRORS_H_
#define HIGHLIGHT_ERRORS_H_

#include <QString>

// A rule's expression does not compile; the rule is dropped
struct PatternCompileError {
	QString rule;
	QString message;
	int offset = -1;
};

// A rule names a color role its palette doesn't have; the rule is dropped
struct PaletteResolutionError {
	QString rule;
	QString role;
};

// A rule entry has the wrong shape, for example a string where a number
// belongs; the rule is dropped
struct MalformedRuleError {
	QString rule;
	QString message;
};

// A definition is malformed as a whole; the language is unavailable
struct DefinitionLoadError {
	QString message;
};

#endif
