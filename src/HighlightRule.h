
#ifndef HIGHLIGHT_RULE_H_
#define HIGHLIGHT_RULE_H_

#include <QString>

// Rule flags for modifying matching and drawing
enum {
	CASE_INSENSITIVE = 1,
	BOLD_FONT        = 2,
	ITALIC_FONT      = 4,
	UNDERLINE_FONT   = 8
};

// A single-line rule as read from a language definition
class HighlightRule {
public:
	QString name;
	QString pattern;
	QString color;
	int group    = 0;
	int priority = 0;
	int flags    = 0;
};

// A multiline region rule as read from a language definition
class RegionRule {
public:
	QString name;
	QString start;
	QString end;
	QString color;
	QString nestedLanguage;
	int flags = 0;
};

#endif
