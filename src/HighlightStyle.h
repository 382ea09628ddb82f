
#ifndef HIGHLIGHT_STYLE_H_
#define HIGHLIGHT_STYLE_H_

#include <QColor>
#include <QString>

// A palette role of a language definition, resolved for drawing
struct HighlightStyle {
	QString name;
	QColor color;
	bool isBold       = false;
	bool isItalic     = false;
	bool isUnderlined = false;

	bool operator==(const HighlightStyle &rhs) const {
		return name == rhs.name &&
			   color == rhs.color &&
			   isBold == rhs.isBold &&
			   isItalic == rhs.isItalic &&
			   isUnderlined == rhs.isUnderlined;
	}

	bool operator!=(const HighlightStyle &rhs) const {
		return !(*this == rhs);
	}
};

#endif
