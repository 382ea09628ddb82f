
#ifndef MAIN_H_
#define MAIN_H_

#include "StyledSpan.h"

#include <QString>
#include <QStringList>

#include <vector>

class Main {
public:
	explicit Main(const QStringList &args);

public:
	int exec();

private:
	int highlightFile();
	void listLanguages() const;
	void printDiagnostics() const;
	static void printAnsi(const QStringList &lines, const std::vector<LineStyles> &styles);
	static void printSpans(const std::vector<LineStyles> &styles);

private:
	QString configFile_;
	QString fileName_;
	QString langMode_;
	QStringList definitionDirs_;
	bool ansi_        = false;
	bool list_        = false;
	bool diagnostics_ = false;
};

#endif
