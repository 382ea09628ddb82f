
#ifndef LOAD_DIAGNOSTIC_H_
#define LOAD_DIAGNOSTIC_H_

#include <QLatin1String>
#include <QString>
#include <QtGlobal>

enum class DiagnosticKind : int {
	PatternCompile,
	PaletteResolution,
	MalformedRule,
	InvalidColor,
	DefinitionLoad,
	ExtensionCollision,
	NestedLanguageMissing
};

inline QLatin1String to_string(DiagnosticKind kind) {

	switch (kind) {
	case DiagnosticKind::PatternCompile:
		return QLatin1String("pattern");
	case DiagnosticKind::PaletteResolution:
		return QLatin1String("palette");
	case DiagnosticKind::MalformedRule:
		return QLatin1String("rule");
	case DiagnosticKind::InvalidColor:
		return QLatin1String("color");
	case DiagnosticKind::DefinitionLoad:
		return QLatin1String("definition");
	case DiagnosticKind::ExtensionCollision:
		return QLatin1String("extension");
	case DiagnosticKind::NestedLanguageMissing:
		return QLatin1String("nested-language");
	}

	Q_UNREACHABLE();
}

// Something dropped or degraded while loading definitions
struct LoadDiagnostic {
	DiagnosticKind kind;
	QString origin;
	QString rule;
	QString message;
};

#endif
