
#ifndef DEFINITION_READER_H_
#define DEFINITION_READER_H_

#include "LanguageDefinition.h"
#include "LoadDiagnostic.h"

#include <QByteArray>

#include <optional>
#include <vector>

class HighlightRule;
class RegionRule;

namespace Highlight {

CompiledRegion CompileRegion(const RegionRule &rule, const LanguageDefinition &language);
CompiledRule CompileRule(const HighlightRule &rule, const LanguageDefinition &language);
std::optional<LanguageDefinition> LoadDefinition(const QByteArray &source, const QString &origin, std::vector<LoadDiagnostic> *diagnostics);
std::optional<LanguageDefinition> LoadDefinitionFile(const QString &fileName, std::vector<LoadDiagnostic> *diagnostics);

}

#endif
