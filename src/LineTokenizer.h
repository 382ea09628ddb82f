
#ifndef LINE_TOKENIZER_H_
#define LINE_TOKENIZER_H_

#include "HighlightData.h"
#include "LineRegionState.h"
#include "StyledSpan.h"

#include <QString>
#include <QStringList>

#include <vector>

class LanguageDefinition;
class LanguageRegistry;

// The spans of one line together with the region state the next line
// starts in
struct LineResult {
	LineStyles spans;
	LineRegionState endState;
};

namespace Highlight {

void AppendSpan(const HighlightStyle &style, int start, int end, LineStyles *spans);
std::vector<LineRegionState> ComputeLineStates(const QStringList &lines, const LanguageDefinition *language, const LanguageRegistry *registry);
LineResult TokenizeLine(const LanguageDefinition *language, const QString &line, const LineRegionState &state, const LanguageRegistry *registry);
LineStyles TokenizeRules(const std::vector<CompiledRule> &rules, const QString &line);
void TokenizeSegment(const LanguageDefinition &language, const QString &text, int offset, std::vector<RegionFrame> *frames, const LanguageRegistry *registry, int depth, LineStyles *spans);

}

#endif
