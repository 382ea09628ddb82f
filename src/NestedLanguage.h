
#ifndef NESTED_LANGUAGE_H_
#define NESTED_LANGUAGE_H_

#include "HighlightData.h"
#include "LineRegionState.h"
#include "StyledSpan.h"

#include <QString>

#include <memory>
#include <vector>

class LanguageDefinition;
class LanguageRegistry;

namespace Highlight {

std::shared_ptr<const LanguageDefinition> ResolveNestedLanguage(const CompiledRegion &region, const LanguageRegistry *registry);
void ResolveInterior(const CompiledRegion &region, const RegionFrame &frame, const QString &content, int offset, std::vector<RegionFrame> *nestedFrames, const LanguageRegistry *registry, int depth, LineStyles *spans);

}

#endif
