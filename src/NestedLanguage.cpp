
#include "NestedLanguage.h"
#include "LanguageRegistry.h"
#include "LineTokenizer.h"

#include <gsl/gsl>

namespace Highlight {

/**
 * @brief Looks up the language a region delegates its interior to.
 *
 * @param region The region.
 * @param registry Where to look, may be `nullptr`.
 * @return The nested language, or `nullptr` if the region has none or it
 * isn't loaded. Missing languages are reported when definitions are loaded.
 */
std::shared_ptr<const LanguageDefinition> ResolveNestedLanguage(const CompiledRegion &region, const LanguageRegistry *registry) {

	if (region.nestedLanguage.isEmpty() || !registry) {
		return nullptr;
	}

	return registry->definitionForName(region.nestedLanguage);
}

/**
 * @brief Styles the interior of a region. If the region was opened with a
 * nested language the interior is tokenized with that language's rules and
 * regions, otherwise it gets the region's own style.
 *
 * @param region The region.
 * @param frame The frame the region was opened with.
 * @param content The interior text on this line.
 * @param offset The position of `content` within the line.
 * @param nestedFrames The nested language's region state at the start of
 * `content`, updated to the state at its end.
 * @param registry Where further nested languages are looked up.
 * @param depth The nesting depth of the region's own language.
 * @param spans Receives the spans, in line coordinates.
 */
void ResolveInterior(const CompiledRegion &region, const RegionFrame &frame, const QString &content, int offset, std::vector<RegionFrame> *nestedFrames, const LanguageRegistry *registry, int depth, LineStyles *spans) {

	if (frame.nestedLanguage && depth < MAX_NESTING_DEPTH) {
		TokenizeSegment(*frame.nestedLanguage, content, offset, nestedFrames, registry, depth + 1, spans);
		return;
	}

	nestedFrames->clear();

	if (region.style) {
		AppendSpan(*region.style, offset, offset + gsl::narrow_cast<int>(content.size()), spans);
	}
}

}
