
#include "LineTokenizer.h"
#include "LanguageDefinition.h"
#include "NestedLanguage.h"

#include <QtDebug>

#include <gsl/gsl>

#include <algorithm>
#include <optional>
#include <utility>

namespace Highlight {

namespace {

// Half-open [start, end) ranges consumed by single-line matches, sorted and
// non-overlapping
using ClaimList = std::vector<std::pair<int, int>>;

int Length(const QString &text) {
	return gsl::narrow_cast<int>(text.size());
}

/**
 * @brief Gets the offset of the character after the one at `pos`, stepping
 * over both halves of a surrogate pair.
 */
int NextCharacter(const QString &text, int pos) {
	if (pos + 1 < Length(text) && text[pos].isHighSurrogate() && text[pos + 1].isLowSurrogate()) {
		return pos + 2;
	}

	return pos + 1;
}

struct RegionStart {
	size_t region;
	MatchRange match;
};

/**
 * @brief Check if a range overlaps none of the claimed ranges.
 *
 * @param claimed The claimed ranges.
 * @param start The start of the range.
 * @param end The end of the range.
 * @return `true` if the range is unclaimed.
 */
bool IsUnclaimed(const ClaimList &claimed, int start, int end) {

	// the first claimed range ending after `start` is the only candidate
	auto it = std::lower_bound(claimed.begin(), claimed.end(), start, [](const std::pair<int, int> &range, int pos) {
		return range.second <= pos;
	});

	return it == claimed.end() || it->first >= end;
}

void Claim(ClaimList *claimed, int start, int end) {

	auto it = std::lower_bound(claimed->begin(), claimed->end(), std::make_pair(start, end));
	claimed->insert(it, std::make_pair(start, end));
}

/**
 * @brief Applies single-line rules to a part of a segment. Rules are tried
 * in order, each collecting all of its own non-overlapping matches; a match
 * is kept only if no earlier match claimed any part of it.
 *
 * @param rules The rules, in priority order.
 * @param text The segment text.
 * @param from Where the part begins within `text`.
 * @param to Where the part ends within `text`; matches never extend past it.
 * @param offset The position of `text` within the line.
 * @param spans Receives the spans, in line coordinates.
 */
void ApplyRules(const std::vector<CompiledRule> &rules, const QString &text, int from, int to, int offset, LineStyles *spans) {

	if (from >= to) {
		return;
	}

	const QString subject = (to == Length(text)) ? text : text.left(to);

	ClaimList claimed;
	LineStyles found;

	for (const CompiledRule &rule : rules) {
		int pos = from;
		while (std::optional<MatchRange> m = rule.matcher.match(subject, pos)) {

			if (m->isEmpty()) {
				// zero-width matches style nothing, step over them
				pos = NextCharacter(text, m->start);
				continue;
			}

			if (IsUnclaimed(claimed, m->start, m->end)) {
				Claim(&claimed, m->start, m->end);

				// the whole match is consumed even if its group styles nothing
				if (m->hasGroup()) {
					found.push_back(StyledSpan{offset + m->groupStart, offset + m->groupEnd, rule.style});
				}
			}

			pos = m->end;
		}
	}

	std::sort(found.begin(), found.end(), [](const StyledSpan &lhs, const StyledSpan &rhs) {
		return lhs.start < rhs.start;
	});

	spans->insert(spans->end(), found.begin(), found.end());
}

/**
 * @brief Finds the region start that comes first at or after `pos`. Zero
 * width start matches are skipped.
 *
 * @param language The language whose regions are searched.
 * @param text The segment text.
 * @param pos Where to begin searching.
 * @return The region and where its start delimiter matched, or an empty
 * optional if no region starts in the rest of the text.
 */
std::optional<RegionStart> FindRegionStart(const LanguageDefinition &language, const QString &text, int pos) {

	std::optional<RegionStart> best;

	for (size_t i = 0; i < language.regions.size(); ++i) {
		int from = pos;
		while (std::optional<MatchRange> m = language.regions[i].startRE.match(text, from)) {

			// ties go to the region declared first
			if (best && m->start >= best->match.start) {
				break;
			}

			if (!m->isEmpty()) {
				best = RegionStart{i, *m};
				break;
			}

			from = NextCharacter(text, m->start);
		}
	}

	return best;
}

RegionFrame OpenRegion(const LanguageDefinition &language, size_t index, const LanguageRegistry *registry, int depth) {

	RegionFrame frame;
	frame.region = index;

	if (depth < MAX_NESTING_DEPTH) {
		frame.nestedLanguage = ResolveNestedLanguage(language.regions[index], registry);
	}

	return frame;
}

/**
 * @brief Styles the open region of `frames` from `pos` up to its end
 * delimiter, or to the end of the text if the region doesn't end.
 *
 * @param language The language owning the region.
 * @param text The segment text.
 * @param delimiterStart Where the start delimiter begins, equal to `pos` when
 * the region was already open at the start of the text.
 * @param pos Where the region's interior begins.
 * @param offset The position of `text` within the line.
 * @param frames The open region followed by the state of its nested
 * language. Cleared when the region ends.
 * @param registry Where nested languages are looked up.
 * @param depth The current nesting depth.
 * @param spans Receives the spans, in line coordinates.
 * @return The position where normal tokenizing resumes.
 */
int ContinueRegion(const LanguageDefinition &language, const QString &text, int delimiterStart, int pos, int offset, std::vector<RegionFrame> *frames, const LanguageRegistry *registry, int depth, LineStyles *spans) {

	const RegionFrame frame = frames->front();

	if (frame.region >= language.regions.size()) {
		qCritical("hilite: region state %d is not valid for %s, resetting", static_cast<int>(frame.region), qPrintable(language.name));
		frames->clear();
		return pos;
	}

	const CompiledRegion &region = language.regions[frame.region];

	if (region.style) {
		AppendSpan(*region.style, offset + delimiterStart, offset + pos, spans);
	}

	std::vector<RegionFrame> inner(frames->begin() + 1, frames->end());

	const std::optional<MatchRange> end = region.endRE.match(text, pos);
	const int interiorEnd                = end ? end->start : Length(text);

	ResolveInterior(region, frame, text.mid(pos, interiorEnd - pos), offset + pos, &inner, registry, depth, spans);

	if (!end) {
		frames->assign(1, frame);
		frames->insert(frames->end(), inner.begin(), inner.end());
		return Length(text);
	}

	if (region.style) {
		AppendSpan(*region.style, offset + end->start, offset + end->end, spans);
	}

	frames->clear();
	return end->end;
}

}

/**
 * @brief Appends a span, extending the last one instead if it has the same
 * style and ends where the new one starts. Empty spans are ignored.
 *
 * @param style The style of the span.
 * @param start The start of the span.
 * @param end The end of the span.
 * @param spans The spans of the line so far.
 */
void AppendSpan(const HighlightStyle &style, int start, int end, LineStyles *spans) {

	if (start >= end) {
		return;
	}

	if (!spans->empty() && spans->back().end == start && spans->back().style == style) {
		spans->back().end = end;
		return;
	}

	spans->push_back(StyledSpan{start, end, style});
}

/**
 * @brief Tokenizes a piece of text with one language: the whole line, or the
 * interior of a region that delegates to a nested language.
 *
 * @param language The language to tokenize with.
 * @param text The text.
 * @param offset The position of `text` within the line.
 * @param frames The region state at the start of the text, updated to the
 * state at its end.
 * @param registry Where nested languages are looked up, may be `nullptr`.
 * @param depth The current nesting depth, 0 for the document's language.
 * @param spans Receives the spans, in line coordinates.
 */
void TokenizeSegment(const LanguageDefinition &language, const QString &text, int offset, std::vector<RegionFrame> *frames, const LanguageRegistry *registry, int depth, LineStyles *spans) {

	int pos = 0;

	if (!frames->empty()) {
		pos = ContinueRegion(language, text, 0, 0, offset, frames, registry, depth, spans);
		if (!frames->empty()) {
			return;
		}
	}

	const int length = Length(text);

	while (pos < length) {

		const std::optional<RegionStart> start = FindRegionStart(language, text, pos);
		if (!start) {
			ApplyRules(language.rules, text, pos, length, offset, spans);
			return;
		}

		ApplyRules(language.rules, text, pos, start->match.start, offset, spans);

		frames->assign(1, OpenRegion(language, start->region, registry, depth));
		pos = ContinueRegion(language, text, start->match.start, start->match.end, offset, frames, registry, depth, spans);
		if (!frames->empty()) {
			return;
		}
	}
}

/**
 * @brief Computes the spans of a line.
 *
 * @param language The language of the document, `nullptr` for plain text.
 * @param line The text of the line, without its terminator.
 * @param state The region state at the start of the line.
 * @param registry Where nested languages are looked up, may be `nullptr`.
 * @return The sorted, non-overlapping spans and the state at the end of the
 * line.
 */
LineResult TokenizeLine(const LanguageDefinition *language, const QString &line, const LineRegionState &state, const LanguageRegistry *registry) {

	LineResult result;
	if (!language) {
		return result;
	}

	result.endState = state;
	TokenizeSegment(*language, line, 0, &result.endState.frames, registry, 0, &result.spans);
	return result;
}

/**
 * @brief Applies single-line rules alone to a line, as if no region existed.
 *
 * @param rules The rules, in priority order.
 * @param line The text of the line.
 * @return The sorted, non-overlapping spans.
 */
LineStyles TokenizeRules(const std::vector<CompiledRule> &rules, const QString &line) {
	LineStyles spans;
	ApplyRules(rules, line, 0, Length(line), 0, &spans);
	return spans;
}

/**
 * @brief Computes the region state at the start of every line by scanning
 * the document from the top.
 *
 * @param lines The lines of the document.
 * @param language The language of the document, `nullptr` for plain text.
 * @param registry Where nested languages are looked up, may be `nullptr`.
 * @return One state per line.
 */
std::vector<LineRegionState> ComputeLineStates(const QStringList &lines, const LanguageDefinition *language, const LanguageRegistry *registry) {

	std::vector<LineRegionState> states;
	states.reserve(static_cast<size_t>(lines.size()));

	LineRegionState state;
	for (const QString &line : lines) {
		states.push_back(state);
		state = TokenizeLine(language, line, state, registry).endState;
	}

	return states;
}

}
