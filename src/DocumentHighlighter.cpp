
#include "DocumentHighlighter.h"
#include "LanguageDefinition.h"
#include "LineTokenizer.h"

#include <QtDebug>

#include <gsl/gsl>

#include <algorithm>
#include <cstdint>

/**
 * @brief Constructor for the DocumentHighlighter class.
 *
 * @param registry Where nested languages are looked up, may be `nullptr`.
 */
DocumentHighlighter::DocumentHighlighter(const LanguageRegistry *registry)
	: registry_(registry) {
}

/**
 * @brief Changes the language of the document. Every cached state is
 * discarded.
 *
 * @param language The language, `nullptr` for plain text.
 */
void DocumentHighlighter::setLanguage(std::shared_ptr<const LanguageDefinition> language) {
	language_ = std::move(language);
	resetStates();
	++revision_;
}

/**
 * @brief Replaces the whole text of the document. Every cached state is
 * discarded.
 *
 * @param lines The lines of the document, without terminators.
 */
void DocumentHighlighter::setText(const QStringList &lines) {
	lines_ = lines;
	resetStates();
	++revision_;
}

/**
 * @brief Applies an edit. The states of the lines after the edit are kept as
 * they were, so that recomputing can stop at the first of them that comes
 * out unchanged. The states up to and including `first` stay trusted.
 *
 * @param first The first line replaced.
 * @param removed The number of lines removed starting at `first`.
 * @param inserted The lines inserted in their place.
 */
void DocumentHighlighter::replaceLines(int first, int removed, const QStringList &inserted) {

	const int oldCount = lineCount();

	first   = std::clamp(first, 0, oldCount);
	removed = std::clamp(removed, 0, oldCount - first);

	const int k        = gsl::narrow_cast<int>(inserted.size());
	const int newCount = oldCount - removed + k;

	// new line `first + k` is old line `first + removed`
	const int edited = first + std::max(k, 1);

	std::vector<CachedState> states;
	states.reserve(static_cast<size_t>(newCount));

	const int keep = std::min({first + 1, oldCount, newCount});
	states.insert(states.end(), states_.begin(), states_.begin() + keep);

	while (gsl::narrow_cast<int>(states.size()) < std::min(first + k, newCount)) {
		states.emplace_back();
	}

	const int tail = gsl::narrow_cast<int>(states.size()) - k + removed;
	if (tail < oldCount) {
		states.insert(states.end(), states_.begin() + tail, states_.end());
	}

	while (gsl::narrow_cast<int>(states.size()) < newCount) {
		states.emplace_back();
	}

	if (edited < newCount) {
		states[static_cast<size_t>(edited)].linked = false;
	}

	states_ = std::move(states);

	for (int i = 0; i < removed; ++i) {
		lines_.removeAt(first);
	}

	for (int i = 0; i < k; ++i) {
		lines_.insert(first + i, inserted[i]);
	}

	trusted_ = std::min(trusted_, keep);
	if (trusted_ == 0 && newCount > 0) {
		states_[0] = CachedState{LineRegionState(), true};
		trusted_   = 1;
	}

	++revision_;
}

/**
 * @brief Sets the number of lines the first step of a pass extends the
 * trusted lines by.
 *
 * @param lines The number of lines, clamped to [1, MAX_REPARSE_CHUNK_SIZE].
 */
void DocumentHighlighter::setReparseChunkSize(int lines) {
	reparseChunkSize_ = std::clamp(lines, 1, MAX_REPARSE_CHUNK_SIZE);
}

/**
 * @brief Recomputes line states until at least `upTo` lines are trusted.
 * States are committed line by line, so work done before a cancellation is
 * kept; it is exact for the current text.
 *
 * @param upTo The number of lines that must be trusted.
 * @param cancelled Checked before each line, may be empty.
 * @return `false` if the work was cancelled.
 */
bool DocumentHighlighter::ensureTrusted(int upTo, const CancelCheck &cancelled) {

	const int count = lineCount();
	upTo            = std::min(upTo, count);

	while (trusted_ < upTo) {

		if (cancelled && cancelled()) {
			return false;
		}

		const auto prev = static_cast<size_t>(trusted_ - 1);
		const auto next = static_cast<size_t>(trusted_);

		LineRegionState state = Highlight::TokenizeLine(language_.get(), lines_[trusted_ - 1], states_[prev].state, registry_).endState;

		if (states_[next].state == state) {
			// converged, the states linked to this one are still good
			states_[next].linked = true;
			++trusted_;
			while (trusted_ < count && states_[static_cast<size_t>(trusted_)].linked) {
				++trusted_;
			}
		} else {
			states_[next].state  = std::move(state);
			states_[next].linked = true;
			if (next + 1 < states_.size()) {
				states_[next + 1].linked = false;
			}
			++trusted_;
		}
	}

	return true;
}

/**
 * @brief Gets the region state at the start of a line.
 *
 * @param line The line index.
 * @return The state, plain for a line that doesn't exist.
 */
LineRegionState DocumentHighlighter::lineState(int line) {

	if (line < 0 || line >= lineCount()) {
		return LineRegionState();
	}

	ensureTrusted(line + 1);
	return states_[static_cast<size_t>(line)].state;
}

/**
 * @brief Gets the spans of a line.
 *
 * @param line The line index.
 * @return The spans, empty for a line that doesn't exist.
 */
LineStyles DocumentHighlighter::lineSpans(int line) {

	if (line < 0 || line >= lineCount()) {
		return LineStyles();
	}

	ensureTrusted(line + 1);
	return Highlight::TokenizeLine(language_.get(), lines_[line], states_[static_cast<size_t>(line)].state, registry_).spans;
}

/**
 * @brief Gets the spans of a range of lines.
 *
 * @param first The first line.
 * @param count The number of lines; the range is clipped to the document.
 * @param cancelled Checked before each line, may be empty.
 * @return The spans of each line, or an empty optional if the work was
 * cancelled.
 */
std::optional<std::vector<LineStyles>> DocumentHighlighter::styleLines(int first, int count, const CancelCheck &cancelled) {

	first    = std::clamp(first, 0, lineCount());
	count    = std::clamp(count, 0, lineCount() - first);
	const int last = first + count;

	if (!ensureTrusted(last, cancelled)) {
		return {};
	}

	std::vector<LineStyles> result;
	result.reserve(static_cast<size_t>(count));

	for (int i = first; i < last; ++i) {
		if (cancelled && cancelled()) {
			return {};
		}

		result.push_back(Highlight::TokenizeLine(language_.get(), lines_[i], states_[static_cast<size_t>(i)].state, registry_).spans);
	}

	return result;
}

/**
 * @brief Starts an incremental pass over a range of lines. The document must
 * outlive the pass.
 *
 * @param first The first line.
 * @param count The number of lines.
 * @return The pass.
 */
HighlightPass DocumentHighlighter::beginPass(int first, int count) {
	return HighlightPass(this, first, count);
}

std::shared_ptr<const LanguageDefinition> DocumentHighlighter::language() const {
	return language_;
}

const QStringList &DocumentHighlighter::lines() const {
	return lines_;
}

int DocumentHighlighter::lineCount() const {
	return gsl::narrow_cast<int>(lines_.size());
}

int DocumentHighlighter::trustedLines() const {
	return trusted_;
}

int DocumentHighlighter::reparseChunkSize() const {
	return reparseChunkSize_;
}

uint64_t DocumentHighlighter::revision() const {
	return revision_;
}

void DocumentHighlighter::resetStates() {

	states_.assign(static_cast<size_t>(lines_.size()), CachedState());
	trusted_ = std::min(lineCount(), 1);

	if (trusted_ != 0) {
		states_[0].linked = true;
	}
}

/**
 * @brief Constructor for the HighlightPass class.
 *
 * @param document The document to style.
 * @param first The first line of the range wanted first.
 * @param count The number of lines of that range.
 */
HighlightPass::HighlightPass(DocumentHighlighter *document, int first, int count)
	: document_(document), revision_(document->revision()), first_(first), count_(count) {
}

/**
 * @brief Does the next chunk of work.
 *
 * @return `true` if there is more work to do.
 */
bool HighlightPass::step() {

	if (isStale()) {
		return false;
	}

	// computed wide, the doubled chunk can exceed an int
	const int64_t chunk   = static_cast<int64_t>(document_->reparseChunkSize()) << std::min(steps_, 20);
	const int64_t trusted = document_->trustedLines();
	++steps_;

	if (!styled_) {
		const int end    = static_cast<int>(std::clamp<int64_t>(static_cast<int64_t>(first_) + count_, 0, document_->lineCount()));
		const int target = static_cast<int>(std::min<int64_t>(end, trusted + chunk));
		document_->ensureTrusted(target);

		if (document_->trustedLines() >= end) {
			results_ = document_->styleLines(first_, count_);
			styled_  = true;
		}
	} else {
		document_->ensureTrusted(static_cast<int>(std::min<int64_t>(document_->lineCount(), trusted + chunk)));
	}

	return !isFinished();
}

bool HighlightPass::isStale() const {
	return document_->revision() != revision_;
}

/**
 * @brief Check if the pass is done: the range is styled and every line of
 * the document is trusted.
 *
 * @return `true` if nothing is left to do, including when the pass is stale.
 */
bool HighlightPass::isFinished() const {
	return isStale() || (styled_ && document_->trustedLines() == document_->lineCount());
}

bool HighlightPass::hasResults() const {
	return !isStale() && results_.has_value();
}

/**
 * @brief Takes the spans of the requested range. They can be taken once.
 *
 * @return The spans of each line of the range, or an empty optional if the
 * range isn't styled yet, was already taken or the pass is stale.
 */
std::optional<std::vector<LineStyles>> HighlightPass::takeResults() {

	if (!hasResults()) {
		return {};
	}

	std::optional<std::vector<LineStyles>> results = std::move(results_);
	results_.reset();
	return results;
}
