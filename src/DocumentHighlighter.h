
#ifndef DOCUMENT_HIGHLIGHTER_H_
#define DOCUMENT_HIGHLIGHTER_H_

#include "Highlight.h"
#include "LineRegionState.h"
#include "StyledSpan.h"

#include <QStringList>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

class LanguageDefinition;
class LanguageRegistry;
class HighlightPass;

// Returns true once the work in progress is no longer wanted
using CancelCheck = std::function<bool()>;

// The highlighting session of one open document. Keeps the region state at
// the start of every line and recomputes it lazily after edits, stopping as
// soon as a recomputed state matches the one cached before the edit.
class DocumentHighlighter {
public:
	explicit DocumentHighlighter(const LanguageRegistry *registry);
	DocumentHighlighter(const DocumentHighlighter &)            = delete;
	DocumentHighlighter &operator=(const DocumentHighlighter &) = delete;
	~DocumentHighlighter()                                      = default;

public:
	void setLanguage(std::shared_ptr<const LanguageDefinition> language);
	void setText(const QStringList &lines);
	void replaceLines(int first, int removed, const QStringList &inserted);
	void setReparseChunkSize(int lines);

public:
	LineRegionState lineState(int line);
	LineStyles lineSpans(int line);
	std::optional<std::vector<LineStyles>> styleLines(int first, int count, const CancelCheck &cancelled = CancelCheck());
	bool ensureTrusted(int upTo, const CancelCheck &cancelled = CancelCheck());
	HighlightPass beginPass(int first, int count);

public:
	std::shared_ptr<const LanguageDefinition> language() const;
	const QStringList &lines() const;
	int lineCount() const;
	int trustedLines() const;
	int reparseChunkSize() const;
	uint64_t revision() const;

private:
	void resetStates();

private:
	// The state at the start of a line. `linked` is set while the state is
	// known to follow from the state and text of the line before it.
	struct CachedState {
		LineRegionState state;
		bool linked = false;
	};

private:
	const LanguageRegistry *registry_;
	std::shared_ptr<const LanguageDefinition> language_;
	QStringList lines_;
	std::vector<CachedState> states_;
	int trusted_          = 0;
	int reparseChunkSize_ = REPARSE_CHUNK_SIZE;
	uint64_t revision_    = 0;
};

// Incremental styling of a range of lines. Each step does a bounded amount
// of work: first up to the requested range, then onwards to the end of the
// document, with the amount doubling on every step. A pass becomes stale
// once its document is edited and does nothing from then on.
class HighlightPass {
public:
	HighlightPass(DocumentHighlighter *document, int first, int count);

public:
	bool step();
	bool isStale() const;
	bool isFinished() const;
	bool hasResults() const;
	std::optional<std::vector<LineStyles>> takeResults();

private:
	DocumentHighlighter *document_;
	uint64_t revision_;
	int first_;
	int count_;
	int steps_   = 0;
	bool styled_ = false;
	std::optional<std::vector<LineStyles>> results_;
};

#endif
