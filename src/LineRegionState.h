
#ifndef LINE_REGION_STATE_H_
#define LINE_REGION_STATE_H_

#include "Highlight.h"

#include <memory>
#include <vector>

class LanguageDefinition;

// A region open at a line boundary. When the region delegates to a nested
// language, the language it resolved to is kept alongside.
struct RegionFrame {
	size_t region = NO_REGION;
	std::shared_ptr<const LanguageDefinition> nestedLanguage;

	bool operator==(const RegionFrame &rhs) const {
		return region == rhs.region && nestedLanguage == rhs.nestedLanguage;
	}

	bool operator!=(const RegionFrame &rhs) const {
		return !(*this == rhs);
	}
};

// The region state at the start of a line. The first frame is the open
// region of the document's language, each further frame the open region of
// the nested language of the frame before it.
class LineRegionState {
public:
	bool isPlain() const;
	size_t activeRegion() const;
	std::shared_ptr<const LanguageDefinition> activeNestedLanguage() const;
	LineRegionState nestedState() const;

public:
	bool operator==(const LineRegionState &rhs) const;
	bool operator!=(const LineRegionState &rhs) const;

public:
	std::vector<RegionFrame> frames;
};

#endif
