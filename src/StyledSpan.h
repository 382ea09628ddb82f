
#ifndef STYLED_SPAN_H_
#define STYLED_SPAN_H_

#include "HighlightStyle.h"

#include <vector>

// Half-open range [start, end) of UTF-16 code units within one line
struct StyledSpan {
	int start = 0;
	int end   = 0;
	HighlightStyle style;

	int length() const {
		return end - start;
	}

	bool operator==(const StyledSpan &rhs) const {
		return start == rhs.start && end == rhs.end && style == rhs.style;
	}

	bool operator!=(const StyledSpan &rhs) const {
		return !(*this == rhs);
	}
};

// The spans of one line, sorted by start and non-overlapping
using LineStyles = std::vector<StyledSpan>;

#endif
