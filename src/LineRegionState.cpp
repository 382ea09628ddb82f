
#include "LineRegionState.h"

/**
 * @brief Check if the line starts outside of any region.
 *
 * @return `true` if no region is open.
 */
bool LineRegionState::isPlain() const {
	return frames.empty();
}

/**
 * @brief Get the index of the region open at the start of the line.
 *
 * @return The region index, or NO_REGION.
 */
size_t LineRegionState::activeRegion() const {
	return frames.empty() ? NO_REGION : frames.front().region;
}

/**
 * @brief Get the nested language the open region delegates to.
 *
 * @return The nested language, or `nullptr` if no region is open or the
 * region is styled flatly.
 */
std::shared_ptr<const LanguageDefinition> LineRegionState::activeNestedLanguage() const {
	return frames.empty() ? nullptr : frames.front().nestedLanguage;
}

/**
 * @brief Get the region state of the nested language at the start of the
 * line.
 *
 * @return The nested language's state, plain if there is none.
 */
LineRegionState LineRegionState::nestedState() const {

	LineRegionState state;
	if (frames.size() > 1) {
		state.frames.assign(frames.begin() + 1, frames.end());
	}

	return state;
}

bool LineRegionState::operator==(const LineRegionState &rhs) const {
	return frames == rhs.frames;
}

bool LineRegionState::operator!=(const LineRegionState &rhs) const {
	return !(*this == rhs);
}
