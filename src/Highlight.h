
#ifndef HIGHLIGHT_H_
#define HIGHLIGHT_H_

#include "Util/QtHelper.h"

#include <cstddef>

// Region index meaning "no region is open"
constexpr auto NO_REGION = static_cast<size_t>(-1);

// Limit on nested-language delegation, so that definitions which nest each
// other degrade to flat region styling
constexpr int MAX_NESTING_DEPTH = 8;

/* Initial forward expansion of background parsing, in lines. This distance
   is increased by a factor of two for each subsequent step. */
constexpr int REPARSE_CHUNK_SIZE = 80;

// Largest accepted initial expansion, in lines
constexpr int MAX_REPARSE_CHUNK_SIZE = 1 << 20;

namespace Highlight {
Q_DECLARE_NAMESPACE_TR(Highlight)
}

#endif
