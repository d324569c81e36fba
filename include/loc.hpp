#pragma once

#include <cstddef>
#include <optional>

namespace astrogen {

// Byte offset into the original source. An empty Loc marks generated code
// that has no counterpart in the source.
using Loc = std::optional<size_t>;

}  // namespace astrogen
