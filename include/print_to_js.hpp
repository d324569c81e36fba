#pragma once

#include "config.hpp"
#include "document.hpp"
#include "printer.hpp"

#include <string_view>

namespace astrogen {

// Compile a parsed component to a JavaScript module plus its source map
// chunk. source is the original component text the tree's locations point
// into. Client-only components in doc gain their resolved
// client:component-path and client:component-export attributes.
[[nodiscard]] PrintResult print_to_js(Document& doc, std::string_view source,
                                      const TransformOptions& opts,
                                      const RuntimeNames& names = {});

}  // namespace astrogen
