#pragma once

#include <string>
#include <string_view>

namespace astrogen {

// ` -> \`
[[nodiscard]] std::string escape_backticks(std::string_view text);

// ${ -> \${
[[nodiscard]] std::string escape_interpolation(std::string_view text);

// Doubles every backslash
[[nodiscard]] std::string escape_backslashes(std::string_view text);

// Text placed inside a template literal
[[nodiscard]] std::string escape_text(std::string_view text);

// Double-quoted JavaScript string literal
[[nodiscard]] std::string quote_js(std::string_view text);

// ' -> \' and doubles backslashes, for single-quoted string literals
[[nodiscard]] std::string escape_single_quote(std::string_view text);

// " -> &quot;
[[nodiscard]] std::string encode_double_quote(std::string_view text);

// Strips leading and trailing whitespace
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

}  // namespace astrogen
