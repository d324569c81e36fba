#include "escape.hpp"

namespace astrogen {

namespace {

std::string replace_all(std::string_view text, std::string_view from, std::string_view to) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (true) {
        size_t found = text.find(from, pos);
        if (found == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, found - pos));
        out.append(to);
        pos = found + from.size();
    }
    return out;
}

}  // namespace

std::string escape_backticks(std::string_view text) {
    return replace_all(text, "`", "\\`");
}

std::string escape_interpolation(std::string_view text) {
    return replace_all(text, "${", "\\${");
}

std::string escape_backslashes(std::string_view text) {
    return replace_all(text, "\\", "\\\\");
}

std::string escape_text(std::string_view text) {
    return escape_interpolation(escape_backticks(escape_backslashes(text)));
}

std::string quote_js(std::string_view text) {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default: out += c; break;
        }
    }
    out += '"';
    return out;
}

std::string escape_single_quote(std::string_view text) {
    return replace_all(escape_backslashes(text), "'", "\\'");
}

std::string encode_double_quote(std::string_view text) {
    return replace_all(text, "\"", "&quot;");
}

std::string_view trim(std::string_view text) noexcept {
    constexpr std::string_view kSpace = " \t\n\r\f\v";
    size_t start = text.find_first_not_of(kSpace);
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = text.find_last_not_of(kSpace);
    return text.substr(start, end - start + 1);
}

}  // namespace astrogen
