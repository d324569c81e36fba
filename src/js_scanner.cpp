#include "js_scanner.hpp"

#include <array>
#include <algorithm>
#include <cctype>

namespace astrogen::js_scanner {

namespace {

bool is_ident_start(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || c == '$' || u >= 0x80;
}

bool is_ident_part(char c) {
    return is_ident_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

// Keywords after which a '/' starts a regular expression rather than a division
bool precedes_expression(std::string_view word) {
    static constexpr std::array<std::string_view, 14> kKeywords = {
        "return", "typeof", "instanceof", "in", "of", "new", "delete",
        "void", "throw", "case", "do", "else", "yield", "await"
    };
    return std::find(kKeywords.begin(), kKeywords.end(), word) != kKeywords.end();
}

// Token-level cursor over JavaScript source. Every skip_* method is
// tolerant of unterminated constructs and stops at end of input.
class Lexer {
public:
    Lexer(std::string_view source, size_t pos) : src_(source), pos_(pos) {}

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= src_.size(); }
    [[nodiscard]] size_t pos() const noexcept { return pos_; }
    [[nodiscard]] char peek(size_t ahead = 0) const noexcept {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }
    void advance(size_t n = 1) noexcept { pos_ = std::min(pos_ + n, src_.size()); }

    void skip_trivia() {
        while (!at_end()) {
            char c = peek();
            if (std::isspace(static_cast<unsigned char>(c))) {
                advance();
            } else if (c == '/' && peek(1) == '/') {
                while (!at_end() && peek() != '\n') {
                    advance();
                }
            } else if (c == '/' && peek(1) == '*') {
                size_t close = src_.find("*/", pos_ + 2);
                pos_ = close == std::string_view::npos ? src_.size() : close + 2;
            } else {
                return;
            }
        }
    }

    std::string_view read_identifier() {
        size_t start = pos_;
        while (!at_end() && is_ident_part(peek())) {
            advance();
        }
        return src_.substr(start, pos_ - start);
    }

    void skip_number() {
        while (!at_end() && (is_ident_part(peek()) || peek() == '.')) {
            advance();
        }
    }

    // Reads a '...' or "..." literal; nullopt if it is unterminated
    std::optional<std::string> read_string() {
        char quote = peek();
        advance();
        std::string value;
        while (!at_end()) {
            char c = peek();
            if (c == quote) {
                advance();
                return value;
            }
            if (c == '\n') {
                return std::nullopt;
            }
            if (c == '\\') {
                advance();
                c = peek();
            }
            value += c;
            advance();
        }
        return std::nullopt;
    }

    void skip_string() {
        (void)read_string();
    }

    void skip_template() {
        advance();  // `
        while (!at_end()) {
            char c = peek();
            if (c == '\\') {
                advance(2);
            } else if (c == '`') {
                advance();
                return;
            } else if (c == '$' && peek(1) == '{') {
                advance(2);
                skip_balanced_braces();
            } else {
                advance();
            }
        }
    }

    void skip_regex() {
        advance();  // /
        bool in_class = false;
        while (!at_end()) {
            char c = peek();
            if (c == '\n') {
                return;
            }
            if (c == '\\') {
                advance(2);
                continue;
            }
            advance();
            if (c == '[') {
                in_class = true;
            } else if (c == ']') {
                in_class = false;
            } else if (c == '/' && !in_class) {
                read_identifier();  // flags
                return;
            }
        }
    }

    // Skip a balanced brace group whose opening brace was already consumed
    void skip_balanced_braces() {
        int depth = 1;
        while (!at_end()) {
            skip_trivia();
            char c = peek();
            if (c == '"' || c == '\'') {
                skip_string();
            } else if (c == '`') {
                skip_template();
            } else if (c == '{') {
                depth++;
                advance();
            } else if (c == '}') {
                advance();
                if (--depth == 0) {
                    return;
                }
            } else {
                advance();
            }
        }
    }

private:
    std::string_view src_;
    size_t pos_;
};

struct ParseOutcome {
    std::optional<ImportStatement> statement;
    size_t resume;  // where scanning continues when statement is empty
};

bool expect_word(Lexer& lex, std::string_view word) {
    lex.skip_trivia();
    if (!is_ident_start(lex.peek())) {
        return false;
    }
    return lex.read_identifier() == word;
}

// Parses `{ a, b as c, "x" as d, type T }`. Returns false on malformed input.
// Sets only_types when every specifier was a type-only one.
bool parse_named_imports(Lexer& lex, std::vector<ImportedName>& imports, bool& only_types) {
    lex.advance();  // {
    size_t seen = 0;
    size_t type_only = 0;
    while (true) {
        lex.skip_trivia();
        char c = lex.peek();
        if (c == '}') {
            lex.advance();
            break;
        }

        std::string export_name;
        if (c == '"' || c == '\'') {
            auto str = lex.read_string();
            if (!str) {
                return false;
            }
            export_name = std::move(*str);
        } else if (is_ident_start(c)) {
            export_name = std::string(lex.read_identifier());
        } else {
            return false;
        }

        lex.skip_trivia();
        bool is_type = false;
        std::string local_name = export_name;
        if (is_ident_start(lex.peek())) {
            std::string_view word = lex.read_identifier();
            if (export_name == "type" && word != "as") {
                // `type T` or `type T as U`
                is_type = true;
                export_name = std::string(word);
                local_name = export_name;
                lex.skip_trivia();
                if (is_ident_start(lex.peek())) {
                    if (lex.read_identifier() != "as") {
                        return false;
                    }
                    lex.skip_trivia();
                    if (!is_ident_start(lex.peek())) {
                        return false;
                    }
                    local_name = std::string(lex.read_identifier());
                }
            } else if (word == "as") {
                lex.skip_trivia();
                if (!is_ident_start(lex.peek())) {
                    return false;
                }
                local_name = std::string(lex.read_identifier());
            } else {
                return false;
            }
        }

        seen++;
        if (is_type) {
            type_only++;
        } else {
            imports.push_back({std::move(local_name), std::move(export_name)});
        }

        lex.skip_trivia();
        if (lex.peek() == ',') {
            lex.advance();
        } else if (lex.peek() != '}') {
            return false;
        }
    }
    only_types = seen > 0 && seen == type_only;
    return true;
}

// Consumes `from "specifier"` plus an optional import attribute clause and ';'
bool parse_from_clause(Lexer& lex, ImportStatement& stmt) {
    if (!expect_word(lex, "from")) {
        return false;
    }
    lex.skip_trivia();
    if (lex.peek() != '"' && lex.peek() != '\'') {
        return false;
    }
    auto specifier = lex.read_string();
    if (!specifier) {
        return false;
    }
    stmt.specifier = std::move(*specifier);
    return true;
}

void finish_statement(Lexer& lex, ImportStatement& stmt) {
    Lexer after = lex;
    after.skip_trivia();
    if (is_ident_start(after.peek())) {
        std::string_view word = after.read_identifier();
        after.skip_trivia();
        if ((word == "assert" || word == "with") && after.peek() == '{') {
            after.advance();
            after.skip_balanced_braces();
            lex = after;
        }
    }

    Lexer semi = lex;
    semi.skip_trivia();
    if (semi.peek() == ';') {
        semi.advance();
        lex = semi;
    }
    stmt.end = lex.pos();
}

// Reads a type-only import up to the end of its statement. Without a
// specifier it is not an import statement and scanning resumes after it.
ParseOutcome read_type_import(std::string_view source, size_t keyword_start, size_t pos) {
    ParseOutcome outcome{std::nullopt, pos};
    Lexer lex(source, pos);
    while (!lex.at_end()) {
        lex.skip_trivia();
        char c = lex.peek();
        if (c == '"' || c == '\'') {
            auto specifier = lex.read_string();
            if (!specifier) {
                outcome.resume = lex.pos();
                return outcome;
            }
            ImportStatement stmt;
            stmt.start = keyword_start;
            stmt.specifier = std::move(*specifier);
            stmt.type_only = true;
            finish_statement(lex, stmt);
            outcome.statement = std::move(stmt);
            return outcome;
        }
        if (c == ';') {
            lex.advance();
            break;
        }
        if (c == '{') {
            lex.advance();
            lex.skip_balanced_braces();
        } else {
            lex.advance();
        }
    }
    outcome.resume = lex.pos();
    return outcome;
}

ParseOutcome parse_import(std::string_view source, size_t keyword_start, size_t after_keyword) {
    ParseOutcome outcome{std::nullopt, after_keyword};
    Lexer lex(source, after_keyword);
    lex.skip_trivia();

    char c = lex.peek();
    // import(...) and import.meta are expressions, not statements
    if (lex.at_end() || c == '(' || c == '.') {
        return outcome;
    }

    ImportStatement stmt;
    stmt.start = keyword_start;

    if (c == '"' || c == '\'') {
        auto specifier = lex.read_string();
        if (!specifier) {
            return outcome;
        }
        stmt.specifier = std::move(*specifier);
        finish_statement(lex, stmt);
        outcome.statement = std::move(stmt);
        return outcome;
    }

    if (is_ident_start(c)) {
        size_t word_start = lex.pos();
        std::string_view word = lex.read_identifier();

        if (word == "type") {
            // `import type from "x"` imports a default binding named "type"
            Lexer probe = lex;
            bool default_named_type = expect_word(probe, "from");
            if (default_named_type) {
                probe.skip_trivia();
                default_named_type = probe.peek() == '"' || probe.peek() == '\'';
            }
            if (!default_named_type) {
                return read_type_import(source, keyword_start, word_start);
            }
        }

        stmt.imports.push_back({std::string(word), "default"});
        lex.skip_trivia();
        if (lex.peek() == ',') {
            lex.advance();
            lex.skip_trivia();
            c = lex.peek();
            if (c != '*' && c != '{') {
                return outcome;
            }
        } else {
            if (!parse_from_clause(lex, stmt)) {
                return outcome;
            }
            finish_statement(lex, stmt);
            outcome.statement = std::move(stmt);
            return outcome;
        }
    }

    c = lex.peek();
    if (c == '*') {
        lex.advance();
        if (!expect_word(lex, "as")) {
            return outcome;
        }
        lex.skip_trivia();
        if (!is_ident_start(lex.peek())) {
            return outcome;
        }
        stmt.imports.push_back({std::string(lex.read_identifier()), "*"});
    } else if (c == '{') {
        bool only_types = false;
        if (!parse_named_imports(lex, stmt.imports, only_types)) {
            return outcome;
        }
        if (only_types && stmt.imports.empty()) {
            return read_type_import(source, keyword_start, lex.pos());
        }
    } else {
        return outcome;
    }

    if (!parse_from_clause(lex, stmt)) {
        return outcome;
    }
    finish_statement(lex, stmt);
    outcome.statement = std::move(stmt);
    return outcome;
}

}  // namespace

std::optional<ImportStatement> next_import_statement(std::string_view source, size_t from) {
    Lexer lex(source, from);
    int depth = 0;
    bool after_value = false;  // a '/' here would be division
    bool after_dot = false;

    while (true) {
        lex.skip_trivia();
        if (lex.at_end()) {
            return std::nullopt;
        }

        char c = lex.peek();
        if (c == '"' || c == '\'') {
            lex.skip_string();
            after_value = true;
        } else if (c == '`') {
            lex.skip_template();
            after_value = true;
        } else if (c == '/') {
            if (after_value) {
                lex.advance();
                after_value = false;
            } else {
                lex.skip_regex();
                after_value = true;
            }
        } else if (c == '{' || c == '(' || c == '[') {
            depth++;
            lex.advance();
            after_value = false;
        } else if (c == '}' || c == ')' || c == ']') {
            if (depth > 0) {
                depth--;
            }
            lex.advance();
            after_value = c != '}';
        } else if (is_ident_start(c)) {
            size_t start = lex.pos();
            std::string_view word = lex.read_identifier();
            if (depth == 0 && !after_dot && word == "import") {
                ParseOutcome outcome = parse_import(source, start, lex.pos());
                if (outcome.statement) {
                    return outcome.statement;
                }
                lex = Lexer(source, outcome.resume);
                after_value = false;
                after_dot = false;
                continue;
            }
            after_value = !precedes_expression(word);
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            lex.skip_number();
            after_value = true;
        } else {
            lex.advance();
            after_value = false;
            after_dot = c == '.';
            continue;
        }
        after_dot = false;
    }
}

size_t find_render_body(std::string_view source) {
    size_t body = 0;
    auto statement = next_import_statement(source, 0);
    while (statement) {
        body = statement->end;
        statement = next_import_statement(source, statement->end);
    }
    return body;
}

}  // namespace astrogen::js_scanner
