#include "source_map.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace astrogen::sourcemap {

namespace {

constexpr std::string_view kBase64 =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Byte length and UTF-16 width of the UTF-8 sequence starting with lead
struct CharWidth {
    size_t bytes;
    int units;
};

CharWidth char_width(unsigned char lead) {
    if (lead < 0x80) return {1, 1};
    if (lead < 0xC0) return {1, 0};  // stray continuation byte
    if (lead < 0xE0) return {2, 1};
    if (lead < 0xF0) return {3, 1};
    return {4, 2};
}

// Length of the line terminator at text[i], or 0 if there is none.
// "\r\n" reports 0 at the '\r' so the pair ends a single line.
size_t line_terminator(std::string_view text, size_t i) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    if (c == '\n') {
        return 1;
    }
    if (c == '\r') {
        return (i + 1 < text.size() && text[i + 1] == '\n') ? 0 : 1;
    }
    // U+2028 LINE SEPARATOR, U+2029 PARAGRAPH SEPARATOR
    if (c == 0xE2 && i + 2 < text.size() &&
        static_cast<unsigned char>(text[i + 1]) == 0x80 &&
        (static_cast<unsigned char>(text[i + 2]) == 0xA8 ||
         static_cast<unsigned char>(text[i + 2]) == 0xA9)) {
        return 3;
    }
    return 0;
}

}  // namespace

// ============================================================================
// LineOffsetTable implementation
// ============================================================================

LineOffsetTable::LineOffsetTable(std::string_view source) : source_(source) {
    line_starts_.push_back(0);
    for (size_t i = 0; i < source_.size(); i++) {
        size_t len = line_terminator(source_, i);
        if (len > 0) {
            line_starts_.push_back(i + len);
            i += len - 1;
        }
    }
}

LineColumn LineOffsetTable::locate(size_t offset) const {
    offset = std::min(offset, source_.size());

    auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    size_t line = static_cast<size_t>(it - line_starts_.begin()) - 1;

    int column = 0;
    for (size_t i = line_starts_[line]; i < offset;) {
        CharWidth w = char_width(static_cast<unsigned char>(source_[i]));
        column += w.units;
        i += w.bytes;
    }
    return {static_cast<int>(line), column};
}

// ============================================================================
// ChunkBuilder implementation
// ============================================================================

ChunkBuilder::ChunkBuilder(std::string_view source) : line_offsets_(source) {}

void ChunkBuilder::add_source_mapping(Loc loc, std::string_view output) {
    if (has_prev_loc_ && loc == prev_loc_) {
        return;
    }
    prev_loc_ = loc;
    has_prev_loc_ = true;

    update_generated_line_and_column(output);

    Mapping mapping;
    mapping.generated_line = generated_line_;
    mapping.generated_column = generated_column_;
    mapping.original = loc;
    if (loc) {
        LineColumn original = line_offsets_.locate(*loc);
        mapping.original_line = original.line;
        mapping.original_column = original.column;
    }
    append_mapping(mapping);
}

void ChunkBuilder::update_generated_line_and_column(std::string_view output) {
    size_t i = last_generated_update_;
    while (i < output.size()) {
        size_t newline = line_terminator(output, i);
        if (newline > 0) {
            generated_line_++;
            generated_column_ = 0;
            prev_state_.generated_line = generated_line_;
            prev_state_.generated_column = 0;
            buffer_ += ';';
            i += newline;
            continue;
        }
        if (output[i] == '\r') {
            // first half of "\r\n"
            i++;
            continue;
        }
        CharWidth w = char_width(static_cast<unsigned char>(output[i]));
        generated_column_ += w.units;
        i += w.bytes;
    }
    last_generated_update_ = output.size();
}

void ChunkBuilder::append_mapping(const Mapping& mapping) {
    // Put commas in between mappings on the same line
    if (!buffer_.empty() && buffer_.back() != ';') {
        buffer_ += ',';
    }

    encode_vlq(buffer_, mapping.generated_column - prev_state_.generated_column);
    prev_state_.generated_column = mapping.generated_column;

    // A segment holding only the generated column has no original position
    if (mapping.original) {
        encode_vlq(buffer_, 0 - prev_state_.source_index);
        encode_vlq(buffer_, mapping.original_line - prev_state_.original_line);
        encode_vlq(buffer_, mapping.original_column - prev_state_.original_column);
        prev_state_.original_line = mapping.original_line;
        prev_state_.original_column = mapping.original_column;
    }

    mappings_.push_back(mapping);
}

Chunk ChunkBuilder::generate_chunk(std::string_view output) {
    update_generated_line_and_column(output);

    Chunk chunk;
    chunk.mappings = mappings_;
    chunk.buffer = buffer_;
    chunk.end_state = prev_state_;
    chunk.final_generated_column = generated_column_;
    chunk.should_ignore = std::none_of(mappings_.begin(), mappings_.end(),
                                       [](const Mapping& m) { return m.original.has_value(); });
    return chunk;
}

// ============================================================================
// Encoding helpers
// ============================================================================

void encode_vlq(std::string& buffer, int value) {
    // Sign goes in the lowest bit
    unsigned int vlq = value < 0
        ? (static_cast<unsigned int>(-static_cast<long long>(value)) << 1) | 1u
        : static_cast<unsigned int>(value) << 1;

    do {
        unsigned int digit = vlq & 31u;
        vlq >>= 5;
        if (vlq != 0) {
            digit |= 32u;
        }
        buffer += kBase64[digit];
    } while (vlq != 0);
}

std::string encode_base64(std::string_view bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        uint32_t n = (static_cast<uint32_t>(static_cast<unsigned char>(bytes[i])) << 16) |
                     (static_cast<uint32_t>(static_cast<unsigned char>(bytes[i + 1])) << 8) |
                     static_cast<uint32_t>(static_cast<unsigned char>(bytes[i + 2]));
        out += kBase64[(n >> 18) & 63];
        out += kBase64[(n >> 12) & 63];
        out += kBase64[(n >> 6) & 63];
        out += kBase64[n & 63];
    }

    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint32_t>(static_cast<unsigned char>(bytes[i])) << 16;
        out += kBase64[(n >> 18) & 63];
        out += kBase64[(n >> 12) & 63];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint32_t>(static_cast<unsigned char>(bytes[i])) << 16) |
                     (static_cast<uint32_t>(static_cast<unsigned char>(bytes[i + 1])) << 8);
        out += kBase64[(n >> 18) & 63];
        out += kBase64[(n >> 12) & 63];
        out += kBase64[(n >> 6) & 63];
        out += '=';
    }
    return out;
}

std::string quote_for_json(std::string_view text) {
    std::ostringstream oss;
    oss << '"';
    for (size_t i = 0; i < text.size(); i++) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else if (line_terminator(text, i) == 3) {
                    // U+2028 and U+2029 are not valid inside JS string literals
                    oss << (static_cast<unsigned char>(text[i + 2]) == 0xA8 ? "\\u2028" : "\\u2029");
                    i += 2;
                } else {
                    oss << text[i];
                }
        }
    }
    oss << '"';
    return oss.str();
}

std::string to_json(const Chunk& chunk, std::string_view filename, std::string_view source) {
    std::ostringstream json;
    json << "{\"version\":3"
         << ",\"sources\":[" << quote_for_json(filename) << "]"
         << ",\"sourcesContent\":[" << quote_for_json(source) << "]"
         << ",\"mappings\":" << quote_for_json(chunk.buffer)
         << ",\"names\":[]}";
    return json.str();
}

std::string to_inline_comment(std::string_view json) {
    return "//# sourceMappingURL=data:application/json;charset=utf-8;base64," +
           encode_base64(json) + "\n";
}

}  // namespace astrogen::sourcemap
