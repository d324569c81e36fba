#pragma once

#include "loc.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace astrogen::sourcemap {

// 0-based line and UTF-16 column, the units source map consumers expect
struct LineColumn {
    int line = 0;
    int column = 0;
};

// Converts byte offsets in the original source to line/column pairs
class LineOffsetTable {
public:
    explicit LineOffsetTable(std::string_view source);

    [[nodiscard]] LineColumn locate(size_t offset) const;
    [[nodiscard]] size_t line_count() const noexcept { return line_starts_.size(); }

private:
    std::string_view source_;
    std::vector<size_t> line_starts_;
};

struct Mapping {
    int generated_line = 0;
    int generated_column = 0;
    Loc original;  // empty for synthetic code
    int original_line = 0;
    int original_column = 0;
};

struct SourceMapState {
    int generated_line = 0;
    int generated_column = 0;
    int source_index = 0;
    int original_line = 0;
    int original_column = 0;
};

// Source map data for one generated module. Owns all of its data, so it
// stays valid after the builder that produced it is reused or destroyed.
struct Chunk {
    std::vector<Mapping> mappings;
    std::string buffer;  // the VLQ "mappings" field
    SourceMapState end_state;
    int final_generated_column = 0;
    bool should_ignore = true;
};

class ChunkBuilder {
public:
    explicit ChunkBuilder(std::string_view source);

    // Record that the next byte appended to output comes from loc. An empty
    // loc breaks the association for the code that follows.
    void add_source_mapping(Loc loc, std::string_view output);

    void add_nil_source_mapping(std::string_view output) {
        add_source_mapping(std::nullopt, output);
    }

    [[nodiscard]] Chunk generate_chunk(std::string_view output);

    [[nodiscard]] const std::vector<Mapping>& mappings() const noexcept { return mappings_; }

private:
    void update_generated_line_and_column(std::string_view output);
    void append_mapping(const Mapping& mapping);

    LineOffsetTable line_offsets_;
    std::vector<Mapping> mappings_;
    std::string buffer_;
    SourceMapState prev_state_;
    Loc prev_loc_;
    bool has_prev_loc_ = false;
    size_t last_generated_update_ = 0;
    int generated_line_ = 0;
    int generated_column_ = 0;
};

void encode_vlq(std::string& buffer, int value);

[[nodiscard]] std::string encode_base64(std::string_view bytes);

// Returns text as a double-quoted JSON string literal
[[nodiscard]] std::string quote_for_json(std::string_view text);

// A complete version 3 source map for a single source file
[[nodiscard]] std::string to_json(const Chunk& chunk, std::string_view filename,
                                  std::string_view source);

[[nodiscard]] std::string to_inline_comment(std::string_view json);

}  // namespace astrogen::sourcemap
