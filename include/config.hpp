#pragma once

#include <filesystem>
#include <string>

namespace astrogen {

// Options the compiler's transform stage hands to the printer
struct TransformOptions {
    std::string filename = "<stdin>";
    std::string internal_url = "astro/internal";
    std::string site;
};

enum class SourceMapMode {
    None,
    Inline,
    External,
    Both
};

struct Config {
    TransformOptions transform;
    std::filesystem::path tree_file;
    std::filesystem::path source_file;  // empty = use the tree's "source" field
    std::filesystem::path output_file;  // empty = stdout
    SourceMapMode source_map = SourceMapMode::None;
    bool check_output = false;

    [[nodiscard]] bool writes_inline_map() const noexcept {
        return source_map == SourceMapMode::Inline || source_map == SourceMapMode::Both;
    }

    [[nodiscard]] bool writes_external_map() const noexcept {
        return source_map == SourceMapMode::External || source_map == SourceMapMode::Both;
    }

    [[nodiscard]] std::filesystem::path get_map_file() const {
        std::filesystem::path map = output_file;
        map += ".map";
        return map;
    }
};

}  // namespace astrogen
