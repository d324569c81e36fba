#pragma once

#include "document.hpp"

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace astrogen {

struct LoadedDocument {
    std::unique_ptr<Document> document;
    std::optional<std::string> source;  // the tree's embedded "source" field, if any
};

// Read a JSON document tree produced by the parser and compute its
// component lists. Throws std::runtime_error on malformed input.
[[nodiscard]] LoadedDocument load_document(std::istream& in);
[[nodiscard]] LoadedDocument load_document_file(const std::filesystem::path& path);

}  // namespace astrogen
