#include "config.hpp"
#include "document_loader.hpp"
#include "print_to_js.hpp"
#include "source_map.hpp"

#ifdef ASTROGEN_WITH_QUICKJS
#include "js_check.hpp"
#endif

#include <boost/program_options.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace po = boost::program_options;

namespace {

astrogen::SourceMapMode parse_source_map_mode(const std::string& mode) {
    if (mode == "none") return astrogen::SourceMapMode::None;
    if (mode == "inline") return astrogen::SourceMapMode::Inline;
    if (mode == "external") return astrogen::SourceMapMode::External;
    if (mode == "both") return astrogen::SourceMapMode::Both;
    throw std::runtime_error("Unknown source map mode: " + mode);
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open source file: " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Failed to write " + path.string());
    }
    out << content;
}

int run(const astrogen::Config& config) {
    astrogen::LoadedDocument loaded = astrogen::load_document_file(config.tree_file);

    std::string source;
    if (!config.source_file.empty()) {
        source = read_file(config.source_file);
    } else if (loaded.source) {
        source = *loaded.source;
    } else {
        std::cerr << "Warning: no original source given; import metadata and source maps "
                     "will be empty\n";
    }

    astrogen::PrintResult result =
        astrogen::print_to_js(*loaded.document, source, config.transform);

    if (config.check_output) {
#ifdef ASTROGEN_WITH_QUICKJS
        astrogen::JsChecker checker;
        checker.compile_module(result.output, config.transform.filename);
#else
        throw std::runtime_error("--check is unavailable: astrogen was built without QuickJS");
#endif
    }

    std::string output = result.output;
    if (config.source_map != astrogen::SourceMapMode::None) {
        std::string map = astrogen::sourcemap::to_json(result.source_map_chunk,
                                                       config.transform.filename, source);
        if (config.writes_inline_map()) {
            output += astrogen::sourcemap::to_inline_comment(map);
        }
        if (config.writes_external_map()) {
            if (config.output_file.empty()) {
                throw std::runtime_error("--sourcemap external requires --output");
            }
            write_file(config.get_map_file(), map);
        }
    }

    if (config.output_file.empty()) {
        std::cout << output;
    } else {
        write_file(config.output_file, output);
        std::cerr << "Wrote " << config.output_file.string() << "\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    astrogen::Config config;
    std::string tree_file;
    std::string source_file;
    std::string output_file;
    std::string source_map;

    po::options_description desc("astrogen - Astro component code generator");
    desc.add_options()
        ("help,h", "Show help message")
        ("tree", po::value<std::string>(&tree_file), "JSON document tree to compile")
        ("source,s", po::value<std::string>(&source_file),
            "Original component source (default: the tree's \"source\" field)")
        ("output,o", po::value<std::string>(&output_file),
            "Write the generated module here instead of stdout")
        ("site", po::value<std::string>(&config.transform.site)->default_value(""),
            "Site URL passed to createAstro")
        ("internal-url", po::value<std::string>(&config.transform.internal_url)
            ->default_value("astro/internal"),
            "Module specifier the runtime helpers are imported from")
        ("filename", po::value<std::string>(&config.transform.filename)
            ->default_value("<stdin>"),
            "Source name recorded in the source map")
        ("sourcemap", po::value<std::string>(&source_map)->default_value("none"),
            "Source map output: none, inline, external or both")
        ("check", po::bool_switch(&config.check_output),
            "Compile the generated module with QuickJS to verify its syntax")
    ;

    po::positional_options_description positional;
    positional.add("tree", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << desc << "\n";
        return 1;
    }

    if (vm.count("help") || tree_file.empty()) {
        std::cout << desc << "\n";
        std::cout << "\nUsage:\n";
        std::cout << "  # Compile a parsed component to stdout\n";
        std::cout << "  ./astrogen -s Card.astro Card.json\n\n";
        std::cout << "  # Write the module with an external source map and verify it parses\n";
        std::cout << "  ./astrogen -s Card.astro -o Card.mjs --sourcemap external --check Card.json\n";
        return vm.count("help") ? 0 : 1;
    }

    config.tree_file = tree_file;
    config.source_file = source_file;
    config.output_file = output_file;

    try {
        config.source_map = parse_source_map_mode(source_map);
        return run(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
