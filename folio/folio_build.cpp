// folio_build.cpp - Compile the chapter manifest into a .docx document
//
// Standalone C++17 CLI tool around the folio library.
//
// Pipeline:
//   [style]     defaults, optionally overridden by a key = value file
//   [assemble]  run every chapter builder in manifest order, flatten, validate
//   [serialize] render the WordprocessingML parts and pack them (zlib deflate)
//   [write]     <output>.<pid>.tmp, then rename over <output>
//   [verify]    re-open the archive, inflate every part, check CRC-32
//
// Any error aborts the run before anything is written to <output>.

#include "folio/assembler.h"
#include "folio/docx_serializer.h"
#include "folio/errors.h"
#include "folio/pipeline.h"
#include "folio/style.h"
#include "folio/style_config.h"
#include "chapters/manifest.h"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace folio;

// ============================================================================
// Utility: format numbers with commas
// ============================================================================

static std::string format_number(uint64_t n) {
    std::string s = std::to_string(n);
    int insert_pos = static_cast<int>(s.length()) - 3;
    while (insert_pos > 0) {
        s.insert(insert_pos, ",");
        insert_pos -= 3;
    }
    return s;
}

// ============================================================================
// Diagnostics
// ============================================================================

static void print_warnings(const std::vector<AssemblyWarning>& warnings) {
    for (const auto& w : warnings) {
        std::cerr << "WARNING: chapter '" << w.chapter_id << "' (manifest #" << w.manifest_index
                  << ")";
        if (w.node_index) std::cerr << ", node " << *w.node_index;
        std::cerr << ": " << w.message << "\n";
    }
}

static void print_chapters(const AssembledDocument& assembled) {
    for (const auto& span : assembled.chapters) {
        std::cout << "    " << span.id << ": nodes " << span.first;
        if (span.count > 0) std::cout << "-" << (span.first + span.count - 1);
        std::cout << " (" << span.count << ")\n";
    }
}

// ============================================================================
// CLI: help text
// ============================================================================

static void print_help(const char* prog) {
    std::cout <<
"Usage: " << prog << " [options] -o <output.docx>\n"
"\n"
"Compile the built-in chapter manifest into one .docx document.\n"
"\n"
"Options:\n"
"  -o, --output <file>       Output .docx file path (required unless --info/--validate)\n"
"  --style <file>            Style overrides, one \"key = value\" per line\n"
"  --title <text>            Document title (cover page, document properties)\n"
"  --subtitle <text>         Cover subtitle\n"
"  --version <text>          Version line on the cover\n"
"  --header <text>           Running header text\n"
"  --footer <text>           Footer text shown before the page number\n"
"  --author <text>           Document author property\n"
"  --no-cover                Omit the cover page\n"
"  --no-toc                  Omit the table of contents\n"
"  --info                    Dry run: show the build plan without writing\n"
"  --validate                Assemble and validate only, print diagnostics\n"
"  --verbose, -v             Show detailed build progress\n"
"  --help, -h                Show this help\n"
"\n"
"Style keys:\n"
"  ";
    const auto& keys = style_setting_keys();
    for (size_t i = 0; i < keys.size(); ++i) {
        std::cout << keys[i] << (i + 1 < keys.size() ? (i % 4 == 3 ? "\n  " : ", ") : "\n");
    }
    std::cout <<
"\n"
"Examples:\n"
"  # Build the full document\n"
"  " << prog << " --title \"SEZ Stack\" --version \"v0.4.44\" -o spec.docx\n"
"\n"
"  # Check the manifest without writing anything\n"
"  " << prog << " --validate -v\n"
"\n"
"  # Build with a house style override\n"
"  " << prog << " --style house.style --no-cover -o draft.docx\n";
}

// ============================================================================
// main
// ============================================================================

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_help(argv[0]);
        return 1;
    }

    std::string output_path;
    std::string style_path;
    DocumentInfo info;
    bool info_only     = false;
    bool validate_only = false;
    bool verbose       = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Options that take a value
        std::string* target = nullptr;
        if (arg == "-o" || arg == "--output") target = &output_path;
        else if (arg == "--style")            target = &style_path;
        else if (arg == "--title")            target = &info.title;
        else if (arg == "--subtitle")         target = &info.subtitle;
        else if (arg == "--version")          target = &info.version;
        else if (arg == "--header")           target = &info.header_text;
        else if (arg == "--footer")           target = &info.footer_text;
        else if (arg == "--author")           target = &info.author;

        if (target) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument\n";
                return 1;
            }
            *target = argv[++i];
        }
        else if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return 0;
        }
        else if (arg == "--no-cover") {
            info.include_cover = false;
        }
        else if (arg == "--no-toc") {
            info.include_toc = false;
        }
        else if (arg == "--info") {
            info_only = true;
        }
        else if (arg == "--validate") {
            validate_only = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        }
        else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (output_path.empty() && !info_only && !validate_only) {
        std::cerr << "Error: Output path required (-o / --output)\n";
        return 1;
    }
    if (!style_path.empty() && !fs::exists(style_path)) {
        std::cerr << "Error: Style file not found: " << style_path << "\n";
        return 1;
    }

    // ---- Style: built once, read-only from here on ----
    StyleSettings settings;
    if (!style_path.empty()) {
        std::string error;
        if (!load_style_overrides(style_path, settings, error)) {
            std::cerr << "ERROR: " << error << "\n";
            return 1;
        }
    }
    std::unique_ptr<const StyleConstants> style;
    try {
        style = std::make_unique<const StyleConstants>(settings);
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: Invalid style: " << e.what() << "\n";
        return 1;
    }

    const Manifest& manifest = chapters::manifest();

    if (info_only) {
        std::cout << "\nBuild plan:\n";
        std::cout << "  Chapters: " << manifest.size() << "\n";
        for (size_t i = 0; i < manifest.size(); ++i) {
            std::cout << "    #" << i << " " << manifest[i].id << "\n";
        }
        std::cout << "  Style: " << (style_path.empty() ? "default" : style_path) << "\n";
        std::cout << "  Body font: " << style->body_font << " " << style->body_size
                  << ", code font: " << style->code_font << " " << style->code_size << "\n";
        std::cout << "  Page: " << style->page_width << " x " << style->page_height
                  << ", content width: " << style->page_content_width << "\n";
        std::cout << "  Cover: " << (info.include_cover ? "yes" : "no")
                  << ", TOC: " << (info.include_toc ? "yes" : "no") << "\n";
        std::cout << "  Output: " << (output_path.empty() ? "(none)" : output_path) << "\n";
        return 0;
    }

    try {
        if (validate_only) {
            std::cout << "\nValidating " << manifest.size() << " chapters\n";
            AssembledDocument assembled = assemble(manifest, *style);
            if (verbose) print_chapters(assembled);
            print_warnings(assembled.warnings);
            std::cout << "  Nodes: " << assembled.nodes.size()
                      << ", inserted page breaks: " << assembled.inserted_page_breaks
                      << ", warnings: " << assembled.warnings.size() << "\n";
            return 0;
        }

        std::cout << "\nBuilding document: " << output_path << "\n";
        BuildSummary summary = run_pipeline(manifest, *style, info, output_path);
        print_warnings(summary.warnings);

        if (verbose) {
            std::cout << "  Chapters: " << summary.chapter_count
                      << ", nodes: " << summary.node_count
                      << ", inserted page breaks: " << summary.inserted_page_breaks << "\n";
            std::cout << "\n  Verification:\n";
            std::cout << "    Parts: " << summary.verify.entry_count
                      << ", uncompressed: " << format_number(summary.verify.uncompressed_size)
                      << " bytes\n";
            for (const auto& name : summary.verify.entry_names) {
                std::cout << "      " << name << "\n";
            }
            std::cout << "    Verification: PASSED\n";
        }
        std::cout << "  Built document: " << output_path
                  << " (" << format_number(summary.bytes_written) << " bytes)\n";
    } catch (const FolioError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
