#include "assembler.h"
#include "errors.h"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <map>
#include <sstream>

namespace folio {

// ============================================================================
// Builder invocation
// ============================================================================

static std::vector<ContentNode> run_builder(const ChapterModule& module, size_t index,
                                            const StyleConstants& style) {
    try {
        ChapterOutput output = module.build(style);
        return normalize(output);
    } catch (const AuthoringError& e) {
        throw e.inChapter(index, module.id);
    } catch (const std::exception& e) {
        throw AssemblyError(index, module.id, std::string("builder threw: ") + e.what());
    } catch (...) {
        throw AssemblyError(index, module.id, "builder threw a non-standard exception");
    }
}

// ============================================================================
// Heading number sequencing
// ============================================================================

std::string heading_number(const std::string& text) {
    size_t pos = 0;
    // First component: digits, or a single appendix letter ("B.2").
    if (pos < text.size() && std::isupper(static_cast<unsigned char>(text[pos])) &&
        pos + 1 < text.size() && text[pos + 1] == '.') {
        pos += 1;
    } else {
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos == 0) return "";
    }

    int components = 1;
    while (pos + 1 < text.size() && text[pos] == '.' &&
           std::isdigit(static_cast<unsigned char>(text[pos + 1]))) {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
        ++components;
    }
    if (components < 2) return "";
    if (pos < text.size() && !std::isspace(static_cast<unsigned char>(text[pos]))) return "";
    return text.substr(0, pos);
}

static void check_heading_sequence(const AssembledDocument& doc, const ChapterSpan& span,
                                   size_t manifest_index,
                                   std::vector<AssemblyWarning>& warnings) {
    // Last sibling number seen under each parent ("2.1" -> 3 after "2.1.3").
    std::map<std::string, int> last_child;
    std::map<std::string, std::string> last_label;

    for (size_t i = span.first; i < span.first + span.count; ++i) {
        const Heading* h = doc.nodes[i].getIf<Heading>();
        if (!h) continue;
        std::string number = heading_number(h->text);
        if (number.empty()) continue;

        auto dot = number.rfind('.');
        std::string parent = number.substr(0, dot);
        // Components too large for an int carry no usable sibling order.
        errno = 0;
        long value = std::strtol(number.c_str() + dot + 1, nullptr, 10);
        if (errno == ERANGE || value > INT_MAX) continue;
        int child = static_cast<int>(value);

        auto it = last_child.find(parent);
        if (it != last_child.end() && child != it->second + 1) {
            AssemblyWarning w;
            w.manifest_index = manifest_index;
            w.chapter_id = span.id;
            w.node_index = i;
            w.message = "heading jump from " + last_label[parent] + " to " + number;
            warnings.push_back(std::move(w));
        }
        last_child[parent] = child;
        last_label[parent] = number;
    }
}

// ============================================================================
// assemble
// ============================================================================

struct PartClaim {
    size_t      manifest_index;
    std::string chapter_id;
    std::string text;
};

AssembledDocument assemble(const Manifest& manifest, const StyleConstants& style) {
    AssembledDocument doc;
    std::map<std::string, size_t> seen_ids;
    std::map<int, PartClaim> parts;

    for (size_t index = 0; index < manifest.size(); ++index) {
        const ChapterModule& module = manifest[index];

        auto [prev, inserted] = seen_ids.emplace(module.id, index);
        if (!inserted) {
            throw AssemblyError(index, module.id,
                                "chapter id already used by manifest #" + std::to_string(prev->second));
        }
        if (!module.build) {
            throw AssemblyError(index, module.id, "manifest entry has no builder");
        }

        std::vector<ContentNode> chapter_nodes = run_builder(module, index, style);

        ChapterSpan span;
        span.id = module.id;
        span.first = doc.nodes.size();

        for (auto& node : chapter_nodes) {
            if (const PartHeading* part = node.getIf<PartHeading>()) {
                if (part->ordinal) {
                    auto found = parts.find(*part->ordinal);
                    if (found != parts.end()) {
                        std::ostringstream cause;
                        cause << "'" << part->text << "' reuses part ordinal " << *part->ordinal
                              << " already claimed by '" << found->second.text << "' in chapter '"
                              << found->second.chapter_id << "' (manifest #"
                              << found->second.manifest_index << ")";
                        throw AssemblyError(index, module.id, cause.str());
                    }
                    parts.emplace(*part->ordinal, PartClaim{index, module.id, part->text});
                }
                if (!doc.nodes.empty() && !doc.nodes.back().is<PageBreak>()) {
                    doc.nodes.push_back(ContentNode(PageBreak{}));
                    ++doc.inserted_page_breaks;
                }
            }

            if (const Table* t = node.getIf<Table>()) {
                const long width = t->total_width();
                if (width > style.page_content_width) {
                    NodeLocation where;
                    where.manifest_index = index;
                    where.chapter_id = module.id;
                    where.node_index = doc.nodes.size();
                    where.node_kind = node.kindName();
                    throw AuthoringError("table columns sum to " + std::to_string(width) +
                                         " layout units but the page content width is " +
                                         std::to_string(style.page_content_width), where);
                }
                if (width < style.page_content_width) {
                    AssemblyWarning w;
                    w.manifest_index = index;
                    w.chapter_id = module.id;
                    w.node_index = doc.nodes.size();
                    w.message = "table columns sum to " + std::to_string(width) + " of " +
                                std::to_string(style.page_content_width) + " layout units";
                    doc.warnings.push_back(std::move(w));
                }
            }

            doc.nodes.push_back(std::move(node));
        }

        span.count = doc.nodes.size() - span.first;
        if (chapter_nodes.empty()) {
            AssemblyWarning w;
            w.manifest_index = index;
            w.chapter_id = module.id;
            w.message = "chapter produced no nodes";
            doc.warnings.push_back(std::move(w));
        }
        check_heading_sequence(doc, span, index, doc.warnings);
        doc.chapters.push_back(std::move(span));
    }

    return doc;
}

}  // namespace folio
