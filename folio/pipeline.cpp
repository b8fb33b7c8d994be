#include "pipeline.h"
#include "errors.h"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace folio {

std::vector<uint8_t> build_document(const Manifest& manifest, const StyleConstants& style,
                                    const DocumentInfo& info, AssembledDocument& assembled) {
    assembled = assemble(manifest, style);

    Document doc;
    doc.info = info;
    doc.nodes = assembled.nodes;
    doc.chapters = assembled.chapters;
    return serialize(doc, style);
}

BuildSummary run_pipeline(const Manifest& manifest, const StyleConstants& style,
                          const DocumentInfo& info, const std::string& output_path) {
    AssembledDocument assembled;
    const std::vector<uint8_t> bytes = build_document(manifest, style, info, assembled);

    BuildSummary summary;
    summary.chapter_count = assembled.chapters.size();
    summary.node_count = assembled.nodes.size();
    summary.inserted_page_breaks = assembled.inserted_page_breaks;
    summary.warnings = assembled.warnings;

    ArtifactWriter writer(output_path);
    if (!writer.write(bytes)) {
        throw FolioError(writer.getLastError());
    }
    summary.bytes_written = bytes.size();

    std::string error;
    if (!verify_docx(output_path, summary.verify, error)) {
        std::error_code ec;
        fs::remove(output_path, ec);
        throw FolioError("verification failed for " + output_path + ": " + error);
    }
    return summary;
}

}  // namespace folio
