#ifndef FOLIO_PIPELINE_H
#define FOLIO_PIPELINE_H

#include "artifact_writer.h"
#include "assembler.h"
#include "docx_serializer.h"
#include "style.h"

#include <cstdint>
#include <string>
#include <vector>

namespace folio {

struct BuildSummary {
    size_t                       chapter_count = 0;
    size_t                       node_count = 0;
    size_t                       inserted_page_breaks = 0;
    std::vector<AssemblyWarning> warnings;
    size_t                       bytes_written = 0;
    VerifyReport                 verify;
};

// assemble -> serialize, in memory. Nothing touches the filesystem.
std::vector<uint8_t> build_document(const Manifest& manifest, const StyleConstants& style,
                                    const DocumentInfo& info, AssembledDocument& assembled);

// Full run: build, write atomically to output_path, re-open and verify.
// Throws AuthoringError, AssemblyError or SerializationError from the build,
// and FolioError when the write or the verification fails. A throw before
// the write leaves output_path untouched; a failed verification removes it.
// No temp file survives either way.
BuildSummary run_pipeline(const Manifest& manifest, const StyleConstants& style,
                          const DocumentInfo& info, const std::string& output_path);

}  // namespace folio

#endif // FOLIO_PIPELINE_H
