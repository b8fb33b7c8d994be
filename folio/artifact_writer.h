#ifndef FOLIO_ARTIFACT_WRITER_H
#define FOLIO_ARTIFACT_WRITER_H

#include <cstdint>
#include <string>
#include <vector>

namespace folio {

// Writes the finished artifact without ever leaving a partial file at the
// destination: bytes go to "<output>.<pid>.tmp" beside it, which is renamed
// over the destination once flushed and closed. Any failure removes the temp
// file and leaves the destination untouched.
class ArtifactWriter {
public:
    explicit ArtifactWriter(const std::string& output_path);
    ~ArtifactWriter();

    ArtifactWriter(const ArtifactWriter&) = delete;
    ArtifactWriter& operator=(const ArtifactWriter&) = delete;

    bool write(const std::vector<uint8_t>& bytes);

    const std::string& outputPath() const { return outputPath_; }
    const std::string& tempPath() const { return tempPath_; }
    const std::string& getLastError() const { return lastError_; }

private:
    void removeTemp();

    std::string outputPath_;
    std::string tempPath_;
    std::string lastError_;
};

struct VerifyReport {
    size_t                   file_size = 0;
    size_t                   entry_count = 0;
    size_t                   uncompressed_size = 0;
    std::vector<std::string> entry_names;
};

// Re-opens a written .docx: every entry must inflate and match its CRC-32,
// every required part must be present and the main part must hold a body.
bool verify_docx(const std::string& path, VerifyReport& report, std::string& error);

}  // namespace folio

#endif // FOLIO_ARTIFACT_WRITER_H
