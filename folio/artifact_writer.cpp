#include "artifact_writer.h"
#include "docx_serializer.h"
#include "zip_archive.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

#ifdef _WIN32
#include <process.h>  // _getpid() for parallel-safe temp file naming
#define folio_getpid _getpid
#else
#include <unistd.h>
#define folio_getpid getpid
#endif

namespace fs = std::filesystem;

namespace folio {

// ============================================================================
// ArtifactWriter
// ============================================================================

ArtifactWriter::ArtifactWriter(const std::string& output_path)
    : outputPath_(output_path),
      tempPath_(output_path + "." + std::to_string(static_cast<long>(folio_getpid())) + ".tmp") {}

ArtifactWriter::~ArtifactWriter() {
    removeTemp();
}

void ArtifactWriter::removeTemp() {
    std::error_code ec;
    fs::remove(tempPath_, ec);
}

bool ArtifactWriter::write(const std::vector<uint8_t>& bytes) {
    fs::path out_path(outputPath_);
    if (out_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(out_path.parent_path(), ec);
        if (ec) {
            lastError_ = "Cannot create directory " + out_path.parent_path().string() + ": " +
                         ec.message();
            return false;
        }
    }

    {
        std::ofstream f(tempPath_, std::ios::binary | std::ios::trunc);
        if (!f) {
            lastError_ = "Cannot open temp file: " + tempPath_;
            return false;
        }
        f.write(reinterpret_cast<const char*>(bytes.data()),
                static_cast<std::streamsize>(bytes.size()));
        f.flush();
        if (!f) {
            lastError_ = "Write failed: " + tempPath_;
            f.close();
            removeTemp();
            return false;
        }
        f.close();
        if (!f) {
            lastError_ = "Close failed: " + tempPath_;
            removeTemp();
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath_, outputPath_, ec);
    if (ec) {
        lastError_ = "Cannot rename " + tempPath_ + " to " + outputPath_ + ": " + ec.message();
        removeTemp();
        return false;
    }
    return true;
}

// ============================================================================
// Verification
// ============================================================================

static bool read_file(const std::string& path, std::vector<uint8_t>& buf) {
    std::ifstream f(path, std::ios::binary | std::ios::ate);
    if (!f) return false;
    auto sz = f.tellg();
    if (sz < 0) return false;
    buf.resize(static_cast<size_t>(sz));
    f.seekg(0);
    f.read(reinterpret_cast<char*>(buf.data()), sz);
    return static_cast<bool>(f);
}

bool verify_docx(const std::string& path, VerifyReport& report, std::string& error) {
    std::vector<uint8_t> data;
    if (!read_file(path, data)) {
        error = "Cannot open file: " + path;
        return false;
    }
    report = VerifyReport();
    report.file_size = data.size();

    std::vector<ZipEntry> entries;
    if (!read_zip_archive(data, entries, error)) {
        return false;
    }

    report.entry_count = entries.size();
    for (const auto& e : entries) {
        report.entry_names.push_back(e.name);
        report.uncompressed_size += e.data.size();
    }

    for (const auto& required : docx_part_names()) {
        if (std::find(report.entry_names.begin(), report.entry_names.end(), required) ==
            report.entry_names.end()) {
            error = "Missing part: " + required;
            return false;
        }
    }

    for (const auto& e : entries) {
        if (e.name != "word/document.xml") continue;
        const std::string xml(e.data.begin(), e.data.end());
        if (xml.find("<w:body>") == std::string::npos || xml.find("</w:body>") == std::string::npos) {
            error = "word/document.xml has no body";
            return false;
        }
    }
    return true;
}

}  // namespace folio
