#ifndef FOLIO_ZIP_ARCHIVE_H
#define FOLIO_ZIP_ARCHIVE_H

#include <cstdint>
#include <string>
#include <vector>

namespace folio {

// ZIP container layout (writer output):
//   [local header + deflated data] per entry, in insertion order
//   [central directory]            one record per entry
//   [end of central directory]
//
// Every entry carries the DOS timestamp 1980-01-01 00:00, so the same entries
// always produce the same bytes.

static constexpr uint32_t ZIP_LOCAL_HEADER_SIG   = 0x04034b50;
static constexpr uint32_t ZIP_CENTRAL_HEADER_SIG = 0x02014b50;
static constexpr uint32_t ZIP_END_OF_CENTRAL_SIG = 0x06054b50;

static constexpr uint16_t ZIP_METHOD_STORED  = 0;
static constexpr uint16_t ZIP_METHOD_DEFLATE = 8;

struct ZipEntry {
    std::string          name;
    std::vector<uint8_t> data;            // uncompressed
    uint32_t             crc = 0;
    uint32_t             compressed_size = 0;
    uint16_t             method = ZIP_METHOD_DEFLATE;
};

class ZipWriter {
public:
    ZipWriter() = default;

    // Deflates data and appends an entry. Fails on an empty or duplicate name,
    // a zlib error, or after finish().
    bool addEntry(const std::string& name, const std::string& data);
    bool addEntry(const std::string& name, const std::vector<uint8_t>& data);

    // Writes the central directory and hands back the archive bytes.
    std::vector<uint8_t> finish();

    size_t             entryCount() const { return central_.size(); }
    const std::string& getLastError() const { return lastError_; }

private:
    struct CentralRecord {
        std::string name;
        uint32_t    crc;
        uint32_t    compressed_size;
        uint32_t    uncompressed_size;
        uint32_t    local_offset;
        uint16_t    method;
    };

    bool addEntry(const std::string& name, const uint8_t* data, size_t len);

    std::vector<uint8_t>       out_;
    std::vector<CentralRecord> central_;
    bool                       finished_ = false;
    std::string                lastError_;
};

// Parses an archive, inflates every entry and checks its CRC-32. Returns
// false with error set on the first problem.
bool read_zip_archive(const std::vector<uint8_t>& archive, std::vector<ZipEntry>& entries,
                      std::string& error);

// zlib wrappers for raw (headerless) deflate streams.
bool raw_deflate(const uint8_t* src, size_t len, std::vector<uint8_t>& out, std::string& error);
bool raw_inflate(const uint8_t* src, size_t len, size_t expected_len,
                 std::vector<uint8_t>& out, std::string& error);

}  // namespace folio

#endif // FOLIO_ZIP_ARCHIVE_H
