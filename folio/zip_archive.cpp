#include "zip_archive.h"

#include <cstring>
#include <limits>
#include <set>

#include <zlib.h>

namespace folio {

static constexpr uint16_t ZIP_VERSION   = 20;      // 2.0: deflate
static constexpr uint16_t DOS_TIME      = 0x0000;  // 00:00:00
static constexpr uint16_t DOS_DATE      = 0x0021;  // 1980-01-01
static constexpr size_t   LOCAL_HEADER_SIZE   = 30;
static constexpr size_t   CENTRAL_HEADER_SIZE = 46;
static constexpr size_t   END_OF_CENTRAL_SIZE = 22;

// ============================================================================
// Little-endian helpers
// ============================================================================

static uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

static uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

static void append_u16_le(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

static void append_u32_le(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

static void append_bytes(std::vector<uint8_t>& out, const std::string& s) {
    out.insert(out.end(), s.begin(), s.end());
}

// ============================================================================
// zlib wrappers (raw deflate, no zlib header)
// ============================================================================

bool raw_deflate(const uint8_t* src, size_t len, std::vector<uint8_t>& out, std::string& error) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    int ret = deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                           Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        error = "zlib deflateInit2 failed (error " + std::to_string(ret) + ")";
        return false;
    }

    out.resize(deflateBound(&strm, static_cast<uLong>(len)));
    strm.next_in   = const_cast<Bytef*>(src);
    strm.avail_in  = static_cast<uInt>(len);
    strm.next_out  = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    ret = deflate(&strm, Z_FINISH);
    if (ret != Z_STREAM_END) {
        deflateEnd(&strm);
        error = "zlib deflate failed (error " + std::to_string(ret) + ")";
        return false;
    }
    out.resize(strm.total_out);
    deflateEnd(&strm);
    return true;
}

bool raw_inflate(const uint8_t* src, size_t len, size_t expected_len,
                 std::vector<uint8_t>& out, std::string& error) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    int ret = inflateInit2(&strm, -MAX_WBITS);
    if (ret != Z_OK) {
        error = "zlib inflateInit2 failed (error " + std::to_string(ret) + ")";
        return false;
    }

    // One spare byte so an over-long stream shows up as a size mismatch.
    out.resize(expected_len + 1);
    strm.next_in   = const_cast<Bytef*>(src);
    strm.avail_in  = static_cast<uInt>(len);
    strm.next_out  = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    ret = inflate(&strm, Z_FINISH);
    const uLong produced = strm.total_out;
    inflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        error = "zlib inflate failed (error " + std::to_string(ret) + ")";
        return false;
    }
    if (produced != expected_len) {
        error = "inflated " + std::to_string(produced) + " bytes, expected " +
                std::to_string(expected_len);
        return false;
    }
    out.resize(produced);
    return true;
}

// ============================================================================
// ZipWriter
// ============================================================================

bool ZipWriter::addEntry(const std::string& name, const std::string& data) {
    return addEntry(name, reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

bool ZipWriter::addEntry(const std::string& name, const std::vector<uint8_t>& data) {
    return addEntry(name, data.data(), data.size());
}

bool ZipWriter::addEntry(const std::string& name, const uint8_t* data, size_t len) {
    if (finished_) {
        lastError_ = "archive already finished";
        return false;
    }
    if (name.empty() || name.size() > std::numeric_limits<uint16_t>::max()) {
        lastError_ = "invalid entry name";
        return false;
    }
    for (const auto& rec : central_) {
        if (rec.name == name) {
            lastError_ = "duplicate entry: " + name;
            return false;
        }
    }
    if (len > std::numeric_limits<uint32_t>::max() ||
        out_.size() > std::numeric_limits<uint32_t>::max()) {
        lastError_ = "entry too large for a ZIP32 archive: " + name;
        return false;
    }

    std::vector<uint8_t> compressed;
    std::string error;
    if (!raw_deflate(data, len, compressed, error)) {
        lastError_ = name + ": " + error;
        return false;
    }

    CentralRecord rec;
    rec.name              = name;
    rec.crc               = static_cast<uint32_t>(crc32(0L, data, static_cast<uInt>(len)));
    rec.compressed_size   = static_cast<uint32_t>(compressed.size());
    rec.uncompressed_size = static_cast<uint32_t>(len);
    rec.local_offset      = static_cast<uint32_t>(out_.size());
    rec.method            = ZIP_METHOD_DEFLATE;

    append_u32_le(out_, ZIP_LOCAL_HEADER_SIG);
    append_u16_le(out_, ZIP_VERSION);            // version needed
    append_u16_le(out_, 0);                      // flags
    append_u16_le(out_, rec.method);
    append_u16_le(out_, DOS_TIME);
    append_u16_le(out_, DOS_DATE);
    append_u32_le(out_, rec.crc);
    append_u32_le(out_, rec.compressed_size);
    append_u32_le(out_, rec.uncompressed_size);
    append_u16_le(out_, static_cast<uint16_t>(name.size()));
    append_u16_le(out_, 0);                      // extra length
    append_bytes(out_, name);
    out_.insert(out_.end(), compressed.begin(), compressed.end());

    central_.push_back(std::move(rec));
    return true;
}

std::vector<uint8_t> ZipWriter::finish() {
    if (finished_) return out_;
    finished_ = true;

    const uint32_t cd_offset = static_cast<uint32_t>(out_.size());
    for (const auto& rec : central_) {
        append_u32_le(out_, ZIP_CENTRAL_HEADER_SIG);
        append_u16_le(out_, ZIP_VERSION);        // version made by
        append_u16_le(out_, ZIP_VERSION);        // version needed
        append_u16_le(out_, 0);                  // flags
        append_u16_le(out_, rec.method);
        append_u16_le(out_, DOS_TIME);
        append_u16_le(out_, DOS_DATE);
        append_u32_le(out_, rec.crc);
        append_u32_le(out_, rec.compressed_size);
        append_u32_le(out_, rec.uncompressed_size);
        append_u16_le(out_, static_cast<uint16_t>(rec.name.size()));
        append_u16_le(out_, 0);                  // extra length
        append_u16_le(out_, 0);                  // comment length
        append_u16_le(out_, 0);                  // disk number start
        append_u16_le(out_, 0);                  // internal attributes
        append_u32_le(out_, 0);                  // external attributes
        append_u32_le(out_, rec.local_offset);
        append_bytes(out_, rec.name);
    }
    const uint32_t cd_size = static_cast<uint32_t>(out_.size()) - cd_offset;

    append_u32_le(out_, ZIP_END_OF_CENTRAL_SIG);
    append_u16_le(out_, 0);                      // this disk
    append_u16_le(out_, 0);                      // disk with central directory
    append_u16_le(out_, static_cast<uint16_t>(central_.size()));
    append_u16_le(out_, static_cast<uint16_t>(central_.size()));
    append_u32_le(out_, cd_size);
    append_u32_le(out_, cd_offset);
    append_u16_le(out_, 0);                      // comment length

    return out_;
}

// ============================================================================
// Reader
// ============================================================================

bool read_zip_archive(const std::vector<uint8_t>& archive, std::vector<ZipEntry>& entries,
                      std::string& error) {
    entries.clear();
    const uint8_t* data = archive.data();
    const size_t size = archive.size();

    if (size < END_OF_CENTRAL_SIZE) {
        error = "file too small for a ZIP archive";
        return false;
    }

    // The end record sits in the last 22 + 65535 (comment) bytes.
    size_t eocd = std::string::npos;
    const size_t scan_floor = size > END_OF_CENTRAL_SIZE + 0xFFFF
                                  ? size - END_OF_CENTRAL_SIZE - 0xFFFF : 0;
    for (size_t pos = size - END_OF_CENTRAL_SIZE + 1; pos-- > scan_floor;) {
        if (read_u32(data + pos) == ZIP_END_OF_CENTRAL_SIG) {
            eocd = pos;
            break;
        }
    }
    if (eocd == std::string::npos) {
        error = "end of central directory not found";
        return false;
    }

    const uint16_t count     = read_u16(data + eocd + 10);
    const uint32_t cd_size   = read_u32(data + eocd + 12);
    const uint32_t cd_offset = read_u32(data + eocd + 16);
    if (static_cast<size_t>(cd_offset) + cd_size > eocd) {
        error = "central directory out of bounds";
        return false;
    }

    std::set<std::string> names;
    size_t pos = cd_offset;
    for (uint16_t i = 0; i < count; ++i) {
        if (pos + CENTRAL_HEADER_SIZE > eocd || read_u32(data + pos) != ZIP_CENTRAL_HEADER_SIG) {
            error = "bad central directory record " + std::to_string(i);
            return false;
        }
        ZipEntry entry;
        entry.method                = read_u16(data + pos + 10);
        entry.crc                   = read_u32(data + pos + 16);
        entry.compressed_size       = read_u32(data + pos + 20);
        const uint32_t uncompressed = read_u32(data + pos + 24);
        const uint16_t name_len     = read_u16(data + pos + 28);
        const uint16_t extra_len    = read_u16(data + pos + 30);
        const uint16_t comment_len  = read_u16(data + pos + 32);
        const uint32_t local_offset = read_u32(data + pos + 42);

        if (pos + CENTRAL_HEADER_SIZE + name_len > eocd) {
            error = "central directory name out of bounds";
            return false;
        }
        entry.name.assign(reinterpret_cast<const char*>(data + pos + CENTRAL_HEADER_SIZE), name_len);
        pos += CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len;

        if (!names.insert(entry.name).second) {
            error = "duplicate entry: " + entry.name;
            return false;
        }

        if (static_cast<size_t>(local_offset) + LOCAL_HEADER_SIZE > size ||
            read_u32(data + local_offset) != ZIP_LOCAL_HEADER_SIG) {
            error = entry.name + ": bad local header";
            return false;
        }
        const size_t payload = static_cast<size_t>(local_offset) + LOCAL_HEADER_SIZE +
                               read_u16(data + local_offset + 26) +
                               read_u16(data + local_offset + 28);
        if (payload + entry.compressed_size > size) {
            error = entry.name + ": data out of bounds";
            return false;
        }

        if (entry.method == ZIP_METHOD_DEFLATE) {
            std::string inflate_error;
            if (!raw_inflate(data + payload, entry.compressed_size, uncompressed,
                             entry.data, inflate_error)) {
                error = entry.name + ": " + inflate_error;
                return false;
            }
        } else if (entry.method == ZIP_METHOD_STORED) {
            if (entry.compressed_size != uncompressed) {
                error = entry.name + ": stored size mismatch";
                return false;
            }
            entry.data.assign(data + payload, data + payload + uncompressed);
        } else {
            error = entry.name + ": unsupported compression method " + std::to_string(entry.method);
            return false;
        }

        const uint32_t actual = static_cast<uint32_t>(
            crc32(0L, entry.data.data(), static_cast<uInt>(entry.data.size())));
        if (actual != entry.crc) {
            error = entry.name + ": CRC-32 mismatch";
            return false;
        }
        entries.push_back(std::move(entry));
    }
    return true;
}

}  // namespace folio
