#include "xml_writer.h"

#include <cstdint>

namespace folio {

XmlWriter::XmlWriter() {
    out_ = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n";
}

void XmlWriter::writeAttributes(const XmlAttributes& attrs) {
    for (const auto& a : attrs) {
        out_ += ' ';
        out_ += a.first;
        out_ += "=\"";
        append_xml_escaped(out_, a.second, true);
        out_ += '"';
    }
}

void XmlWriter::open(const char* tag, const XmlAttributes& attrs) {
    out_ += '<';
    out_ += tag;
    writeAttributes(attrs);
    out_ += '>';
}

void XmlWriter::close(const char* tag) {
    out_ += "</";
    out_ += tag;
    out_ += '>';
}

void XmlWriter::empty(const char* tag, const XmlAttributes& attrs) {
    out_ += '<';
    out_ += tag;
    writeAttributes(attrs);
    out_ += "/>";
}

void XmlWriter::text(const std::string& s) {
    append_xml_escaped(out_, s, false);
}

void XmlWriter::element(const char* tag, const std::string& s, const XmlAttributes& attrs) {
    open(tag, attrs);
    text(s);
    close(tag);
}

// ============================================================================
// Escaping
// ============================================================================

void append_xml_escaped(std::string& out, const std::string& s, bool attribute) {
    for (char c : s) {
        switch (c) {
        case '<':  out += "&lt;"; break;
        case '>':  out += "&gt;"; break;
        case '&':  out += "&amp;"; break;
        case '"':
            if (attribute) out += "&quot;"; else out += c;
            break;
        case '\'':
            if (attribute) out += "&apos;"; else out += c;
            break;
        case '\t':
        case '\n':
        case '\r':
            // Attribute values would normalize these to spaces.
            if (attribute) {
                static const char* hex = "0123456789ABCDEF";
                out += "&#x";
                out += hex[(static_cast<unsigned char>(c) >> 4) & 0xF];
                out += hex[static_cast<unsigned char>(c) & 0xF];
                out += ';';
            } else {
                out += c;
            }
            break;
        default:
            out += c;
            break;
        }
    }
}

std::string xml_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    append_xml_escaped(out, s, false);
    return out;
}

bool is_xml_safe(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        const uint8_t c = static_cast<uint8_t>(s[i]);
        if (c < 0x80) {
            if (c < 0x20 && c != '\t' && c != '\n' && c != '\r') return false;
            ++i;
            continue;
        }

        size_t len;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0)      { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            const uint8_t cc = static_cast<uint8_t>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates, and the two non-characters XML excludes.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false;
        }
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp == 0xFFFE || cp == 0xFFFF || cp > 0x10FFFF) return false;
        i += len;
    }
    return true;
}

}  // namespace folio
