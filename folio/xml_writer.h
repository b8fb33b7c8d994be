#ifndef FOLIO_XML_WRITER_H
#define FOLIO_XML_WRITER_H

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace folio {

using XmlAttribute  = std::pair<const char*, std::string>;
using XmlAttributes = std::vector<XmlAttribute>;

// Appends markup to an in-memory buffer. Text and attribute values are
// escaped; callers check is_xml_safe() first, since control characters
// cannot be escaped in XML 1.0.
class XmlWriter {
public:
    XmlWriter();

    void open(const char* tag, const XmlAttributes& attrs = {});
    void close(const char* tag);
    void empty(const char* tag, const XmlAttributes& attrs = {});
    void text(const std::string& s);

    // <tag attrs>text</tag>
    void element(const char* tag, const std::string& s, const XmlAttributes& attrs = {});

    std::string take() { return std::move(out_); }

private:
    void writeAttributes(const XmlAttributes& attrs);

    std::string out_;
};

void append_xml_escaped(std::string& out, const std::string& s, bool attribute);
std::string xml_escape(const std::string& s);

// True when s is well-formed UTF-8 and holds only characters XML 1.0 allows
// (no C0 controls other than tab, newline and carriage return).
bool is_xml_safe(const std::string& s);

}  // namespace folio

#endif // FOLIO_XML_WRITER_H
