#include "errors.h"

#include <sstream>

namespace folio {

std::string NodeLocation::describe() const {
    std::ostringstream oss;
    bool any = false;
    if (!chapter_id.empty() || manifest_index) {
        oss << "chapter '" << chapter_id << "'";
        if (manifest_index) oss << " (manifest #" << *manifest_index << ")";
        any = true;
    }
    if (node_index || !node_kind.empty()) {
        if (any) oss << ", ";
        oss << "node";
        if (node_index) oss << " " << *node_index;
        if (!node_kind.empty()) oss << " (" << node_kind << ")";
        any = true;
    }
    return oss.str();
}

static std::string authoring_message(const std::string& invariant, const NodeLocation& where) {
    std::string loc = where.describe();
    if (loc.empty()) return "authoring error: " + invariant;
    return "authoring error in " + loc + ": " + invariant;
}

AuthoringError::AuthoringError(const std::string& invariant, const NodeLocation& where)
    : FolioError(authoring_message(invariant, where))
    , invariant_(invariant)
    , where_(where) {}

AuthoringError AuthoringError::inChapter(size_t manifest_index, const std::string& chapter_id) const {
    NodeLocation where = where_;
    where.manifest_index = manifest_index;
    where.chapter_id = chapter_id;
    return AuthoringError(invariant_, where);
}

static std::string assembly_message(size_t manifest_index, const std::string& chapter_id,
                                    const std::string& cause) {
    std::ostringstream oss;
    oss << "assembly error in chapter '" << chapter_id << "' (manifest #"
        << manifest_index << "): " << cause;
    return oss.str();
}

AssemblyError::AssemblyError(size_t manifest_index, const std::string& chapter_id,
                             const std::string& cause)
    : FolioError(assembly_message(manifest_index, chapter_id, cause))
    , manifest_index_(manifest_index)
    , chapter_id_(chapter_id)
    , cause_(cause) {}

static std::string serialization_message(const std::optional<size_t>& node_index,
                                         const std::string& node_kind,
                                         const std::string& reason) {
    std::ostringstream oss;
    oss << "serialization error at ";
    if (node_index) {
        oss << "node " << *node_index << " (" << node_kind << ")";
    } else {
        oss << node_kind;
    }
    oss << ": " << reason;
    return oss.str();
}

SerializationError::SerializationError(std::optional<size_t> node_index,
                                       const std::string& node_kind,
                                       const std::string& reason)
    : FolioError(serialization_message(node_index, node_kind, reason))
    , node_index_(node_index)
    , node_kind_(node_kind)
    , reason_(reason) {}

}  // namespace folio
