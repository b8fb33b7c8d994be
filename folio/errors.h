#ifndef FOLIO_ERRORS_H
#define FOLIO_ERRORS_H

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace folio {

// Base of every error the pipeline raises. All of them end the run.
class FolioError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Where in the document an error was found. Fields fill in as the error
// travels outward: a primitive knows only the node kind, the assembler adds
// the chapter and the node position.
struct NodeLocation {
    std::optional<size_t> manifest_index;
    std::string           chapter_id;
    std::optional<size_t> node_index;
    std::string           node_kind;

    std::string describe() const;
};

// A node failed construction-time validation, or a table does not fit the page.
class AuthoringError : public FolioError {
public:
    explicit AuthoringError(const std::string& invariant, const NodeLocation& where = NodeLocation());

    const std::string&  invariant() const { return invariant_; }
    const NodeLocation& location() const { return where_; }

    // Copy of this error attributed to a manifest entry.
    AuthoringError inChapter(size_t manifest_index, const std::string& chapter_id) const;

private:
    std::string  invariant_;
    NodeLocation where_;
};

// A builder threw, or an invariant spanning chapters was violated.
class AssemblyError : public FolioError {
public:
    AssemblyError(size_t manifest_index, const std::string& chapter_id, const std::string& cause);

    size_t             manifestIndex() const { return manifest_index_; }
    const std::string& chapterId() const { return chapter_id_; }
    const std::string& cause() const { return cause_; }

private:
    size_t      manifest_index_;
    std::string chapter_id_;
    std::string cause_;
};

// The renderer cannot express a node that passed construction checks.
// node_index is empty for front matter (cover, header, footer).
class SerializationError : public FolioError {
public:
    SerializationError(std::optional<size_t> node_index, const std::string& node_kind,
                       const std::string& reason);

    const std::optional<size_t>& nodeIndex() const { return node_index_; }
    const std::string&           nodeKind() const { return node_kind_; }
    const std::string&           reason() const { return reason_; }

private:
    std::optional<size_t> node_index_;
    std::string           node_kind_;
    std::string           reason_;
};

}  // namespace folio

#endif // FOLIO_ERRORS_H
