#ifndef FOLIO_CHAPTERS_H
#define FOLIO_CHAPTERS_H

#include "folio/content_node.h"
#include "folio/style.h"

// Chapter builders of the SEZ Stack document. Each is pure: same style in,
// same nodes out.
namespace folio {
namespace chapters {

ChapterOutput build_executive_summary(const StyleConstants& style);
ChapterOutput build_mission_vision(const StyleConstants& style);
ChapterOutput build_architecture(const StyleConstants& style);
ChapterOutput build_deployment(const StyleConstants& style);
ChapterOutput build_appendix_test_coverage(const StyleConstants& style);
ChapterOutput build_appendix_security_proofs(const StyleConstants& style);

}  // namespace chapters
}  // namespace folio

#endif // FOLIO_CHAPTERS_H
