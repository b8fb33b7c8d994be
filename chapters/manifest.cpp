#include "manifest.h"
#include "chapters.h"

namespace folio {
namespace chapters {

const Manifest& manifest() {
    static const Manifest entries = {
        {"00-executive-summary", build_executive_summary},
        {"01-mission-vision",    build_mission_vision},
        {"02-architecture",      build_architecture},
        {"49-deployment",        build_deployment},
        {"B-test-coverage",      build_appendix_test_coverage},
        {"D-security-proofs",    build_appendix_security_proofs},
    };
    return entries;
}

}  // namespace chapters
}  // namespace folio
